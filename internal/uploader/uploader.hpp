#pragma once

#include <cstdint>
#include <string>

#include "internal/io/compression.hpp"
#include "internal/model/log_file_path.hpp"
#include "internal/uploader/reconcile.hpp"
#include "internal/uploader/upload_policy.hpp"

namespace archiver::uploader {

struct UploaderOptions {
  int64_t              max_file_size_bytes = 0;
  int64_t              max_file_age_sec    = 0;
  std::string          minute_mark_topic_filter;
  int                  minute_mark = 0;
  io::CompressionCodec codec;
  // Leave the partition for the next cycle instead of assuming a committed count of 0.
  bool skip_on_commit_read_failure = false;

  static UploaderOptions FromConfig(const archiver::runtime::config::RuntimeConfig& config);
};

/*
  Default upload policy.

  For every buffered partition that passes the gate, compares the group's
  committed offset against the tracker and either uploads the buffer,
  deletes it or trims the already committed prefix off it.

  An offset is committed only after every file holding records below it
  is stored remotely.
*/
class Uploader : public UploadPolicy {
 public:
  Uploader(UploaderOptions options, PolicyDependencies deps);

  // Reconciles every partition; failures are collected and raised as util::PolicyFailed at the end.
  void ApplyPolicy() override;

  ReconcileAction Reconcile(const model::TopicPartition& tp);

  void UploadAll(const model::TopicPartition& tp);

  void Trim(const model::LogFilePath& path, int64_t start_offset);
  void TrimAll(const model::TopicPartition& tp, int64_t start_offset);

 private:
  UploaderOptions    options_;
  PolicyDependencies deps_;
  UploadGate         gate_;
};

} // namespace archiver::uploader
