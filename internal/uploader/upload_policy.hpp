#pragma once

#include <memory>
#include <string>

#include "internal/kafka/commit_log_client.hpp"
#include "internal/registry/file_registry.hpp"
#include "internal/tracker/offset_tracker.hpp"
#include "internal/upload/upload_manager.hpp"
#include "internal/util/time.hpp"

namespace archiver::runtime::config {
class RuntimeConfig;
}

namespace archiver::uploader {

/*
  One pass over every buffered partition, deciding what to flush.

  Called repeatedly at a fixed cadence. Implementations keep no state
  across calls beyond the shared tracker and registry.
*/
class UploadPolicy {
 public:
  virtual ~UploadPolicy() = default;

  virtual void ApplyPolicy() = 0;
};

struct PolicyDependencies {
  std::shared_ptr<tracker::OffsetTracker> tracker;
  std::shared_ptr<registry::FileRegistry> registry;
  upload::UploadManagerPtr                upload_manager;
  kafka::CommitLogClientPtr               commit_log;
  util::NowFn                             now = util::Now;
};

// Builds the policy named by uploader.policy; "" and "default" select Uploader.
std::unique_ptr<UploadPolicy> MakeUploadPolicy(const archiver::runtime::config::RuntimeConfig& config, PolicyDependencies deps);

} // namespace archiver::uploader
