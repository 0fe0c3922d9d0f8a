#include "internal/uploader/uploader.hpp"

#include <chrono>
#include <exception>
#include <optional>
#include <vector>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace archiver::uploader {

using archiver::observability::IntField;
using archiver::observability::OffsetField;
using archiver::observability::StringField;

UploaderOptions UploaderOptions::FromConfig(const archiver::runtime::config::RuntimeConfig& config) {
  const auto& uploader = config.uploader();

  UploaderOptions options;
  options.max_file_size_bytes         = static_cast<int64_t>(uploader.max_file_size_bytes());
  options.max_file_age_sec            = std::chrono::duration_cast<std::chrono::seconds>(util::FromProto(uploader.max_file_age())).count();
  options.minute_mark_topic_filter    = uploader.upload_minute_mark_topic_filter();
  options.minute_mark                 = static_cast<int>(uploader.upload_minute_mark());
  options.codec                       = io::ResolveCodec(uploader.compression_codec());
  options.skip_on_commit_read_failure = uploader.commit_read_failure() == archiver::runtime::config::COMMIT_READ_FAILURE_SKIP_PARTITION;
  return options;
}

Uploader::Uploader(UploaderOptions options, PolicyDependencies deps)
    : options_(std::move(options)),
      deps_(std::move(deps)),
      gate_(options_.max_file_size_bytes, options_.max_file_age_sec, options_.minute_mark_topic_filter, options_.minute_mark) {
  if (!deps_.tracker || !deps_.registry || !deps_.upload_manager || !deps_.commit_log) {
    throw util::InvalidArgument("uploader requires tracker, registry, upload manager and commit log client");
  }
  if (!deps_.now) deps_.now = util::Now;
}

void Uploader::ApplyPolicy() {
  std::vector<std::string> failures;

  for (const auto& tp : deps_.registry->GetTopicPartitions()) {
    try {
      Reconcile(tp);
    } catch (const std::exception& e) {
      ARCHIVER_LOG_ERROR(tp, "reconciliation failed", {StringField("error", e.what())});
      failures.push_back(tp.ToString() + ": " + e.what());
    }
  }

  if (!failures.empty()) {
    std::string message = "upload policy failed for " + std::to_string(failures.size()) + " partition(s)";
    for (const auto& failure : failures) {
      message += "; " + failure;
    }
    throw util::PolicyFailed(message);
  }
}

ReconcileAction Uploader::Reconcile(const model::TopicPartition& tp) {
  auto&         metrics = observability::Metrics::Instance();
  const int64_t size    = deps_.registry->GetSize(tp);
  const int64_t age     = deps_.registry->GetModificationAgeSec(tp);
  ARCHIVER_LOG_DEBUG(tp, "checking partition", {IntField("size", size), IntField("modification_age_sec", age)});
  metrics.SetBufferedBytes(tp, static_cast<std::uint64_t>(size));

  if (!gate_.Open(tp, size, age, deps_.now())) {
    return ReconcileAction::kNone;
  }

  observability::ReconcileSpan span(tp);

  int64_t new_offset_count = 0;
  try {
    new_offset_count = deps_.commit_log->Committed(tp);
  } catch (const std::exception& e) {
    if (options_.skip_on_commit_read_failure) {
      ARCHIVER_LOG_WARN(tp, "committed offset unreadable, skipping partition", {StringField("error", e.what())});
      metrics.RecordPolicyAction(tp, ToString(ReconcileAction::kSkip));
      span.SetAction(ToString(ReconcileAction::kSkip));
      span.Fail(e.what());
      return ReconcileAction::kSkip;
    }
    ARCHIVER_LOG_WARN(tp, "committed offset unreadable, assuming 0", {StringField("error", e.what())});
    new_offset_count = 0;
  }

  const int64_t old_offset_count = deps_.tracker->SetCommittedOffsetCount(tp, new_offset_count);
  const int64_t last_seen_offset = deps_.tracker->GetLastSeenOffset(tp);
  const auto    action           = Decide(old_offset_count, new_offset_count, last_seen_offset);

  span.SetOffsets(old_offset_count, new_offset_count, last_seen_offset);
  span.SetAction(ToString(action));
  metrics.RecordPolicyAction(tp, ToString(action));

  try {
    switch (action) {
      case ReconcileAction::kUpload:
        ARCHIVER_LOG_DEBUG(tp, "committed offset unchanged, uploading", {OffsetField("committed", new_offset_count)});
        UploadAll(tp);
        break;
      case ReconcileAction::kDelete:
        // A rebalance let another consumer commit beyond everything buffered here.
        ARCHIVER_LOG_INFO(tp, "committed offset beyond last seen, deleting local files",
                          {OffsetField("last_seen", last_seen_offset), OffsetField("committed", new_offset_count)});
        deps_.registry->DeleteTopicPartition(tp);
        break;
      case ReconcileAction::kTrim:
        ARCHIVER_LOG_INFO(tp, "committed offset inside buffered range, trimming local files",
                          {OffsetField("previous_committed", old_offset_count), OffsetField("committed", new_offset_count),
                           OffsetField("last_seen", last_seen_offset)});
        TrimAll(tp, new_offset_count);
        break;
      case ReconcileAction::kNone:
      case ReconcileAction::kSkip:
        break;
    }
  } catch (const std::exception& e) {
    span.Fail(e.what());
    throw;
  }
  return action;
}

void Uploader::UploadAll(const model::TopicPartition& tp) {
  const int64_t last_seen_offset = deps_.tracker->GetLastSeenOffset(tp);
  ARCHIVER_LOG_INFO(tp, "uploading partition", {OffsetField("last_seen", last_seen_offset)});

  // Closing the writers flushes every buffered record to local media.
  deps_.registry->DeleteWriters(tp);
  const auto paths = deps_.registry->GetPaths(tp);

  std::vector<upload::UploadHandle> handles;
  handles.reserve(paths.size());
  std::exception_ptr first_failure;
  for (const auto& path : paths) {
    try {
      handles.push_back(deps_.upload_manager->Upload(path));
    } catch (const std::exception& e) {
      ARCHIVER_LOG_WARN(tp, "could not schedule upload", {StringField("path", path.LogFilePathString()), StringField("error", e.what())});
      first_failure = std::current_exception();
      break;
    }
  }

  // Every scheduled transfer resolves before the partition is touched again.
  for (const auto& handle : handles) {
    try {
      handle.Get();
    } catch (const std::exception& e) {
      ARCHIVER_LOG_WARN(tp, "upload failed", {StringField("path", handle.LocalPath()), StringField("error", e.what())});
      if (!first_failure) first_failure = std::current_exception();
    }
  }
  if (first_failure) std::rethrow_exception(first_failure);

  deps_.registry->DeleteTopicPartition(tp);

  const int64_t next_offset = last_seen_offset + 1;
  deps_.commit_log->CommitSync(tp, next_offset);
  deps_.tracker->SetCommittedOffsetCount(tp, next_offset);

  observability::Metrics::Instance().RecordUpload(tp, paths.size());
  ARCHIVER_LOG_INFO(tp, "uploaded partition", {IntField("files", static_cast<int64_t>(paths.size())), OffsetField("committed", next_offset)});
}

void Uploader::Trim(const model::LogFilePath& path, int64_t start_offset) {
  if (start_offset == path.Offset()) return;

  deps_.registry->DeleteWriter(path);

  std::optional<model::LogFilePath> dst_path;
  int64_t                           copied = 0;
  {
    auto reader = deps_.registry->Factory().BuildFileReader(path, options_.codec);
    std::shared_ptr<io::FileWriter> writer;
    while (auto record = reader->Next()) {
      if (record->offset < start_offset) continue;
      if (!writer) {
        dst_path = path.WithOffset(start_offset, options_.codec.extension);
        writer   = deps_.registry->GetOrCreateWriter(*dst_path, options_.codec);
      }
      writer->Write(*record);
      ++copied;
    }
    reader->Close();
  }

  deps_.registry->DeletePath(path);

  if (!dst_path) {
    ARCHIVER_LOG_INFO(path.GetTopicPartition(), "removed file", {StringField("path", path.LogFilePathString())});
  } else {
    ARCHIVER_LOG_INFO(path.GetTopicPartition(), "trimmed file", {IntField("messages", copied), StringField("from", path.LogFilePathString()),
                                                               StringField("to", dst_path->LogFilePathString()), OffsetField("start_offset", start_offset)});
  }
}

void Uploader::TrimAll(const model::TopicPartition& tp, int64_t start_offset) {
  for (const auto& path : deps_.registry->GetPaths(tp)) {
    Trim(path, start_offset);
  }
}

} // namespace archiver::uploader
