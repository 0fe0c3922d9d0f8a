#include "internal/uploader/reconcile.hpp"

#include "internal/util/errors.hpp"

namespace archiver::uploader {

std::string_view ToString(ReconcileAction action) {
  switch (action) {
    case ReconcileAction::kNone:
      return "none";
    case ReconcileAction::kSkip:
      return "skip";
    case ReconcileAction::kUpload:
      return "upload";
    case ReconcileAction::kDelete:
      return "delete";
    case ReconcileAction::kTrim:
      return "trim";
  }
  return "unknown";
}

ReconcileAction Decide(int64_t old_offset_count, int64_t new_offset_count, int64_t last_seen_offset) {
  if (new_offset_count == old_offset_count) return ReconcileAction::kUpload;
  if (new_offset_count > last_seen_offset) return ReconcileAction::kDelete;
  return ReconcileAction::kTrim;
}

UploadGate::UploadGate(int64_t max_file_size_bytes, int64_t max_file_age_sec, const std::string& minute_mark_topic_filter, int minute_mark)
    : max_file_size_bytes_(max_file_size_bytes),
      max_file_age_sec_(max_file_age_sec),
      has_minute_mark_filter_(!minute_mark_topic_filter.empty()),
      minute_mark_(minute_mark) {
  if (has_minute_mark_filter_) {
    try {
      minute_mark_topic_filter_ = std::regex(minute_mark_topic_filter, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
      throw util::InvalidArgument("invalid minute mark topic filter '" + minute_mark_topic_filter + "': " + e.what());
    }
  }
}

bool UploadGate::Open(const model::TopicPartition& tp, int64_t size_bytes, int64_t modification_age_sec, util::TimePoint now) const {
  return size_bytes >= max_file_size_bytes_ || modification_age_sec >= max_file_age_sec_ || RequiredAtTime(tp.topic, now);
}

bool UploadGate::RequiredAtTime(const std::string& topic, util::TimePoint now) const {
  if (!has_minute_mark_filter_) return false;
  if (!std::regex_match(topic, minute_mark_topic_filter_)) return false;
  return util::MinuteOfHour(now) == minute_mark_;
}

} // namespace archiver::uploader
