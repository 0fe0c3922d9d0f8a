#include "internal/tracker/offset_tracker.hpp"

#include "internal/observability/logging.hpp"

namespace archiver::tracker {

using archiver::observability::OffsetField;

int64_t OffsetTracker::GetLastSeenOffset(const model::TopicPartition& tp) const {
  std::lock_guard lock(mutex_);
  auto            it = entries_.find(tp);
  return it == entries_.end() ? kUnknownLastSeenOffset : it->second.last_seen_offset;
}

int64_t OffsetTracker::SetLastSeenOffset(const model::TopicPartition& tp, int64_t offset) {
  int64_t previous;
  {
    std::lock_guard lock(mutex_);
    auto&           entry = entries_[tp];
    previous              = entry.last_seen_offset;
    entry.last_seen_offset = offset;
    if (entry.first_seen_offset == kUnknownLastSeenOffset) {
      entry.first_seen_offset = offset;
    }
  }

  if (previous + 1 != offset) {
    if (previous >= 0) {
      ARCHIVER_LOG_WARN(tp, "last seen offset jumped", {OffsetField("from", previous), OffsetField("to", offset)});
    } else {
      ARCHIVER_LOG_INFO(tp, "starting to consume partition", {OffsetField("offset", offset)});
    }
  }
  return previous;
}

int64_t OffsetTracker::GetTrueCommittedOffsetCount(const model::TopicPartition& tp) const {
  std::lock_guard lock(mutex_);
  auto            it = entries_.find(tp);
  return it == entries_.end() ? kUnknownCommittedOffset : it->second.committed_count;
}

int64_t OffsetTracker::GetAdjustedCommittedOffsetCount(const model::TopicPartition& tp) const {
  std::lock_guard lock(mutex_);
  auto            it = entries_.find(tp);
  if (it == entries_.end()) return kUnknownCommittedOffset;
  if (it->second.committed_count == kUnknownCommittedOffset) return it->second.first_seen_offset;
  return it->second.committed_count;
}

int64_t OffsetTracker::SetCommittedOffsetCount(const model::TopicPartition& tp, int64_t count) {
  std::lock_guard lock(mutex_);
  auto&           entry    = entries_[tp];
  const int64_t   previous = entry.committed_count;
  entry.committed_count    = count;
  return previous;
}

void OffsetTracker::Reset(const model::TopicPartition& tp) {
  std::lock_guard lock(mutex_);
  entries_.erase(tp);
}

} // namespace archiver::tracker
