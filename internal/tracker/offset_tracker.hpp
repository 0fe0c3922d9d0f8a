#pragma once

#include <cstdint>
#include <mutex>
#include <unordered_map>

#include "internal/model/topic_partition.hpp"

namespace archiver::tracker {

/*
  Process-wide per-partition offset state.

    last seen offset        highest offset durably buffered locally;
                            advanced by ingestion only
    committed offset count  this process's view of the group's commit
                            position ("next offset to read")

  Each call is atomic on its own; no lock is held between calls, so callers
  must treat every read as a snapshot.
*/
class OffsetTracker {
 public:
  static constexpr int64_t kUnknownLastSeenOffset  = -2;
  static constexpr int64_t kUnknownCommittedOffset = -1;

  int64_t GetLastSeenOffset(const model::TopicPartition& tp) const;

  // Returns the previous last seen offset.
  int64_t SetLastSeenOffset(const model::TopicPartition& tp, int64_t offset);

  int64_t GetTrueCommittedOffsetCount(const model::TopicPartition& tp) const;

  // Committed count, falling back to the first offset seen when unknown.
  int64_t GetAdjustedCommittedOffsetCount(const model::TopicPartition& tp) const;

  // Returns the previous committed count.
  int64_t SetCommittedOffsetCount(const model::TopicPartition& tp, int64_t count);

  void Reset(const model::TopicPartition& tp);

 private:
  struct Entry {
    int64_t last_seen_offset  = kUnknownLastSeenOffset;
    int64_t first_seen_offset = kUnknownLastSeenOffset;
    int64_t committed_count   = kUnknownCommittedOffset;
  };

  mutable std::mutex                                                    mutex_;
  std::unordered_map<model::TopicPartition, Entry, model::TopicPartitionHash> entries_;
};

} // namespace archiver::tracker
