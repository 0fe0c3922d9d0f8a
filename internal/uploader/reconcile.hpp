#pragma once

#include <cstdint>
#include <regex>
#include <string>
#include <string_view>

#include "internal/model/topic_partition.hpp"
#include "internal/util/time.hpp"

namespace archiver::uploader {

enum class ReconcileAction {
  kNone,    // gate closed
  kSkip,    // committed offset unreadable, partition left for the next cycle
  kUpload,  // commit position unchanged, local buffer is the unflushed tail
  kDelete,  // commit moved past everything buffered
  kTrim,    // commit moved into the buffered range
};

std::string_view ToString(ReconcileAction action);

/*
  Three-way decision on a freshly read committed offset count.

      new == old         -> kUpload
      new >  last_seen   -> kDelete
      otherwise          -> kTrim at new
*/
ReconcileAction Decide(int64_t old_offset_count, int64_t new_offset_count, int64_t last_seen_offset);

/*
  Decides whether a partition is due for reconciliation.
*/
class UploadGate {
 public:
  UploadGate(int64_t max_file_size_bytes, int64_t max_file_age_sec, const std::string& minute_mark_topic_filter, int minute_mark);

  bool Open(const model::TopicPartition& tp, int64_t size_bytes, int64_t modification_age_sec, util::TimePoint now) const;

  // Topic matches the minute-mark filter and now is the configured minute.
  bool RequiredAtTime(const std::string& topic, util::TimePoint now) const;

 private:
  int64_t    max_file_size_bytes_;
  int64_t    max_file_age_sec_;
  bool       has_minute_mark_filter_;
  std::regex minute_mark_topic_filter_;
  int        minute_mark_;
};

} // namespace archiver::uploader
