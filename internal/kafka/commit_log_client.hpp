#pragma once

#include <cstdint>
#include <memory>

#include "internal/model/topic_partition.hpp"

namespace archiver::kafka {

/*
  Read and write access to the consumer group's committed position.

  Offsets are counts: the committed value is the next offset to consume.
*/
class CommitLogClient {
 public:
  virtual ~CommitLogClient() = default;

  // Throws util::CommitFailed when the broker cannot be read or holds no commit.
  virtual int64_t Committed(const model::TopicPartition& tp) = 0;

  // Synchronous; throws util::CommitFailed.
  virtual void CommitSync(const model::TopicPartition& tp, int64_t offset) = 0;
};

using CommitLogClientPtr = std::shared_ptr<CommitLogClient>;

} // namespace archiver::kafka
