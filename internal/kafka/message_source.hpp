#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "internal/model/key_value.hpp"
#include "internal/model/topic_partition.hpp"

namespace archiver::kafka {

/*
  Source of ingested messages.

  Poll() is called from the ingestion thread only. The revoke callback runs
  on that same thread, from inside Poll().
*/
class MessageSource {
 public:
  using RevokeCallback = std::function<void(const std::vector<model::TopicPartition>&)>;

  virtual ~MessageSource() = default;

  // std::nullopt when nothing arrived within timeout.
  virtual std::optional<model::ParsedMessage> Poll(std::chrono::milliseconds timeout) = 0;

  virtual void OnRevoke(RevokeCallback callback) = 0;

  virtual void Close() = 0;
};

using MessageSourcePtr = std::shared_ptr<MessageSource>;

} // namespace archiver::kafka
