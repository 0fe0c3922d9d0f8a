#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <tuple>

namespace archiver::model {

/*
  Key for all per-partition state: one physical partition of a topic.
*/
struct TopicPartition {
  std::string topic;
  int32_t     partition = 0;

  std::string ToString() const {
    return topic + "/" + std::to_string(partition);
  }

  friend bool operator==(const TopicPartition& a, const TopicPartition& b) {
    return a.partition == b.partition && a.topic == b.topic;
  }

  friend bool operator!=(const TopicPartition& a, const TopicPartition& b) {
    return !(a == b);
  }

  friend bool operator<(const TopicPartition& a, const TopicPartition& b) {
    return std::tie(a.topic, a.partition) < std::tie(b.topic, b.partition);
  }
};

struct TopicPartitionHash {
  std::size_t operator()(const TopicPartition& tp) const noexcept {
    const std::size_t h = std::hash<std::string>{}(tp.topic);
    return h ^ (std::hash<int32_t>{}(tp.partition) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
  }
};

} // namespace archiver::model
