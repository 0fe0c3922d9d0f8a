#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/model/key_value.hpp"
#include "internal/model/topic_partition.hpp"

namespace archiver::model {

/*
  Descriptor of one locally buffered file.

  Layout under the local prefix:

      <prefix>/<topic>/<partitions...>/<generation>_<kafka_partition>_<offset:020>[.ext]

  The first record in the file has offset == Offset(). Files of the same
  topic partition cover disjoint, increasing offset ranges, so ordering by
  descriptor orders by starting offset.
*/
class LogFilePath {
 public:
  LogFilePath(std::string prefix, std::string topic, std::vector<std::string> partitions, uint32_t generation, int32_t kafka_partition,
              int64_t offset, std::string extension);

  // Files an ingested message under the given prefix and starting offset.
  LogFilePath(std::string prefix, uint32_t generation, int64_t offset, const ParsedMessage& message, std::string extension);

  // Parses a full local path that lives under prefix.
  static LogFilePath Parse(const std::string& prefix, const std::string& path);

  // Same file identity, new starting offset and extension. Used by trim.
  LogFilePath WithOffset(int64_t offset, std::string extension) const;

  const std::string&              Prefix() const { return prefix_; }
  const std::string&              Topic() const { return topic_; }
  const std::vector<std::string>& Partitions() const { return partitions_; }
  uint32_t                        Generation() const { return generation_; }
  int32_t                         KafkaPartition() const { return kafka_partition_; }
  int64_t                         Offset() const { return offset_; }
  const std::string&              Extension() const { return extension_; }

  TopicPartition GetTopicPartition() const { return {topic_, kafka_partition_}; }

  // <topic>/<partitions...>
  std::string LogFileDir() const;
  // <generation>_<kafka_partition>_<offset:020>
  std::string LogFileBasename() const;
  // <prefix>/<topic>/<partitions...>
  std::string LogFileParentDir() const;
  std::string LogFilePathString() const;
  std::string LogFileCrcPath() const;

  friend bool operator==(const LogFilePath& a, const LogFilePath& b);
  friend bool operator<(const LogFilePath& a, const LogFilePath& b);

 private:
  std::string              prefix_;
  std::string              topic_;
  std::vector<std::string> partitions_;
  uint32_t                 generation_      = 0;
  int32_t                  kafka_partition_ = 0;
  int64_t                  offset_          = 0;
  std::string              extension_;
};

} // namespace archiver::model
