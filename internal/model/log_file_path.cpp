#include "internal/model/log_file_path.hpp"

#include <cstdio>
#include <sstream>
#include <tuple>

#include "internal/util/errors.hpp"

namespace archiver::model {

namespace {

std::vector<std::string> Split(const std::string& value, char delimiter) {
  std::vector<std::string> parts;
  std::string              part;
  std::istringstream       in(value);
  while (std::getline(in, part, delimiter)) {
    parts.push_back(part);
  }
  return parts;
}

std::string TrimTrailingSlash(std::string path) {
  while (path.size() > 1 && path.back() == '/') path.pop_back();
  return path;
}

template <typename T>
T ParseNumber(const std::string& text, const std::string& path) {
  try {
    std::size_t consumed = 0;
    const auto  value    = std::stoll(text, &consumed);
    if (consumed != text.size()) throw std::invalid_argument(text);
    return static_cast<T>(value);
  } catch (const std::exception&) {
    throw util::InvalidArgument("log file path: malformed number '" + text + "' in " + path);
  }
}

} // namespace

LogFilePath::LogFilePath(std::string prefix, std::string topic, std::vector<std::string> partitions, uint32_t generation,
                         int32_t kafka_partition, int64_t offset, std::string extension)
    : prefix_(TrimTrailingSlash(std::move(prefix))),
      topic_(std::move(topic)),
      partitions_(std::move(partitions)),
      generation_(generation),
      kafka_partition_(kafka_partition),
      offset_(offset),
      extension_(std::move(extension)) {
  if (topic_.empty()) {
    throw util::InvalidArgument("log file path: topic must not be empty");
  }
}

LogFilePath::LogFilePath(std::string prefix, uint32_t generation, int64_t offset, const ParsedMessage& message, std::string extension)
    : LogFilePath(std::move(prefix), message.topic, message.partitions, generation, message.kafka_partition, offset, std::move(extension)) {
}

/*
  Reverse of LogFilePathString(). The first segment after the prefix is the
  topic, the last is the basename and everything in between are partition
  components.
*/
LogFilePath LogFilePath::Parse(const std::string& prefix, const std::string& path) {
  const auto clean_prefix = TrimTrailingSlash(prefix);
  if (path.rfind(clean_prefix + "/", 0) != 0) {
    throw util::InvalidArgument("log file path: " + path + " is not under prefix " + clean_prefix);
  }

  auto elements = Split(path.substr(clean_prefix.size() + 1), '/');
  if (elements.size() < 2) {
    throw util::InvalidArgument("log file path: missing topic or basename in " + path);
  }

  const std::string topic = elements.front();
  std::string       file  = elements.back();
  std::vector<std::string> partitions(elements.begin() + 1, elements.end() - 1);

  std::string extension;
  if (auto dot = file.find('.'); dot != std::string::npos) {
    extension = file.substr(dot);
    file      = file.substr(0, dot);
  }

  const auto basename = Split(file, '_');
  if (basename.size() != 3) {
    throw util::InvalidArgument("log file path: expected <generation>_<partition>_<offset> in " + path);
  }

  return LogFilePath(clean_prefix, topic, std::move(partitions), ParseNumber<uint32_t>(basename[0], path), ParseNumber<int32_t>(basename[1], path),
                     ParseNumber<int64_t>(basename[2], path), std::move(extension));
}

LogFilePath LogFilePath::WithOffset(int64_t offset, std::string extension) const {
  return LogFilePath(prefix_, topic_, partitions_, generation_, kafka_partition_, offset, std::move(extension));
}

std::string LogFilePath::LogFileDir() const {
  std::string dir = topic_;
  for (const auto& partition : partitions_) {
    dir += "/" + partition;
  }
  return dir;
}

std::string LogFilePath::LogFileBasename() const {
  char offset[32];
  std::snprintf(offset, sizeof(offset), "%020lld", static_cast<long long>(offset_));
  return std::to_string(generation_) + "_" + std::to_string(kafka_partition_) + "_" + offset;
}

std::string LogFilePath::LogFileParentDir() const {
  return prefix_ + "/" + LogFileDir();
}

std::string LogFilePath::LogFilePathString() const {
  return LogFileParentDir() + "/" + LogFileBasename() + extension_;
}

std::string LogFilePath::LogFileCrcPath() const {
  return LogFileParentDir() + "/." + LogFileBasename() + ".crc";
}

bool operator==(const LogFilePath& a, const LogFilePath& b) {
  return std::tie(a.prefix_, a.topic_, a.partitions_, a.generation_, a.kafka_partition_, a.offset_, a.extension_) ==
         std::tie(b.prefix_, b.topic_, b.partitions_, b.generation_, b.kafka_partition_, b.offset_, b.extension_);
}

bool operator<(const LogFilePath& a, const LogFilePath& b) {
  return std::tie(a.topic_, a.kafka_partition_, a.offset_, a.partitions_, a.generation_, a.extension_, a.prefix_) <
         std::tie(b.topic_, b.kafka_partition_, b.offset_, b.partitions_, b.generation_, b.extension_, b.prefix_);
}

} // namespace archiver::model
