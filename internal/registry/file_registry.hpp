#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <unordered_map>

#include "internal/io/file_reader_writer.hpp"
#include "internal/model/log_file_path.hpp"
#include "internal/model/topic_partition.hpp"
#include "internal/util/time.hpp"

namespace archiver::registry {

/*
  Registry of locally buffered files.

  Tracks, per topic partition, the set of buffered files, their open writers
  and creation times. Every method is atomic on its own. Writers are driven
  from the ingestion thread, which is also the thread the upload policy runs
  on, so a writer is never written and closed concurrently.
*/
class FileRegistry {
 public:
  explicit FileRegistry(io::FileReaderWriterFactoryPtr factory, util::NowFn now = util::Now, bool file_age_youngest = false);

  std::set<model::TopicPartition> GetTopicPartitions() const;

  // Ordered by starting offset.
  std::set<model::LogFilePath> GetPaths(const model::TopicPartition& tp) const;

  /*
    Returns the open writer for path, opening one if needed.

    A path the registry already tracks is reopened in append mode. An
    untracked path is a leftover from an earlier process and is replaced.
  */
  std::shared_ptr<io::FileWriter> GetOrCreateWriter(const model::LogFilePath& path, const io::CompressionCodec& codec);

  // Closes the writer if open, removes the file and its .crc sibling and forgets the path.
  void DeletePath(const model::LogFilePath& path);
  void DeleteTopicPartition(const model::TopicPartition& tp);

  // Flushes and closes the writer; the file stays registered.
  void DeleteWriter(const model::LogFilePath& path);
  void DeleteWriters(const model::TopicPartition& tp);

  // Bytes buffered: open writer length, or on-disk size for closed files.
  int64_t GetSize(const model::TopicPartition& tp) const;

  // Age of the oldest file (youngest if configured); -1 without files.
  int64_t GetModificationAgeSec(const model::TopicPartition& tp) const;

  io::FileReaderWriterFactory& Factory() const {
    return *factory_;
  }

 private:
  struct PathHash {
    std::size_t operator()(const model::LogFilePath& path) const noexcept {
      return std::hash<std::string>{}(path.LogFilePathString());
    }
  };

  std::shared_ptr<io::FileWriter> TakeWriterLocked(const model::LogFilePath& path);
  static void                     RemoveFromDisk(const model::LogFilePath& path);

  io::FileReaderWriterFactoryPtr factory_;
  util::NowFn                    now_;
  bool                           file_age_youngest_;

  mutable std::mutex                                                                mutex_;
  std::map<model::TopicPartition, std::set<model::LogFilePath>>                     files_;
  std::unordered_map<model::LogFilePath, std::shared_ptr<io::FileWriter>, PathHash> writers_;
  std::unordered_map<model::LogFilePath, int64_t, PathHash>                         creation_times_;
};

} // namespace archiver::registry
