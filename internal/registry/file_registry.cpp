#include "internal/registry/file_registry.hpp"

#include <algorithm>
#include <filesystem>
#include <limits>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace archiver::registry {

using archiver::observability::StringField;

FileRegistry::FileRegistry(io::FileReaderWriterFactoryPtr factory, util::NowFn now, bool file_age_youngest)
    : factory_(std::move(factory)), now_(std::move(now)), file_age_youngest_(file_age_youngest) {
  if (!factory_) {
    throw util::InvalidArgument("file registry requires a reader/writer factory");
  }
}

std::set<model::TopicPartition> FileRegistry::GetTopicPartitions() const {
  std::lock_guard                 lock(mutex_);
  std::set<model::TopicPartition> result;
  for (const auto& [tp, paths] : files_) {
    result.insert(tp);
  }
  return result;
}

std::set<model::LogFilePath> FileRegistry::GetPaths(const model::TopicPartition& tp) const {
  std::lock_guard lock(mutex_);
  auto            it = files_.find(tp);
  if (it == files_.end()) return {};
  return it->second;
}

std::shared_ptr<io::FileWriter> FileRegistry::GetOrCreateWriter(const model::LogFilePath& path, const io::CompressionCodec& codec) {
  std::lock_guard lock(mutex_);

  if (auto it = writers_.find(path); it != writers_.end()) {
    return it->second;
  }

  auto& partition_files = files_[path.GetTopicPartition()];
  const bool tracked    = partition_files.count(path) > 0;

  if (!tracked) {
    RemoveFromDisk(path);
  }
  std::filesystem::create_directories(path.LogFileParentDir());

  std::shared_ptr<io::FileWriter> writer = factory_->BuildFileWriter(path, codec, /*append=*/tracked);

  partition_files.insert(path);
  creation_times_.emplace(path, util::ToUnixSeconds(now_()));
  writers_.emplace(path, writer);

  ARCHIVER_LOG_DEBUG(tracked ? "reopened buffered file" : "created buffered file", {StringField("path", path.LogFilePathString())});
  return writer;
}

std::shared_ptr<io::FileWriter> FileRegistry::TakeWriterLocked(const model::LogFilePath& path) {
  auto it = writers_.find(path);
  if (it == writers_.end()) return nullptr;
  auto writer = std::move(it->second);
  writers_.erase(it);
  return writer;
}

void FileRegistry::RemoveFromDisk(const model::LogFilePath& path) {
  std::error_code ec;
  std::filesystem::remove(path.LogFilePathString(), ec);
  if (ec) {
    throw util::LocalFileError("failed to delete " + path.LogFilePathString() + ": " + ec.message());
  }
  std::filesystem::remove(path.LogFileCrcPath(), ec);
  if (ec) {
    throw util::LocalFileError("failed to delete " + path.LogFileCrcPath() + ": " + ec.message());
  }
}

void FileRegistry::DeletePath(const model::LogFilePath& path) {
  DeleteWriter(path);

  // The path stays tracked until it is gone from disk so a failed delete is retried.
  RemoveFromDisk(path);
  {
    std::lock_guard lock(mutex_);
    const auto      tp = path.GetTopicPartition();
    if (auto it = files_.find(tp); it != files_.end()) {
      it->second.erase(path);
      if (it->second.empty()) files_.erase(it);
    }
    creation_times_.erase(path);
  }
  ARCHIVER_LOG_DEBUG("deleted buffered file", {StringField("path", path.LogFilePathString())});
}

void FileRegistry::DeleteTopicPartition(const model::TopicPartition& tp) {
  for (const auto& path : GetPaths(tp)) {
    DeletePath(path);
  }
}

void FileRegistry::DeleteWriter(const model::LogFilePath& path) {
  std::shared_ptr<io::FileWriter> writer;
  {
    std::lock_guard lock(mutex_);
    writer = TakeWriterLocked(path);
  }
  if (writer) writer->Close();
}

void FileRegistry::DeleteWriters(const model::TopicPartition& tp) {
  for (const auto& path : GetPaths(tp)) {
    DeleteWriter(path);
  }
}

int64_t FileRegistry::GetSize(const model::TopicPartition& tp) const {
  std::lock_guard lock(mutex_);
  auto            it = files_.find(tp);
  if (it == files_.end()) return 0;

  int64_t size = 0;
  for (const auto& path : it->second) {
    if (auto writer = writers_.find(path); writer != writers_.end()) {
      size += writer->second->Length();
      continue;
    }
    std::error_code ec;
    const auto      on_disk = std::filesystem::file_size(path.LogFilePathString(), ec);
    if (!ec) size += static_cast<int64_t>(on_disk);
  }
  return size;
}

int64_t FileRegistry::GetModificationAgeSec(const model::TopicPartition& tp) const {
  const int64_t now = util::ToUnixSeconds(now_());

  std::lock_guard lock(mutex_);
  auto            it = files_.find(tp);
  if (it == files_.end()) return -1;

  int64_t result = file_age_youngest_ ? std::numeric_limits<int64_t>::max() : -1;
  for (const auto& path : it->second) {
    int64_t created = now;
    if (auto ct = creation_times_.find(path); ct != creation_times_.end()) {
      created = ct->second;
    } else {
      ARCHIVER_LOG_WARN(tp, "no creation time for buffered file", {StringField("path", path.LogFilePathString())});
    }
    const int64_t age = now - created;
    result            = file_age_youngest_ ? std::min(result, age) : std::max(result, age);
  }
  if (result == std::numeric_limits<int64_t>::max()) result = -1;
  return result;
}

} // namespace archiver::registry
