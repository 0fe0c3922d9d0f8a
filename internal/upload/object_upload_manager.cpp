#include "internal/upload/object_upload_manager.hpp"

#include <arrow/io/file.h>
#include <arrow/io/interfaces.h>
#include <arrow/result.h>

#include <chrono>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace archiver::upload {

using archiver::observability::IntField;
using archiver::observability::StringField;
using archiver::storage::common::Unwrap;

namespace {

constexpr int64_t kChunkBytes = 4 << 20;

} // namespace

ObjectUploadManager::ObjectUploadManager(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path, std::size_t threads)
    : fs_(std::move(fs)), root_path_(std::move(root_path)), executor_(threads) {
  if (!fs_) throw util::InvalidArgument("object upload manager requires a filesystem");
  while (root_path_.size() > 1 && root_path_.back() == '/') root_path_.pop_back();
}

std::string ObjectUploadManager::ObjectPath(const model::LogFilePath& path) const {
  std::string key = path.LogFileDir() + "/" + path.LogFileBasename() + path.Extension();
  if (root_path_.empty()) return key;
  if (root_path_.back() == '/') return root_path_ + key;
  return root_path_ + "/" + key;
}

UploadHandle ObjectUploadManager::Upload(const model::LogFilePath& path) {
  ARCHIVER_LOG_INFO("scheduling upload", {StringField("path", path.LogFilePathString()), StringField("object", ObjectPath(path))});
  auto done = executor_.Submit([this, path] { Transfer(path); });
  return UploadHandle(path.LogFilePathString(), std::move(done));
}

void ObjectUploadManager::Transfer(const model::LogFilePath& path) const {
  const auto local  = path.LogFilePathString();
  const auto object = ObjectPath(path);
  const auto start  = std::chrono::steady_clock::now();

  int64_t bytes = 0;
  try {
    auto input = Unwrap(arrow::io::ReadableFile::Open(local));

    const auto parent = object.substr(0, object.find_last_of('/'));
    if (parent != object) Unwrap(fs_->CreateDir(parent, /*recursive=*/true));

    auto out = Unwrap(fs_->OpenOutputStream(object));
    while (true) {
      auto chunk = Unwrap(input->Read(kChunkBytes));
      if (chunk->size() == 0) break;
      Unwrap(out->Write(chunk));
      bytes += chunk->size();
    }
    Unwrap(out->Close());
    Unwrap(input->Close());
  } catch (const std::exception& e) {
    ARCHIVER_LOG_ERROR("upload failed", {StringField("path", local), StringField("object", object), StringField("error", e.what())});
    throw util::UploadFailed("upload of " + local + " to " + object + " failed: " + e.what());
  }

  const auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
  observability::Metrics::Instance().ObserveUploadDurationMs(path.Topic(), static_cast<double>(elapsed_ms));
  ARCHIVER_LOG_INFO("uploaded file", {StringField("path", local), StringField("object", object), IntField("bytes", bytes),
                                      IntField("duration_ms", static_cast<int64_t>(elapsed_ms))});
}

} // namespace archiver::upload
