#pragma once

#include <arrow/filesystem/filesystem.h>

#include <memory>
#include <string>

#include "internal/upload/upload_executor.hpp"
#include "internal/upload/upload_manager.hpp"

namespace archiver::upload {

/*
  Uploads buffered files to an Arrow filesystem (S3, GCS, Azure, HDFS or a
  local directory).

  Object key layout:

      <root_path>/<topic>/<partitions...>/<basename><ext>

  Object stores are atomic per PUT, so a failed transfer leaves no partial
  object behind and re-uploading the same file overwrites the same key.
*/
class ObjectUploadManager final : public UploadManager {
 public:
  ObjectUploadManager(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path, std::size_t threads);

  UploadHandle Upload(const model::LogFilePath& path) override;

  std::string ObjectPath(const model::LogFilePath& path) const;

 private:
  void Transfer(const model::LogFilePath& path) const;

  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string                            root_path_;
  UploadExecutor                         executor_;
};

} // namespace archiver::upload
