#pragma once

#include <memory>

#include "internal/model/log_file_path.hpp"
#include "internal/upload/upload_handle.hpp"

namespace archiver::upload {

/*
  Transport of closed local files to remote storage.

  Upload() schedules the transfer and returns at once. The local file must
  stay in place until the handle completes.
*/
class UploadManager {
 public:
  virtual ~UploadManager() = default;

  virtual UploadHandle Upload(const model::LogFilePath& path) = 0;
};

using UploadManagerPtr = std::shared_ptr<UploadManager>;

} // namespace archiver::upload
