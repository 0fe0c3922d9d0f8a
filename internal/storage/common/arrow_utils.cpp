#include "arrow_utils.hpp"

#include <arrow/filesystem/localfs.h>
#include <arrow/filesystem/s3fs.h>

namespace archiver::storage::common {

using archiver::runtime::config::StorageConfig;

namespace {

arrow::Result<std::shared_ptr<arrow::fs::FileSystem>> MakeS3FileSystem(const StorageConfig& cfg, const std::string& uri, std::string* out_path) {
  ARROW_ASSIGN_OR_RAISE(auto options, arrow::fs::S3Options::FromUri(uri, out_path));

  const auto& proto_options = cfg.s3();
  if (!proto_options.region().empty()) options.region = proto_options.region();
  if (!proto_options.endpoint_override().empty()) options.endpoint_override = proto_options.endpoint_override();
  if (!proto_options.scheme().empty()) options.scheme = proto_options.scheme();
  if (proto_options.connect_timeout() > 0) options.connect_timeout = proto_options.connect_timeout();
  if (proto_options.request_timeout() > 0) options.request_timeout = proto_options.request_timeout();
  options.force_virtual_addressing = proto_options.force_virtual_addressing();

  ARROW_RETURN_NOT_OK(arrow::fs::EnsureS3Initialized());
  ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::S3FileSystem::Make(options));
  return std::static_pointer_cast<arrow::fs::FileSystem>(fs);
}

} // namespace

arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(const StorageConfig& cfg) {
  std::string resolved_path = cfg.root_path();
  if (resolved_path.empty()) {
    return arrow::Status::Invalid("storage.root_path must be set");
  }

  switch (cfg.filesystem()) {
    case archiver::runtime::config::FILE_SYSTEM_LOCAL:
      return std::make_pair(std::static_pointer_cast<arrow::fs::FileSystem>(std::make_shared<arrow::fs::LocalFileSystem>()), resolved_path);

    case archiver::runtime::config::FILE_SYSTEM_S3: {
      const std::string uri = resolved_path;
      ARROW_ASSIGN_OR_RAISE(auto fs, MakeS3FileSystem(cfg, uri, &resolved_path));
      return std::make_pair(std::move(fs), resolved_path);
    }

    case archiver::runtime::config::FILE_SYSTEM_GCS:
    case archiver::runtime::config::FILE_SYSTEM_HDFS:
    case archiver::runtime::config::FILE_SYSTEM_AZURE: {
      ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::FileSystemFromUri(resolved_path, &resolved_path));
      return std::make_pair(std::move(fs), resolved_path);
    }

    case archiver::runtime::config::FILE_SYSTEM_AUTO:
    default: {
      ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::FileSystemFromUriOrPath(resolved_path, &resolved_path));
      return std::make_pair(std::move(fs), resolved_path);
    }
  }
}

} // namespace archiver::storage::common
