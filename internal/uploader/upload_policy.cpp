#include "internal/uploader/upload_policy.hpp"

#include "config/config.pb.h"
#include "internal/uploader/uploader.hpp"
#include "internal/util/errors.hpp"

namespace archiver::uploader {

std::unique_ptr<UploadPolicy> MakeUploadPolicy(const archiver::runtime::config::RuntimeConfig& config, PolicyDependencies deps) {
  const auto& name = config.uploader().policy();
  if (name.empty() || name == "default") {
    return std::make_unique<Uploader>(UploaderOptions::FromConfig(config), std::move(deps));
  }
  throw util::InvalidArgument("unknown upload policy: " + name);
}

} // namespace archiver::uploader
