#pragma once

#include <string>

#include "config/config.pb.h"

namespace archiver::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Quoted scalars always stay strings.
*/
class ConfigLoader {
 public:
  static archiver::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static archiver::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);
};

/*
  Rejects settings the uploader cannot run with. Throws util::InvalidArgument
  naming the offending key.
*/
void ValidateConfig(const archiver::runtime::config::RuntimeConfig& config);

} // namespace archiver::config
