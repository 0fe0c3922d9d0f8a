#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <chrono>
#include <cstdlib>
#include <regex>
#include <stdexcept>

#include "internal/io/compression.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace archiver::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // yaml-cpp tags quoted scalars "!"
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static archiver::runtime::config::RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  archiver::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

archiver::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

archiver::runtime::config::RuntimeConfig ConfigLoader::LoadFromString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

void ValidateConfig(const archiver::runtime::config::RuntimeConfig& config) {
  const auto& uploader = config.uploader();

  if (uploader.max_file_size_bytes() == 0) {
    throw util::InvalidArgument("uploader.max_file_size_bytes must be greater than zero");
  }
  // Ages are compared in whole seconds; anything shorter would leave the age gate always open.
  if (util::FromProto(uploader.max_file_age()) < std::chrono::seconds(1)) {
    throw util::InvalidArgument("uploader.max_file_age must be at least 1s");
  }
  if (uploader.upload_minute_mark() > 59) {
    throw util::InvalidArgument("uploader.upload_minute_mark must be within 0..59, got " + std::to_string(uploader.upload_minute_mark()));
  }
  if (!uploader.upload_minute_mark_topic_filter().empty()) {
    try {
      std::regex(uploader.upload_minute_mark_topic_filter(), std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
      throw util::InvalidArgument("uploader.upload_minute_mark_topic_filter is not a valid regex: " + std::string(e.what()));
    }
  }
  io::ResolveCodec(uploader.compression_codec());

  if (config.local().path().empty()) {
    throw util::InvalidArgument("local.path is required");
  }
  if (config.storage().root_path().empty()) {
    throw util::InvalidArgument("storage.root_path is required");
  }
}

} // namespace archiver::config
