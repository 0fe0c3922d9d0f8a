#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace archiver::runtime::config {
class RuntimeConfig;
}

namespace archiver::model {
struct TopicPartition;
}

namespace archiver::observability {

/*
  One key=value pair of a log line. Values holding spaces, quotes or '='
  are quoted when the line is rendered.
*/
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);

// Negative offsets are the tracker's "not known yet" markers and render as "unknown".
LogField OffsetField(std::string_view key, std::int64_t offset);

void InitializeLogging(const archiver::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

/*
  Partition-scoped line: "<message> topic=<t> partition=<p> <fields>".
  Every per-partition decision of the archiver logs through this form so
  lines can be grepped by partition.
*/
void Log(spdlog::level::level_enum level, const archiver::model::TopicPartition& tp, std::string_view message,
         std::initializer_list<LogField> fields = {});

} // namespace archiver::observability

// Usage: ARCHIVER_LOG_INFO("message", {fields}) or ARCHIVER_LOG_INFO(tp, "message", {fields}).
#define ARCHIVER_LOG_DEBUG(...) ::archiver::observability::Log(::spdlog::level::debug, __VA_ARGS__)
#define ARCHIVER_LOG_INFO(...) ::archiver::observability::Log(::spdlog::level::info, __VA_ARGS__)
#define ARCHIVER_LOG_WARN(...) ::archiver::observability::Log(::spdlog::level::warn, __VA_ARGS__)
#define ARCHIVER_LOG_ERROR(...) ::archiver::observability::Log(::spdlog::level::err, __VA_ARGS__)
