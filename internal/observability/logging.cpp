#include "internal/observability/logging.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdlib>
#include <iterator>
#include <optional>
#include <string>

#include "config/config.pb.h"
#include "internal/model/topic_partition.hpp"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/span.h>
#include <opentelemetry/trace/span_context.h>
#endif

namespace archiver::observability {
namespace {

constexpr const char* kLoggerName     = "stream-archiver";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

std::atomic<bool> g_include_trace_context{false};

struct LogSettings {
  spdlog::level::level_enum level = spdlog::level::info;
  std::string               pattern{kDefaultPattern};
  bool                      include_trace_context = false;
};

// ARCHIVER_LOG_* environment variables win over the config file.
std::optional<std::string> EnvOverride(const char* name) {
  const char* value = std::getenv(name);
  if (value == nullptr || *value == '\0') return std::nullopt;
  return std::string(value);
}

LogSettings ResolveSettings(const archiver::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  LogSettings settings;
  if (auto level = EnvOverride("ARCHIVER_LOG_LEVEL")) {
    settings.level = spdlog::level::from_str(*level);
  } else if (!logging.level().empty()) {
    settings.level = spdlog::level::from_str(logging.level());
  }

  if (auto pattern = EnvOverride("ARCHIVER_LOG_PATTERN")) {
    settings.pattern = *pattern;
  } else if (!logging.pattern().empty()) {
    settings.pattern = logging.pattern();
  }

  if (auto trace = EnvOverride("ARCHIVER_LOG_INCLUDE_TRACE_CONTEXT")) {
    settings.include_trace_context = *trace == "1" || *trace == "true";
  } else {
    settings.include_trace_context = logging.include_trace_context();
  }
  return settings;
}

bool NeedsQuoting(std::string_view value) {
  if (value.empty()) return true;
  return value.find_first_of(" \t\n\"=") != std::string_view::npos;
}

void AppendField(fmt::memory_buffer& line, std::string_view key, std::string_view value) {
  if (!NeedsQuoting(value)) {
    fmt::format_to(std::back_inserter(line), " {}={}", key, value);
    return;
  }
  fmt::format_to(std::back_inserter(line), " {}=\"", key);
  for (char c : value) {
    if (c == '"' || c == '\\') line.push_back('\\');
    if (c == '\n') {
      fmt::format_to(std::back_inserter(line), "\\n");
      continue;
    }
    line.push_back(c);
  }
  line.push_back('"');
}

void AppendTraceContext(fmt::memory_buffer& line) {
#ifdef ENABLE_OTEL
  if (!g_include_trace_context.load(std::memory_order_relaxed)) return;

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return;
  const auto context = span->GetContext();
  if (!context.IsValid()) return;

  char trace_id[32];
  char span_id[16];
  context.trace_id().ToLowerBase16(trace_id);
  context.span_id().ToLowerBase16(span_id);
  AppendField(line, "trace_id", std::string_view(trace_id, sizeof(trace_id)));
  AppendField(line, "span_id", std::string_view(span_id, sizeof(span_id)));
#else
  (void)line;
#endif
}

void Emit(spdlog::level::level_enum level, const archiver::model::TopicPartition* tp, std::string_view message,
          std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) return;

  fmt::memory_buffer line;
  fmt::format_to(std::back_inserter(line), "{}", message);
  if (tp != nullptr) {
    AppendField(line, "topic", tp->topic);
    fmt::format_to(std::back_inserter(line), " partition={}", tp->partition);
  }
  for (const auto& field : fields) {
    AppendField(line, field.key, field.value);
  }
  AppendTraceContext(line);

  spdlog::log(level, "{}", std::string_view(line.data(), line.size()));
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField OffsetField(std::string_view key, std::int64_t offset) {
  return {std::string(key), offset < 0 ? std::string("unknown") : std::to_string(offset)};
}

void InitializeLogging(const archiver::runtime::config::RuntimeConfig& config) {
  const auto settings = ResolveSettings(config);

  // Re-initialisation replaces the logger instead of failing on a duplicate name.
  spdlog::drop(kLoggerName);
  auto logger = spdlog::stdout_color_mt(kLoggerName);
  logger->set_pattern(settings.pattern);
  logger->set_level(settings.level);
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
  g_include_trace_context.store(settings.include_trace_context, std::memory_order_relaxed);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  Emit(level, nullptr, message, fields);
}

void Log(spdlog::level::level_enum level, const archiver::model::TopicPartition& tp, std::string_view message,
         std::initializer_list<LogField> fields) {
  Emit(level, &tp, message, fields);
}

} // namespace archiver::observability
