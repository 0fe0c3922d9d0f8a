#pragma once

#include <cstdlib>
#include <string>
#include <string_view>

#include "config/config.pb.h"

namespace archiver::observability {

/*
  Exporter settings shared by the trace and metric pipelines. The endpoint
  comes from observability.otlp_endpoint, then OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT,
  then OTEL_EXPORTER_OTLP_ENDPOINT, then the collector default for the transport.
*/
struct OtlpSettings {
  std::string service_name{"stream-archiver"};
  std::string endpoint;
  bool        http    = false;
  bool        use_ssl = false;
};

inline OtlpSettings ResolveOtlpSettings(const archiver::runtime::config::RuntimeConfig& config, std::string_view signal) {
  const auto& observability = config.observability();

  OtlpSettings settings;
  settings.http     = observability.transport() == archiver::runtime::config::OTLP_TRANSPORT_HTTP;
  settings.endpoint = observability.otlp_endpoint();

  if (settings.endpoint.empty()) {
    std::string signal_env = "OTEL_EXPORTER_OTLP_";
    for (char c : signal) signal_env.push_back(static_cast<char>(c >= 'a' && c <= 'z' ? c - 'a' + 'A' : c));
    signal_env += "_ENDPOINT";
    if (const char* endpoint = std::getenv(signal_env.c_str())) {
      settings.endpoint = endpoint;
    } else if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
      settings.endpoint = endpoint;
    } else if (settings.http) {
      settings.endpoint = "http://localhost:4318/v1/" + std::string(signal);
    } else {
      settings.endpoint = "localhost:4317";
    }
  }

  settings.use_ssl = settings.endpoint.rfind("https://", 0) == 0;
  return settings;
}

} // namespace archiver::observability
