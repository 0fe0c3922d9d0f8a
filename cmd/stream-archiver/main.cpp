#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: stream-archiver <config.yaml> OR stream-archiver --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = archiver::config::ConfigLoader::LoadFromYaml(config_path);
    archiver::config::ValidateConfig(config);

    archiver::observability::InitializeTracing(config);
    archiver::observability::InitializeMetrics(config);
    archiver::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = archiver::factory::Build(config);

    // Register signal handlers before starting the consumer to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.consumer->Start();
    ARCHIVER_LOG_INFO("stream archiver started", {archiver::observability::StringField("group_id", config.kafka().group_id())});

    while (g_running && app.consumer->Running()) std::this_thread::sleep_for(std::chrono::seconds(1));

    ARCHIVER_LOG_INFO("Shutting down stream archiver");

    app.consumer->Stop();
    app.source->Close();
    const bool failed = app.consumer->Failed();

    archiver::observability::ShutdownLogging();
    archiver::observability::ShutdownMetrics();
    archiver::observability::ShutdownTracing();
    if (failed) return 2;
  } catch (const std::exception& e) {
    ARCHIVER_LOG_ERROR("Fatal error", {archiver::observability::StringField("error", e.what())});
    archiver::observability::ShutdownLogging();
    archiver::observability::ShutdownMetrics();
    archiver::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
