#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <algorithm>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define ARCHIVER_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define ARCHIVER_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "config/config.pb.h"
#include "internal/model/topic_partition.hpp"
#include "internal/observability/otlp_settings.hpp"

namespace archiver::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

bool g_topic_labels_enabled{true};

std::unique_ptr<sdkmetrics::PushMetricExporter> BuildExporter(const OtlpSettings& settings) {
  if (settings.http) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = settings.endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = settings.endpoint;
  options.use_ssl_credentials = settings.use_ssl;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

template <typename Provider>
void ConfigureResource(Provider& provider, const resource::Resource& res) {
  if constexpr (requires { provider.SetResource(res); }) {
    provider.SetResource(res);
  }
}

template <typename Provider>
void AddMetricReaderCompat(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

bool InstallProvider(const OtlpSettings& settings, sdkmetrics::PeriodicExportingMetricReaderOptions reader_options) {
#ifdef ARCHIVER_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(BuildExporter(settings), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(BuildExporter(settings), reader_options);
#endif

  resource::ResourceAttributes attrs    = {{"service.name", settings.service_name}};
  auto                         resource = resource::Resource::Create(attrs);
  g_provider    = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), resource);
  ConfigureResource(*g_provider, resource);
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> file_uploads;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> policy_actions;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      upload_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   buffered_bytes_gauge;

  // Last reported size per partition; the gauge sums them per topic at collection.
  std::mutex                                              buffered_bytes_mutex;
  std::map<archiver::model::TopicPartition, std::int64_t> buffered_bytes;
};

bool InitializeMetrics(const archiver::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto&                                      metric_config = observability.metrics();
  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  const auto                                       min_interval_ms = metric_config.min_collection_interval_ms();
  const auto configured_interval_ms     = metric_config.collection_interval_ms() > 0 ? metric_config.collection_interval_ms() : 1000;
  reader_options.export_interval_millis = std::chrono::milliseconds(std::max(min_interval_ms, configured_interval_ms));
  if (metric_config.export_timeout_ms() > 0) {
    reader_options.export_timeout_millis = std::chrono::milliseconds(metric_config.export_timeout_ms());
  }

  g_topic_labels_enabled = metric_config.topic_labels_enabled();
  return InstallProvider(ResolveOtlpSettings(config, "metrics"), reader_options);
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("stream-archiver", "0.1.0");

  impl_->file_uploads         = impl_->meter->CreateUInt64Counter("uploader.file_uploads.count", "1", "Buffered files uploaded to object storage");
  impl_->policy_actions       = impl_->meter->CreateUInt64Counter("uploader.policy.actions", "1", "Reconciliation outcomes per partition");
  impl_->upload_duration_ms   = impl_->meter->CreateDoubleHistogram("uploader.upload.duration_ms", "ms", "Partition upload duration in milliseconds");
  impl_->buffered_bytes_gauge = impl_->meter->CreateInt64ObservableGauge("uploader.buffered_bytes", "Locally buffered bytes per topic", "By");
  impl_->buffered_bytes_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto* impl       = static_cast<Impl*>(state);
        auto  int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);

        std::map<std::string, std::int64_t> per_topic;
        {
          std::lock_guard<std::mutex> lock(impl->buffered_bytes_mutex);
          for (const auto& [tp, bytes] : impl->buffered_bytes) {
            per_topic[g_topic_labels_enabled ? tp.topic : std::string()] += bytes;
          }
        }
        for (const auto& [topic, bytes] : per_topic) {
          if (g_topic_labels_enabled) {
            const std::initializer_list<AttributePair> attributes = {{"topic", topic}};
            int_result->Observe(bytes, attributes);
          } else {
            int_result->Observe(bytes);
          }
        }
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordUpload(const archiver::model::TopicPartition& tp, std::uint64_t files) {
  if (!impl_ || !impl_->file_uploads) {
    return;
  }

  if (g_topic_labels_enabled) {
    const std::initializer_list<AttributePair> attributes = {{"topic", tp.topic}};
    AddWithAttributes(impl_->file_uploads, files, attributes);
    return;
  }

  AddWithAttributes(impl_->file_uploads, files, std::initializer_list<AttributePair>{});
}

void Metrics::RecordPolicyAction(const archiver::model::TopicPartition& tp, std::string_view action) {
  if (!impl_ || !impl_->policy_actions) {
    return;
  }

  const std::string action_label(action);
  if (g_topic_labels_enabled) {
    const std::initializer_list<AttributePair> attributes = {{"action", action_label}, {"topic", tp.topic}};
    AddWithAttributes(impl_->policy_actions, static_cast<std::uint64_t>(1), attributes);
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"action", action_label}};
  AddWithAttributes(impl_->policy_actions, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveUploadDurationMs(std::string_view topic, double duration_ms) {
  if (!impl_ || !impl_->upload_duration_ms) {
    return;
  }

  if (g_topic_labels_enabled) {
    const std::string                          topic_label(topic);
    const std::initializer_list<AttributePair> attributes = {{"topic", topic_label}};
    RecordWithAttributes(impl_->upload_duration_ms, duration_ms, attributes);
    return;
  }

  RecordWithAttributes(impl_->upload_duration_ms, duration_ms, std::initializer_list<AttributePair>{});
}

void Metrics::SetBufferedBytes(const archiver::model::TopicPartition& tp, std::uint64_t bytes) {
  if (!impl_ || !impl_->buffered_bytes_gauge) {
    return;
  }

  std::lock_guard<std::mutex> lock(impl_->buffered_bytes_mutex);
  impl_->buffered_bytes[tp] = static_cast<std::int64_t>(bytes);
}

} // namespace archiver::observability

#endif
