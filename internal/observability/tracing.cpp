#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/simple_processor_factory.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <string>
#include <utility>

#include "internal/model/topic_partition.hpp"
#include "internal/observability/otlp_settings.hpp"

namespace archiver::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

namespace {
constexpr const char* kInstrumentationName    = "stream-archiver";
constexpr const char* kInstrumentationVersion = "0.1.0";

std::shared_ptr<sdktrace::TracerProvider>           g_sdk_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

std::unique_ptr<sdktrace::SpanExporter> BuildExporter(const OtlpSettings& settings) {
  if (settings.http) {
    otlp::OtlpHttpExporterOptions options;
    options.url = settings.endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }
  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = settings.endpoint;
  options.use_ssl_credentials = settings.use_ssl;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

opentelemetry::nostd::shared_ptr<trace_api::Tracer> Tracer() {
  if (!g_tracer) {
    // Fall back to whatever provider is installed globally, the no-op one included.
    auto provider = trace_api::Provider::GetTracerProvider();
    if (provider) g_tracer = provider->GetTracer(kInstrumentationName, kInstrumentationVersion);
  }
  return g_tracer;
}

} // namespace

bool InitializeTracing(const archiver::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.tracing_enabled()) {
    ShutdownTracing();
    return false;
  }

  const auto settings = ResolveOtlpSettings(config, "traces");

  std::unique_ptr<sdktrace::SpanProcessor> processor;
  if (observability.tracing().processor() == archiver::runtime::config::ObservabilityConfig_TracingConfig_TraceProcessorType_TRACE_PROCESSOR_SIMPLE) {
    processor = sdktrace::SimpleSpanProcessorFactory::Create(BuildExporter(settings));
  } else {
    processor = sdktrace::BatchSpanProcessorFactory::Create(BuildExporter(settings), sdktrace::BatchSpanProcessorOptions{});
  }

  resource::ResourceAttributes attrs = {{"service.name", settings.service_name}};
  g_sdk_provider = std::shared_ptr<sdktrace::TracerProvider>(sdktrace::TracerProviderFactory::Create(std::move(processor), resource::Resource::Create(attrs)));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_sdk_provider));
  g_tracer = g_sdk_provider->GetTracer(kInstrumentationName, kInstrumentationVersion);
  return static_cast<bool>(g_tracer);
}

void ShutdownTracing() {
  if (g_sdk_provider) {
    g_sdk_provider->ForceFlush();
    g_sdk_provider->Shutdown();
  }
  g_sdk_provider.reset();
  g_tracer = nullptr;
}

struct ReconcileSpan::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;
};

ReconcileSpan::ReconcileSpan(const archiver::model::TopicPartition& tp) : impl_(std::make_unique<Impl>()) {
  auto tracer = Tracer();
  if (!tracer) return;

  impl_->span = tracer->StartSpan("uploader.reconcile", {{"messaging.destination.name", opentelemetry::nostd::string_view(tp.topic)},
                                                          {"messaging.destination.partition.id", static_cast<std::int64_t>(tp.partition)}});
  impl_->scope = std::make_unique<trace_api::Scope>(tracer->WithActiveSpan(impl_->span));
}

ReconcileSpan::~ReconcileSpan() {
  if (impl_->span) impl_->span->End();
}

void ReconcileSpan::SetOffsets(std::int64_t previous_committed, std::int64_t committed, std::int64_t last_seen) {
  if (!impl_->span) return;
  impl_->span->SetAttribute("archiver.offset.previous_committed", previous_committed);
  impl_->span->SetAttribute("archiver.offset.committed", committed);
  impl_->span->SetAttribute("archiver.offset.last_seen", last_seen);
}

void ReconcileSpan::SetAction(std::string_view action) {
  if (!impl_->span) return;
  impl_->span->SetAttribute("archiver.action", std::string(action));
}

void ReconcileSpan::Fail(std::string_view description) {
  if (!impl_->span) return;
  impl_->span->AddEvent("exception", {{"exception.message", std::string(description)}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(description));
}

} // namespace archiver::observability

#endif
