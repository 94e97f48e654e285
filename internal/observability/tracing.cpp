#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <unistd.h>

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/samplers/parent_factory.h>
#include <opentelemetry/sdk/trace/samplers/trace_id_ratio_factory.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <algorithm>
#include <cstdlib>
#include <utility>

#include "config/config.pb.h"

namespace logship::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

namespace {

constexpr char kServiceName[]    = "logship";
constexpr char kServiceVersion[] = "0.1.0";

std::shared_ptr<sdktrace::TracerProvider>           g_sdk_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

// Config first, then the per-signal and generic OTEL_* variables.
std::string TracesEndpoint(const OtlpConfig& config) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }
  for (const char* name : {"OTEL_EXPORTER_OTLP_TRACES_ENDPOINT", "OTEL_EXPORTER_OTLP_ENDPOINT"}) {
    if (const char* value = std::getenv(name); value && *value) {
      return value;
    }
  }
  return config.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/traces" : "localhost:4317";
}

std::unique_ptr<sdktrace::SpanExporter> MakeExporter(const OtlpConfig& config) {
  const auto endpoint = TracesEndpoint(config);
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }
  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = !config.insecure;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

// Root spans are sampled by ratio; children follow their parent.
std::unique_ptr<sdktrace::Sampler> MakeSampler(double ratio) {
  std::shared_ptr<sdktrace::Sampler> root = sdktrace::TraceIdRatioBasedSamplerFactory::Create(std::clamp(ratio, 0.0, 1.0));
  return sdktrace::ParentBasedSamplerFactory::Create(root);
}

std::string HostName() {
  char name[256] = {};
  if (::gethostname(name, sizeof(name) - 1) != 0) {
    return "unknown";
  }
  return name;
}

} // namespace

OtlpConfig ToOtlpConfig(const logship::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();

  OtlpConfig otlp_config;
  otlp_config.endpoint   = observability.otlp_endpoint();
  otlp_config.vehicle_id = config.vehicle_id();
  otlp_config.transport =
      observability.transport() == logship::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;
  if (observability.export_interval_ms() > 0) {
    otlp_config.export_interval_ms = observability.export_interval_ms();
  }
  if (observability.has_trace_sample_ratio()) {
    otlp_config.trace_sample_ratio = observability.trace_sample_ratio();
  }
  return otlp_config;
}

std::vector<std::pair<std::string, std::string>> ResourceLabels(const OtlpConfig& config) {
  return {
      {"service.name", kServiceName},
      {"service.version", kServiceVersion},
      {"host.name", HostName()},
      {"vehicle.id", config.vehicle_id},
  };
}

bool InitializeTracing(const logship::runtime::config::RuntimeConfig& config) {
  if (!config.observability().tracing_enabled()) {
    ShutdownTracing();
    return false;
  }

  const auto otlp_config = ToOtlpConfig(config);

  resource::ResourceAttributes attrs;
  for (const auto& [key, value] : ResourceLabels(otlp_config)) {
    attrs.SetAttribute(key, opentelemetry::nostd::string_view(value));
  }

  auto processor = sdktrace::BatchSpanProcessorFactory::Create(MakeExporter(otlp_config), sdktrace::BatchSpanProcessorOptions{});
  auto provider  = sdktrace::TracerProviderFactory::Create(std::move(processor), resource::Resource::Create(attrs),
                                                           MakeSampler(otlp_config.trace_sample_ratio));

  g_sdk_provider = std::shared_ptr<sdktrace::TracerProvider>(std::move(provider));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_sdk_provider));
  g_tracer = g_sdk_provider->GetTracer(kServiceName, kServiceVersion);
  return static_cast<bool>(g_tracer);
}

void ShutdownTracing() {
  g_tracer = nullptr;
  if (g_sdk_provider) {
    g_sdk_provider->ForceFlush();
    g_sdk_provider->Shutdown();
    g_sdk_provider.reset();
  }
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;

  bool live() const {
    return span && span->IsRecording();
  }
};

SpanScope::SpanScope(std::string_view name) : impl_(std::make_unique<Impl>()) {
  if (!g_tracer) {
    return;
  }
  impl_->span  = g_tracer->StartSpan(std::string(name));
  impl_->scope = std::make_unique<trace_api::Scope>(g_tracer->WithActiveSpan(impl_->span));
}

SpanScope::~SpanScope() {
  if (impl_ && impl_->span) {
    impl_->span->End();
  }
}

SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

void SpanScope::SetFile(const model::FileIdentity& identity) {
  if (!impl_ || !impl_->live()) {
    return;
  }
  impl_->span->SetAttribute("logship.path", identity.path);
  impl_->span->SetAttribute("logship.size_bytes", static_cast<std::int64_t>(identity.size_bytes));
  impl_->span->SetAttribute("logship.mtime_ns", static_cast<std::int64_t>(identity.mtime_ns));
}

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_ && impl_->live()) {
    impl_->span->SetAttribute(std::string(key), std::string(value));
  }
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (impl_ && impl_->live()) {
    impl_->span->SetAttribute(std::string(key), value);
  }
}

void SpanScope::SetFailed(model::ErrorKind kind, std::string_view message) {
  if (!impl_ || !impl_->live()) {
    return;
  }
  impl_->span->SetAttribute("logship.error_kind", std::string(model::ToString(kind)));
  RecordException(message);
}

void SpanScope::RecordException(std::string_view description) {
  if (impl_ && impl_->live()) {
    impl_->span->AddEvent("exception", {{"exception.message", std::string(description)}});
    impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(description));
  }
}

} // namespace logship::observability

#endif
