#include "internal/observability/metrics.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <chrono>
#include <cstdlib>
#include <map>
#include <memory>
#include <mutex>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define LOGSHIP_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define LOGSHIP_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "config/config.pb.h"

namespace logship::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributeMap = std::map<std::string, std::string>;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::string ResolveEndpoint(const OtlpConfig& config) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }

  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }

  return config.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/metrics" : "localhost:4317";
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
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, const Attributes& attributes) {
  if constexpr (requires { instrument->Add(value, attributes, opentelemetry::context::Context{}); }) {
    instrument->Add(value, attributes, opentelemetry::context::Context{});
  } else {
    instrument->Add(value, attributes);
  }
}

AttributeMap ToAttributes(const MetricLabels& labels) {
  AttributeMap attributes;
  for (const auto& [key, value] : labels) {
    attributes.emplace(key, value);
  }
  return attributes;
}

/*
  Counters are created on first use. Gauges are observable instruments
  whose callback reports the last value set for each label set.
*/
class OtlpMetricsPublisher final : public MetricsPublisher {
 public:
  OtlpMetricsPublisher() {
    meter_ = metrics_api::Provider::GetMeterProvider()->GetMeter("logship", "0.1.0");
  }

  void AddCounter(std::string_view name, std::uint64_t value, const MetricLabels& labels) override {
    opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> counter;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto                        it = counters_.find(std::string(name));
      if (it == counters_.end()) {
        it = counters_.emplace(std::string(name), meter_->CreateUInt64Counter(std::string(name))).first;
      }
      counter = it->second;
    }
    AddWithAttributes(counter, value, ToAttributes(labels));
  }

  void SetGauge(std::string_view name, double value, const MetricLabels& labels) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = gauges_.find(std::string(name));
    if (it == gauges_.end()) {
      auto state        = std::make_unique<GaugeState>();
      state->instrument = meter_->CreateDoubleObservableGauge(std::string(name));
      state->instrument->AddCallback(&OtlpMetricsPublisher::ObserveGauge, state.get());
      it = gauges_.emplace(std::string(name), std::move(state)).first;
    }
    std::lock_guard<std::mutex> gauge_lock(it->second->mutex);
    it->second->values[ToAttributes(labels)] = value;
  }

 private:
  struct GaugeState {
    opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument> instrument;
    std::mutex                                                          mutex;
    std::map<AttributeMap, double>                                      values;
  };

  static void ObserveGauge(metrics_api::ObserverResult result, void* state) {
    auto*                       gauge = static_cast<GaugeState*>(state);
    std::lock_guard<std::mutex> lock(gauge->mutex);
    auto double_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<double>>>(result);
    for (const auto& [attributes, value] : gauge->values) {
      double_result->Observe(value, attributes);
    }
  }

  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter_;

  std::mutex                                                                                      mutex_;
  std::map<std::string, opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>>> counters_;
  std::map<std::string, std::unique_ptr<GaugeState>>                                             gauges_;
};

} // namespace

bool InitializeMetrics(const logship::runtime::config::RuntimeConfig& config) {
  if (!config.observability().metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto otlp_config = ToOtlpConfig(config);
  const auto endpoint    = ResolveEndpoint(otlp_config);

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (otlp_config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint            = endpoint;
    options.use_ssl_credentials = !otlp_config.insecure;
    exporter                    = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(otlp_config.export_interval_ms);
#ifdef LOGSHIP_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(std::move(exporter), reader_options);
#endif

  resource::ResourceAttributes attrs;
  for (const auto& [key, value] : ResourceLabels(otlp_config)) {
    attrs.SetAttribute(key, opentelemetry::nostd::string_view(value));
  }
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           resource::Resource::Create(attrs));
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

std::shared_ptr<MetricsPublisher> MakeMetricsPublisher() {
  if (!g_provider) {
    return std::make_shared<NoopMetricsPublisher>();
  }
  return std::make_shared<OtlpMetricsPublisher>();
}

} // namespace logship::observability

#endif
