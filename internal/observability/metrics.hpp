#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "internal/observability/spans.hpp"

namespace logship::observability {

using MetricLabels = std::vector<std::pair<std::string, std::string>>;

namespace metric {
inline constexpr char kFilesEnqueued[]    = "logship.files.enqueued";
inline constexpr char kFilesUploaded[]    = "logship.files.uploaded";
inline constexpr char kBytesUploaded[]    = "logship.bytes.uploaded";
inline constexpr char kUploadFailures[]   = "logship.upload.failures";
inline constexpr char kFilesDeleted[]     = "logship.files.deleted";
inline constexpr char kQueueDepth[]       = "logship.queue.depth";
inline constexpr char kDiskUsagePercent[] = "logship.disk.usage_percent";
} // namespace metric

/*
  Narrow push interface the pipeline publishes through. Transport and
  aggregation belong to the implementation.
*/
class MetricsPublisher {
 public:
  virtual ~MetricsPublisher() = default;

  virtual void AddCounter(std::string_view name, std::uint64_t value, const MetricLabels& labels = {}) = 0;
  virtual void SetGauge(std::string_view name, double value, const MetricLabels& labels = {})          = 0;
};

class NoopMetricsPublisher final : public MetricsPublisher {
 public:
  void AddCounter(std::string_view, std::uint64_t, const MetricLabels&) override {
  }
  void SetGauge(std::string_view, double, const MetricLabels&) override {
  }
};

bool InitializeMetrics(const logship::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

// OTLP-backed publisher when metrics were initialized, otherwise a no-op.
std::shared_ptr<MetricsPublisher> MakeMetricsPublisher();

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const logship::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownMetrics() {
}

inline std::shared_ptr<MetricsPublisher> MakeMetricsPublisher() {
  return std::make_shared<NoopMetricsPublisher>();
}
#endif

} // namespace logship::observability
