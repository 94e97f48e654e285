#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "internal/model/error_kind.hpp"
#include "internal/model/file_identity.hpp"

namespace logship::runtime::config {
class RuntimeConfig;
}

namespace logship::observability {

namespace span {
inline constexpr char kDrain[]  = "logship.drain";
inline constexpr char kUpload[] = "logship.upload";
inline constexpr char kDelete[] = "logship.delete";
} // namespace span

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

/*
  Export settings shared by the trace and metric pipelines.
*/
struct OtlpConfig {
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
  std::uint32_t export_interval_ms{10000};
  double        trace_sample_ratio{1.0};
  std::string   vehicle_id{};
};

OtlpConfig ToOtlpConfig(const logship::runtime::config::RuntimeConfig& config);

// service.name, service.version, host.name and vehicle.id, so one
// collector can tell the vehicles of a fleet apart.
std::vector<std::pair<std::string, std::string>> ResourceLabels(const OtlpConfig& config);

bool InitializeTracing(const logship::runtime::config::RuntimeConfig& config);
void ShutdownTracing();

/*
  RAII span around one unit of pipeline work: a drain, one file upload,
  one deletion. Inert when tracing is off or the trace was not sampled.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  // logship.path, logship.size_bytes and logship.mtime_ns
  void SetFile(const model::FileIdentity& identity);

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);

  // Error status plus a logship.error_kind attribute.
  void SetFailed(model::ErrorKind kind, std::string_view message);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const logship::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetFile(const model::FileIdentity&) {
}

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::SetFailed(model::ErrorKind, std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}
#endif

} // namespace logship::observability
