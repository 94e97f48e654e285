#pragma once

#include <cstdint>
#include <filesystem>

namespace logship::cleanup {

struct DiskUsage {
  uint64_t total_bytes{0};
  uint64_t used_bytes{0};
  uint64_t available_bytes{0}; // free to unprivileged writers

  double UsageFraction() const {
    return total_bytes == 0 ? 0.0 : static_cast<double>(used_bytes) / static_cast<double>(total_bytes);
  }
};

class DiskGauge {
 public:
  virtual ~DiskGauge() = default;

  // Throws std::system_error when the filesystem cannot be queried.
  virtual DiskUsage Measure() const = 0;
};

/*
  statvfs() on the filesystem holding path.
*/
class StatvfsDiskGauge final : public DiskGauge {
 public:
  explicit StatvfsDiskGauge(std::filesystem::path path);

  DiskUsage Measure() const override;

 private:
  std::filesystem::path path_;
};

} // namespace logship::cleanup
