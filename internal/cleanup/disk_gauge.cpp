#include "disk_gauge.hpp"

#include <sys/statvfs.h>

#include <cerrno>
#include <system_error>

namespace logship::cleanup {

StatvfsDiskGauge::StatvfsDiskGauge(std::filesystem::path path) : path_(std::move(path)) {
}

DiskUsage StatvfsDiskGauge::Measure() const {
  struct statvfs st {};
  if (::statvfs(path_.c_str(), &st) != 0) {
    throw std::system_error(errno, std::generic_category(), "statvfs " + path_.string());
  }

  const uint64_t block = st.f_frsize ? st.f_frsize : st.f_bsize;

  DiskUsage usage;
  usage.total_bytes     = static_cast<uint64_t>(st.f_blocks) * block;
  usage.used_bytes      = static_cast<uint64_t>(st.f_blocks - st.f_bfree) * block;
  usage.available_bytes = static_cast<uint64_t>(st.f_bavail) * block;
  return usage;
}

} // namespace logship::cleanup
