#include "file_identity.hpp"

#include <sys/stat.h>

#include <spdlog/fmt/fmt.h>

namespace logship::model {

namespace {

constexpr uint64_t kFnvOffset = 1469598103934665603ULL;
constexpr uint64_t kFnvPrime  = 1099511628211ULL;

uint64_t Fnv1a(uint64_t hash, const void* data, size_t size) {
  const auto* bytes = static_cast<const unsigned char*>(data);
  for (size_t i = 0; i < size; ++i) {
    hash ^= bytes[i];
    hash *= kFnvPrime;
  }
  return hash;
}

uint64_t Digest(const FileIdentity& id) {
  uint64_t hash = kFnvOffset;
  hash          = Fnv1a(hash, id.path.data(), id.path.size());
  hash          = Fnv1a(hash, "\0", 1);
  hash          = Fnv1a(hash, &id.size_bytes, sizeof(id.size_bytes));
  hash          = Fnv1a(hash, &id.mtime_ns, sizeof(id.mtime_ns));
  return hash;
}

} // namespace

size_t FileIdentityHash::operator()(const FileIdentity& id) const noexcept {
  return static_cast<size_t>(Digest(id));
}

std::string IdentityHash(const FileIdentity& id) {
  return fmt::format("{:016x}", Digest(id));
}

std::optional<FileIdentity> StatIdentity(const std::filesystem::path& path) {
  struct stat st {};
  if (::lstat(path.c_str(), &st) != 0) {
    return std::nullopt;
  }
  if (!S_ISREG(st.st_mode)) {
    return std::nullopt;
  }

  FileIdentity id;
  id.path       = path.string();
  id.size_bytes = static_cast<uint64_t>(st.st_size);
  id.mtime_ns   = static_cast<int64_t>(st.st_mtim.tv_sec) * 1000000000LL + st.st_mtim.tv_nsec;
  return id;
}

} // namespace logship::model
