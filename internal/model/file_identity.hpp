#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

#include "internal/util/time.hpp"

namespace logship::model {

/*
  (path, size, mtime) triple. Two observations are the same logical file
  only when all three match.
*/
struct FileIdentity {
  std::string path;
  uint64_t    size_bytes{0};
  int64_t     mtime_ns{0};

  bool operator==(const FileIdentity&) const = default;

  util::TimePoint ModifiedAt() const {
    return util::FromUnixNanos(mtime_ns);
  }
};

struct FileIdentityHash {
  size_t operator()(const FileIdentity& id) const noexcept;
};

// Stable 16 hex digit digest, persisted in the registry.
std::string IdentityHash(const FileIdentity& id);

/*
  lstat() the path. nullopt when it does not exist or is not a regular
  file (symlinks included).
*/
std::optional<FileIdentity> StatIdentity(const std::filesystem::path& path);

} // namespace logship::model
