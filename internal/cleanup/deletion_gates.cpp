#include "deletion_gates.hpp"

#include <system_error>

#include "internal/observability/logging.hpp"

namespace logship::cleanup {

using logship::observability::StringField;

namespace {

// Nothing below these is ever deleted.
constexpr std::string_view kProtectedTrees[] = {
    "/bin", "/boot", "/dev", "/etc", "/lib", "/lib32", "/lib64", "/libx32", "/opt",
    "/proc", "/run", "/sbin", "/snap", "/srv", "/sys", "/usr", "/var/lib", "/var/cache",
};

// Files sitting directly in these are never deleted; subdirectories may be watched.
constexpr std::string_view kProtectedDirectories[] = {
    "/", "/home", "/root", "/tmp", "/var", "/var/log",
};

bool IsWithin(const std::filesystem::path& path, std::string_view tree) {
  const auto relative = path.lexically_relative(std::filesystem::path(tree));
  return !relative.empty() && *relative.begin() != "..";
}

} // namespace

std::string_view ToString(Gate gate) {
  switch (gate) {
    case Gate::kSystemPath:
      return "system_path";
    case Gate::kAllowDeletion:
      return "allow_deletion";
    case Gate::kRecursive:
      return "recursive";
    case Gate::kPattern:
      return "pattern";
  }
  return "unknown";
}

bool IsProtectedSystemPath(const std::filesystem::path& path) {
  const auto normal = path.lexically_normal();
  if (!normal.is_absolute()) {
    return true;
  }
  for (auto tree : kProtectedTrees) {
    if (IsWithin(normal, tree)) return true;
  }
  const auto parent = model::NormalizeRoot(normal.parent_path());
  for (auto directory : kProtectedDirectories) {
    if (parent == std::filesystem::path(directory)) return true;
  }
  return false;
}

bool SystemPathGate(const std::filesystem::path& file, const model::WatchRule& rule) {
  if (IsProtectedSystemPath(file)) {
    return false;
  }

  std::error_code ec;
  const auto      real_file = std::filesystem::weakly_canonical(file, ec);
  if (ec || IsProtectedSystemPath(real_file)) {
    return false;
  }
  const auto real_root = std::filesystem::weakly_canonical(rule.root, ec);
  if (ec) {
    return false;
  }

  model::WatchRule resolved = rule;
  resolved.root             = real_root;
  return model::RelativeToRoot(resolved, real_file).has_value();
}

bool AllowDeletionGate(const std::filesystem::path&, const model::WatchRule& rule) {
  return rule.allow_deletion;
}

bool RecursiveGate(const std::filesystem::path& file, const model::WatchRule& rule) {
  return model::WithinDepth(rule, file);
}

bool PatternGate(const std::filesystem::path& file, const model::WatchRule& rule) {
  return model::MatchesPattern(rule, file);
}

std::optional<Gate> FirstVeto(const std::filesystem::path& file, const model::WatchRule& rule) {
  for (const auto& entry : kDeletionGates) {
    try {
      if (!entry.predicate(file, rule)) {
        return entry.gate;
      }
    } catch (const std::exception& e) {
      LOGSHIP_LOG_ERROR("Deletion gate failed", {StringField("path", file.string()), StringField("gate", ToString(entry.gate)),
                                                 StringField("error", e.what())});
      return entry.gate;
    }
  }
  return std::nullopt;
}

} // namespace logship::cleanup
