#include "watch_rule.hpp"

#include <fnmatch.h>

#include <utility>

namespace logship::model {

std::filesystem::path NormalizeRoot(const std::filesystem::path& root) {
  auto normal = root.lexically_normal();
  if (!normal.has_filename() && normal != normal.root_path()) {
    normal = normal.parent_path();
  }
  return normal;
}

std::optional<std::filesystem::path> RelativeToRoot(const WatchRule& rule, const std::filesystem::path& file) {
  const auto root     = NormalizeRoot(rule.root);
  const auto relative = file.lexically_normal().lexically_relative(root);
  if (relative.empty() || relative == ".") {
    return std::nullopt;
  }
  if (*relative.begin() == "..") {
    return std::nullopt;
  }
  return relative;
}

bool MatchesPattern(const WatchRule& rule, const std::filesystem::path& file) {
  if (rule.pattern.empty()) {
    return true;
  }
  return ::fnmatch(rule.pattern.c_str(), file.filename().c_str(), 0) == 0;
}

bool WithinDepth(const WatchRule& rule, const std::filesystem::path& file) {
  auto relative = RelativeToRoot(rule, file);
  if (!relative) {
    return false;
  }
  if (rule.recursive) {
    return true;
  }
  return !relative->has_parent_path();
}

bool IsHidden(const std::filesystem::path& file) {
  const auto name = file.filename().string();
  return !name.empty() && name[0] == '.';
}

RuleMatcher::RuleMatcher(std::vector<WatchRule> rules) : rules_(std::move(rules)) {
}

const WatchRule* RuleMatcher::Find(const std::filesystem::path& file) const {
  const WatchRule* best       = nullptr;
  size_t           best_depth = 0;
  for (const auto& rule : rules_) {
    if (!RelativeToRoot(rule, file)) {
      continue;
    }
    const auto depth = NormalizeRoot(rule.root).native().size();
    if (!best || depth > best_depth) {
      best       = &rule;
      best_depth = depth;
    }
  }
  return best;
}

const WatchRule* RuleMatcher::Candidate(const std::filesystem::path& file) const {
  const auto* rule = Find(file);
  if (!rule || IsHidden(file) || !WithinDepth(*rule, file) || !MatchesPattern(*rule, file)) {
    return nullptr;
  }
  return rule;
}

} // namespace logship::model
