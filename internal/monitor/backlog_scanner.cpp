#include "backlog_scanner.hpp"

#include <algorithm>
#include <system_error>

#include "internal/observability/logging.hpp"

namespace logship::monitor {

using logship::observability::IntField;
using logship::observability::StringField;

bool WithinAgeWindow(util::TimePoint mtime, util::TimePoint now, double max_age_days) {
  if (max_age_days <= 0) {
    return true;
  }
  return now - mtime <= util::Days(max_age_days);
}

std::vector<std::filesystem::path> ListCandidates(const model::RuleMatcher& matcher, const model::WatchRule& rule,
                                                  const std::filesystem::path& dir) {
  std::vector<std::filesystem::path> out;
  std::error_code                    ec;

  auto consider = [&](const std::filesystem::directory_entry& entry) {
    std::error_code status_ec;
    if (!entry.is_regular_file(status_ec) || entry.is_symlink(status_ec)) {
      return;
    }
    // nested rules: only the most specific one owns the file
    if (matcher.Candidate(entry.path()) == &rule) {
      out.push_back(entry.path());
    }
  };

  const auto options = std::filesystem::directory_options::skip_permission_denied;
  if (rule.recursive) {
    for (std::filesystem::recursive_directory_iterator it(dir, options, ec), end; !ec && it != end; it.increment(ec)) {
      std::error_code dir_ec;
      if (it->is_directory(dir_ec) && model::IsHidden(it->path())) {
        it.disable_recursion_pending();
        continue;
      }
      consider(*it);
    }
  } else {
    for (std::filesystem::directory_iterator it(dir, options, ec), end; !ec && it != end; it.increment(ec)) {
      consider(*it);
    }
  }

  if (ec) {
    LOGSHIP_LOG_WARN("Directory scan incomplete", {StringField("path", dir.string()), StringField("error", ec.message())});
  }
  return out;
}

std::vector<model::FileIdentity> ScanBacklog(const model::RuleMatcher& matcher, util::TimePoint now, double max_age_days) {
  std::vector<model::FileIdentity> found;
  size_t                           too_old = 0;

  for (const auto& rule : matcher.rules()) {
    std::error_code ec;
    if (!std::filesystem::is_directory(rule.root, ec)) {
      LOGSHIP_LOG_WARN("Watch root missing, skipping backlog scan", {StringField("path", rule.root.string())});
      continue;
    }

    for (const auto& path : ListCandidates(matcher, rule, rule.root)) {
      auto identity = model::StatIdentity(path);
      if (!identity) {
        continue;
      }
      if (!WithinAgeWindow(identity->ModifiedAt(), now, max_age_days)) {
        ++too_old;
        continue;
      }
      found.push_back(std::move(*identity));
    }
  }

  std::sort(found.begin(), found.end(), [](const auto& a, const auto& b) { return a.mtime_ns < b.mtime_ns; });

  LOGSHIP_LOG_INFO("Backlog scan complete", {IntField("candidates", static_cast<int64_t>(found.size())), IntField("too_old", static_cast<int64_t>(too_old))});
  return found;
}

} // namespace logship::monitor
