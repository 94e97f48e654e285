#pragma once

#include <filesystem>
#include <vector>

#include "internal/model/file_identity.hpp"
#include "internal/model/watch_rule.hpp"
#include "internal/util/time.hpp"

namespace logship::monitor {

/*
  True when a file modified at mtime is inside a max_age_days window at
  now. The boundary is inclusive: age == max_age_days is inside.
  max_age_days <= 0 means no limit.
*/
bool WithinAgeWindow(util::TimePoint mtime, util::TimePoint now, double max_age_days);

/*
  Cold-start scan of every rule root. Returns candidate files (matching
  the rule that governs them, within the age window), oldest first.
*/
std::vector<model::FileIdentity> ScanBacklog(const model::RuleMatcher& matcher, util::TimePoint now, double max_age_days);

// Regular files directly in dir (or below it for recursive rules) that the matcher accepts.
std::vector<std::filesystem::path> ListCandidates(const model::RuleMatcher& matcher, const model::WatchRule& rule,
                                                  const std::filesystem::path& dir);

} // namespace logship::monitor
