#include "remote_key.hpp"

#include <filesystem>

#include "internal/util/time.hpp"

namespace logship::upload {

std::string BuildRemoteKey(const std::string& vehicle_id, const model::RuleMatcher& matcher, const model::FileIdentity& identity) {
  const std::filesystem::path path(identity.path);
  const auto                  date = util::LocalDate(identity.ModifiedAt());

  if (const auto* rule = matcher.Find(path)) {
    if (auto relative = model::RelativeToRoot(*rule, path)) {
      return vehicle_id + "/" + date + "/" + rule->source + "/" + relative->generic_string();
    }
  }
  return vehicle_id + "/" + date + "/" + kFallbackSource + "/" + path.filename().string();
}

} // namespace logship::upload
