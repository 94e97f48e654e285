#pragma once

#include <string>

#include "internal/model/file_identity.hpp"
#include "internal/model/watch_rule.hpp"

namespace logship::upload {

inline constexpr char kFallbackSource[] = "other";

/*
  Deterministic object key:

      {vehicle_id}/{YYYY-MM-DD}/{source}/{relative_path}

  The date is the file's own local modification date, so re-processing
  never relocates an object. Files outside every rule use source "other"
  and their bare file name.
*/
std::string BuildRemoteKey(const std::string& vehicle_id, const model::RuleMatcher& matcher, const model::FileIdentity& identity);

} // namespace logship::upload
