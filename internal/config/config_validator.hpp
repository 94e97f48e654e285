#pragma once

#include "config/config.pb.h"

namespace logship::config {

/*
  Semantic checks the JSON schema cannot express. Every violation is
  collected; the thrown ConfigError lists them all, field-qualified.
*/
void ValidateConfig(const logship::runtime::config::RuntimeConfig& config);

} // namespace logship::config
