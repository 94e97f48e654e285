#pragma once

#include <cstdint>

namespace logship::model {

// Deferred local deletion once a file is confirmed uploaded. keep_days=0 deletes immediately.
struct AfterUploadPolicy {
  bool   enabled{true};
  double keep_days{14};
};

// Daily sweep of anything older than max_age_days, uploaded or not. 0 disables.
struct AgeBasedPolicy {
  bool   enabled{true};
  double max_age_days{7};
  int    schedule_minute{2 * 60};
};

// Disk pressure driven deletion of the oldest uploaded files.
struct EmergencyPolicy {
  bool enabled{false};
};

struct DeletionPolicy {
  AfterUploadPolicy after_upload;
  AgeBasedPolicy    age_based;
  EmergencyPolicy   emergency;
};

struct DiskThresholds {
  double   warning{0.90};
  double   critical{0.95};
  uint64_t reserved_bytes{0};
};

} // namespace logship::model
