#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/error_kind.hpp"
#include "internal/model/file_identity.hpp"
#include "internal/util/time.hpp"

namespace logship::model {

enum class EntryStatus {
  kPending,
  kInFlight,
  kPermanentlyFailed,
};

std::string_view ToString(EntryStatus status);

struct QueueEntry {
  FileIdentity             identity;
  util::TimePoint          enqueued_at{};
  uint32_t                 attempt_count{0};
  std::optional<ErrorKind> last_error_kind;
  std::string              last_error_message;
  util::TimePoint          last_error_at{};
  EntryStatus              status{EntryStatus::kPending};
  util::TimePoint          next_attempt_at{};
  uint64_t                 sequence{0};
};

} // namespace logship::model
