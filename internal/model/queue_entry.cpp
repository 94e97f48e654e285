#include "queue_entry.hpp"

namespace logship::model {

std::string_view ToString(EntryStatus status) {
  switch (status) {
    case EntryStatus::kPending:
      return "pending";
    case EntryStatus::kInFlight:
      return "in_flight";
    case EntryStatus::kPermanentlyFailed:
      return "permanently_failed";
  }
  return "unknown";
}

} // namespace logship::model
