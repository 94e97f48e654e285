#include "upload_queue.hpp"

#include <algorithm>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "state/state.pb.h"

namespace logship::queue {

using logship::observability::IntField;
using logship::observability::StringField;

namespace {

constexpr uint32_t kDocumentVersion = 1;

namespace pb = logship::state::v1;

pb::EntryStatus ToProto(model::EntryStatus status) {
  switch (status) {
    case model::EntryStatus::kPending:
      return pb::ENTRY_STATUS_PENDING;
    case model::EntryStatus::kInFlight:
      return pb::ENTRY_STATUS_IN_FLIGHT;
    case model::EntryStatus::kPermanentlyFailed:
      return pb::ENTRY_STATUS_PERMANENTLY_FAILED;
  }
  return pb::ENTRY_STATUS_UNSPECIFIED;
}

model::EntryStatus FromProto(pb::EntryStatus status) {
  switch (status) {
    case pb::ENTRY_STATUS_PERMANENTLY_FAILED:
      return model::EntryStatus::kPermanentlyFailed;
    case pb::ENTRY_STATUS_IN_FLIGHT:
      return model::EntryStatus::kInFlight;
    default:
      return model::EntryStatus::kPending;
  }
}

void ToProto(const model::QueueEntry& entry, pb::QueueEntry* out) {
  auto* identity = out->mutable_identity();
  identity->set_path(entry.identity.path);
  identity->set_size_bytes(entry.identity.size_bytes);
  identity->set_mtime_ns(entry.identity.mtime_ns);

  out->set_enqueued_at_ms(util::ToUnixMillis(entry.enqueued_at));
  out->set_attempt_count(entry.attempt_count);
  if (entry.last_error_kind) {
    out->set_last_error_kind(std::string(model::ToString(*entry.last_error_kind)));
    out->set_last_error_at_ms(util::ToUnixMillis(entry.last_error_at));
    out->set_last_error_message(entry.last_error_message);
  }
  out->set_status(ToProto(entry.status));
  out->set_next_attempt_at_ms(util::ToUnixMillis(entry.next_attempt_at));
  out->set_sequence(entry.sequence);
}

model::QueueEntry FromProto(const pb::QueueEntry& in) {
  model::QueueEntry entry;
  entry.identity.path       = in.identity().path();
  entry.identity.size_bytes = in.identity().size_bytes();
  entry.identity.mtime_ns   = in.identity().mtime_ns();
  entry.enqueued_at         = util::FromUnixMillis(in.enqueued_at_ms());
  entry.attempt_count       = in.attempt_count();
  if (!in.last_error_kind().empty()) {
    entry.last_error_kind    = model::ErrorKindFromString(in.last_error_kind()).value_or(model::ErrorKind::kUnknown);
    entry.last_error_at      = util::FromUnixMillis(in.last_error_at_ms());
    entry.last_error_message = in.last_error_message();
  }
  entry.status          = FromProto(in.status());
  entry.next_attempt_at = util::FromUnixMillis(in.next_attempt_at_ms());
  entry.sequence        = in.sequence();
  return entry;
}

bool FileExists(const std::string& path) {
  std::error_code ec;
  return std::filesystem::exists(path, ec) && !ec;
}

// A failure only blocks the identity it was recorded for.
bool FailureIsStale(const model::QueueEntry& entry) {
  const auto current = model::StatIdentity(entry.identity.path);
  return !current || *current != entry.identity;
}

bool OlderFirst(const model::QueueEntry& a, const model::QueueEntry& b) {
  if (a.enqueued_at != b.enqueued_at) {
    return a.enqueued_at < b.enqueued_at;
  }
  return a.sequence < b.sequence;
}

} // namespace

UploadQueue::UploadQueue(std::filesystem::path file, Options options) : document_(std::move(file)), options_(options) {
}

UploadQueue::LoadStats UploadQueue::Load() {
  pb::QueueDocument doc;
  LoadStats         stats;

  std::lock_guard lock(mutex_);
  entries_.clear();
  next_sequence_ = 1;

  if (!document_.Read(&doc)) {
    LOGSHIP_LOG_INFO("Queue document not found, starting empty", {StringField("path", document_.path().string())});
    return stats;
  }

  next_sequence_ = std::max<uint64_t>(doc.next_sequence(), 1);
  bool changed   = false;

  for (const auto& proto_entry : doc.entries()) {
    auto entry = FromProto(proto_entry);

    if (entry.status == model::EntryStatus::kInFlight) {
      entry.status = model::EntryStatus::kPending;
      ++stats.reset_in_flight;
      changed = true;
    }

    if (entry.status == model::EntryStatus::kPending && !FileExists(entry.identity.path)) {
      LOGSHIP_LOG_WARN("Dropping queued file that no longer exists", {StringField("path", entry.identity.path)});
      ++stats.dropped_missing;
      changed = true;
      continue;
    }

    if (entry.status == model::EntryStatus::kPermanentlyFailed) {
      if (FailureIsStale(entry)) {
        ++stats.dropped_stale_failures;
        changed = true;
        continue;
      }
      ++stats.permanently_failed;
    }

    if (entry.sequence == 0) {
      entry.sequence = next_sequence_++;
      changed        = true;
    }
    next_sequence_ = std::max(next_sequence_, entry.sequence + 1);
    entries_.emplace(entry.identity, std::move(entry));
    ++stats.loaded;
  }

  if (changed) {
    Save();
  }

  LOGSHIP_LOG_INFO("Queue loaded", {IntField("entries", static_cast<int64_t>(stats.loaded)),
                                    IntField("reset_in_flight", static_cast<int64_t>(stats.reset_in_flight)),
                                    IntField("dropped_missing", static_cast<int64_t>(stats.dropped_missing)),
                                    IntField("dropped_stale_failures", static_cast<int64_t>(stats.dropped_stale_failures)),
                                    IntField("permanently_failed", static_cast<int64_t>(stats.permanently_failed))});
  return stats;
}

UploadQueue::EnqueueResult UploadQueue::Enqueue(const model::FileIdentity& identity, util::TimePoint now) {
  std::lock_guard lock(mutex_);

  if (auto it = entries_.find(identity); it != entries_.end()) {
    return it->second.status == model::EntryStatus::kPermanentlyFailed ? EnqueueResult::kBlocked : EnqueueResult::kDuplicate;
  }

  auto previous          = entries_;
  auto previous_sequence = next_sequence_;

  auto result = EnqueueResult::kAdded;
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (it->first.path == identity.path && it->second.status == model::EntryStatus::kPending) {
      it     = entries_.erase(it);
      result = EnqueueResult::kReplaced;
    } else {
      ++it;
    }
  }

  model::QueueEntry entry;
  entry.identity        = identity;
  entry.enqueued_at     = now;
  entry.next_attempt_at = now;
  entry.sequence        = next_sequence_++;
  entries_.emplace(identity, std::move(entry));

  SaveOrRestore(std::move(previous), previous_sequence);
  return result;
}

std::vector<model::QueueEntry> UploadQueue::DequeueBatch(size_t n, util::TimePoint now) {
  std::lock_guard lock(mutex_);

  std::vector<model::QueueEntry*> due;
  for (auto& [identity, entry] : entries_) {
    if (entry.status == model::EntryStatus::kPending && entry.next_attempt_at <= now) {
      due.push_back(&entry);
    }
  }
  std::sort(due.begin(), due.end(), [](const auto* a, const auto* b) { return OlderFirst(*a, *b); });
  if (due.size() > n) {
    due.resize(n);
  }

  if (due.empty()) {
    return {};
  }

  auto previous = entries_;

  std::vector<model::QueueEntry> batch;
  batch.reserve(due.size());
  for (auto* entry : due) {
    entry->status = model::EntryStatus::kInFlight;
    batch.push_back(*entry);
  }

  SaveOrRestore(std::move(previous), next_sequence_);
  return batch;
}

bool UploadQueue::Complete(const model::FileIdentity& identity) {
  std::lock_guard lock(mutex_);
  if (entries_.count(identity) == 0) {
    return false;
  }
  auto previous = entries_;
  entries_.erase(identity);
  SaveOrRestore(std::move(previous), next_sequence_);
  return true;
}

UploadQueue::FailOutcome UploadQueue::Fail(const model::FileIdentity& identity, model::ErrorKind kind, std::string_view message,
                                           util::TimePoint now) {
  std::lock_guard lock(mutex_);
  auto            it = entries_.find(identity);
  if (it == entries_.end()) {
    return FailOutcome::kUnknownEntry;
  }

  auto  previous = entries_;
  auto& entry    = it->second;
  ++entry.attempt_count;
  entry.last_error_kind    = kind;
  entry.last_error_message = std::string(message);
  entry.last_error_at      = now;

  FailOutcome outcome;
  if (!model::IsTransient(kind) || entry.attempt_count >= options_.max_attempts) {
    entry.status = model::EntryStatus::kPermanentlyFailed;
    outcome      = FailOutcome::kPermanentlyFailed;
  } else {
    entry.status          = model::EntryStatus::kPending;
    entry.next_attempt_at = now + Backoff(entry.attempt_count);
    outcome               = FailOutcome::kRetry;
  }

  SaveOrRestore(std::move(previous), next_sequence_);
  return outcome;
}

void UploadQueue::Release(const model::FileIdentity& identity) {
  std::lock_guard lock(mutex_);
  auto            it = entries_.find(identity);
  if (it == entries_.end() || it->second.status != model::EntryStatus::kInFlight) {
    return;
  }
  it->second.status = model::EntryStatus::kPending;
  Save();
}

bool UploadQueue::Remove(const model::FileIdentity& identity) {
  return Complete(identity);
}

size_t UploadQueue::PruneStaleFailures() {
  std::lock_guard lock(mutex_);
  auto            previous = entries_;
  size_t          pruned   = 0;
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (it->second.status == model::EntryStatus::kPermanentlyFailed && FailureIsStale(it->second)) {
      it = entries_.erase(it);
      ++pruned;
    } else {
      ++it;
    }
  }
  if (pruned > 0) {
    SaveOrRestore(std::move(previous), next_sequence_);
    LOGSHIP_LOG_INFO("Pruned stale failed queue entries", {IntField("pruned", static_cast<int64_t>(pruned))});
  }
  return pruned;
}

bool UploadQueue::Contains(const model::FileIdentity& identity) const {
  std::lock_guard lock(mutex_);
  return entries_.count(identity) > 0;
}

size_t UploadQueue::Depth() const {
  std::lock_guard lock(mutex_);
  return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
                                           [](const auto& kv) { return kv.second.status != model::EntryStatus::kPermanentlyFailed; }));
}

size_t UploadQueue::PermanentlyFailedCount() const {
  std::lock_guard lock(mutex_);
  return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
                                           [](const auto& kv) { return kv.second.status == model::EntryStatus::kPermanentlyFailed; }));
}

std::vector<model::QueueEntry> UploadQueue::Snapshot() const {
  std::lock_guard                lock(mutex_);
  std::vector<model::QueueEntry> out;
  out.reserve(entries_.size());
  for (const auto& [identity, entry] : entries_) {
    out.push_back(entry);
  }
  std::sort(out.begin(), out.end(), OlderFirst);
  return out;
}

void UploadQueue::Flush() {
  std::lock_guard lock(mutex_);
  Save();
}

std::chrono::seconds UploadQueue::Backoff(uint32_t attempt) const {
  if (attempt == 0) {
    return std::chrono::seconds(0);
  }
  const uint32_t shift = std::min<uint32_t>(attempt - 1, 30);
  const auto     delay = std::chrono::seconds(int64_t{1} << shift);
  return std::min(delay, options_.max_backoff);
}

// Caller holds mutex_.
void UploadQueue::Save() const {
  pb::QueueDocument doc;
  doc.set_version(kDocumentVersion);
  doc.set_next_sequence(next_sequence_);

  std::vector<const model::QueueEntry*> ordered;
  ordered.reserve(entries_.size());
  for (const auto& [identity, entry] : entries_) {
    ordered.push_back(&entry);
  }
  std::sort(ordered.begin(), ordered.end(), [](const auto* a, const auto* b) { return a->sequence < b->sequence; });

  for (const auto* entry : ordered) {
    ToProto(*entry, doc.add_entries());
  }
  document_.Write(doc);
}

// Caller holds mutex_.
void UploadQueue::SaveOrRestore(EntryMap previous, uint64_t previous_sequence) {
  try {
    Save();
  } catch (...) {
    entries_       = std::move(previous);
    next_sequence_ = previous_sequence;
    throw;
  }
}

} // namespace logship::queue
