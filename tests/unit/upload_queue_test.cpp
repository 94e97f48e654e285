#include <algorithm>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>

#include "internal/queue/upload_queue.hpp"
#include "internal/util/errors.hpp"
#include "tests/unit/test_support.hpp"

namespace {

using namespace std::chrono_literals;
using logship::model::EntryStatus;
using logship::model::ErrorKind;
using logship::model::FileIdentity;
using logship::queue::UploadQueue;
using logship::testing::FixedNow;
using logship::testing::TempDir;
using logship::testing::WriteFile;

FileIdentity MakeFile(const TempDir& dir, const std::string& name, const std::string& contents = "data") {
  const auto path = dir / name;
  WriteFile(path, contents);
  return *logship::model::StatIdentity(path);
}

void TestEnqueueIsIdempotent() {
  TempDir     dir("queue_idempotent");
  UploadQueue queue(dir / "queue.json", {});
  const auto  a   = MakeFile(dir, "a.log");
  const auto  now = FixedNow();

  assert(queue.Enqueue(a, now) == UploadQueue::EnqueueResult::kAdded);
  assert(queue.Enqueue(a, now + 1s) == UploadQueue::EnqueueResult::kDuplicate);
  assert(queue.Depth() == 1);

  auto batch = queue.DequeueBatch(10, now);
  assert(batch.size() == 1);
  // re-detected while in flight
  assert(queue.Enqueue(a, now + 2s) == UploadQueue::EnqueueResult::kDuplicate);
  assert(queue.Depth() == 1);
}

void TestDequeueIsFifoAndMarksInFlight() {
  TempDir     dir("queue_fifo");
  UploadQueue queue(dir / "queue.json", {});
  const auto  now = FixedNow();
  const auto  a   = MakeFile(dir, "a.log");
  const auto  b   = MakeFile(dir, "b.log");
  const auto  c   = MakeFile(dir, "c.log");

  queue.Enqueue(b, now + 1s);
  queue.Enqueue(a, now);
  queue.Enqueue(c, now + 1s);

  auto first = queue.DequeueBatch(2, now + 5s);
  assert(first.size() == 2);
  assert(first[0].identity == a);
  // same enqueue time: insertion order
  assert(first[1].identity == b);

  auto second = queue.DequeueBatch(2, now + 5s);
  assert(second.size() == 1 && second[0].identity == c);
  assert(queue.DequeueBatch(2, now + 5s).empty());

  assert(queue.Complete(a));
  assert(!queue.Complete(a));
  assert(queue.Depth() == 2);
}

void TestTransientFailureBacksOff() {
  TempDir     dir("queue_backoff");
  UploadQueue queue(dir / "queue.json", UploadQueue::Options{3, 512s});
  const auto  now = FixedNow();
  const auto  a   = MakeFile(dir, "a.log");

  queue.Enqueue(a, now);
  queue.DequeueBatch(1, now);
  assert(queue.Fail(a, ErrorKind::kNetwork, "reset", now) == UploadQueue::FailOutcome::kRetry);
  assert(queue.DequeueBatch(1, now).empty());
  assert(queue.Snapshot()[0].next_attempt_at == now + 1s);

  queue.DequeueBatch(1, now + 1s);
  assert(queue.Fail(a, ErrorKind::kThrottled, "slow down", now + 1s) == UploadQueue::FailOutcome::kRetry);
  assert(queue.Snapshot()[0].next_attempt_at == now + 3s);

  queue.DequeueBatch(1, now + 3s);
  assert(queue.Fail(a, ErrorKind::kTimeout, "timeout", now + 3s) == UploadQueue::FailOutcome::kPermanentlyFailed);
  assert(queue.Depth() == 0);
  assert(queue.PermanentlyFailedCount() == 1);

  auto entry = queue.Snapshot()[0];
  assert(entry.attempt_count == 3);
  assert(entry.last_error_kind == ErrorKind::kTimeout);
  assert(entry.status == EntryStatus::kPermanentlyFailed);

  assert(queue.Backoff(1) == 1s);
  assert(queue.Backoff(4) == 8s);
  assert(queue.Backoff(20) == 512s);
}

void TestPermanentFailureBlocksReenqueue() {
  TempDir     dir("queue_permanent");
  UploadQueue queue(dir / "queue.json", {});
  const auto  now = FixedNow();
  const auto  a   = MakeFile(dir, "a.log");

  queue.Enqueue(a, now);
  queue.DequeueBatch(1, now);
  assert(queue.Fail(a, ErrorKind::kAuth, "denied", now) == UploadQueue::FailOutcome::kPermanentlyFailed);
  assert(queue.Enqueue(a, now + 1s) == UploadQueue::EnqueueResult::kBlocked);

  // the failure stands while the file is unchanged
  assert(queue.PruneStaleFailures() == 0);
  assert(queue.PermanentlyFailedCount() == 1);

  std::filesystem::remove(a.path);
  assert(queue.PruneStaleFailures() == 1);
  assert(queue.PermanentlyFailedCount() == 0);
  assert(!queue.Contains(a));
}

void TestRewrittenFileClearsItsFailure() {
  TempDir     dir("queue_rewritten");
  UploadQueue queue(dir / "queue.json", {});
  const auto  now = FixedNow();
  const auto  a   = MakeFile(dir, "a.log", "v1");

  queue.Enqueue(a, now);
  queue.DequeueBatch(1, now);
  queue.Fail(a, ErrorKind::kTooLarge, "too big", now);

  const auto rewritten = MakeFile(dir, "a.log", "version two");
  assert(queue.Enqueue(rewritten, now + 1s) == UploadQueue::EnqueueResult::kAdded);
  assert(queue.PruneStaleFailures() == 1);
  assert(queue.Contains(rewritten));
  assert(queue.Depth() == 1);
}

// A directory at the document path makes every write fail.
void BreakStorage(const std::filesystem::path& document) {
  std::filesystem::remove_all(document);
  std::filesystem::create_directories(document / "blocker");
}

template <typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const std::exception&) {
    return true;
  }
  return false;
}

void TestFailedWriteLeavesQueueUntouched() {
  TempDir     dir("queue_failed_write");
  const auto  document = dir / "queue.json";
  UploadQueue queue(document, {});
  const auto  now = FixedNow();
  const auto  a   = MakeFile(dir, "a.log");
  const auto  b   = MakeFile(dir, "b.log");
  const auto  c   = MakeFile(dir, "c.log");

  queue.Enqueue(a, now);
  queue.Enqueue(b, now + 1s);

  BreakStorage(document);
  assert(Throws([&] { queue.DequeueBatch(10, now + 1h); }));
  assert(Throws([&] { queue.Enqueue(c, now + 2s); }));
  assert(!queue.Contains(c));
  for (const auto& entry : queue.Snapshot()) {
    assert(entry.status == EntryStatus::kPending);
  }

  std::filesystem::remove_all(document);
  auto batch = queue.DequeueBatch(10, now + 1h);
  assert(batch.size() == 2);

  // a failed attempt that cannot be written is not counted
  BreakStorage(document);
  assert(Throws([&] { queue.Fail(a, ErrorKind::kNetwork, "reset", now + 1h); }));
  assert(Throws([&] { queue.Complete(b); }));
  assert(queue.Contains(b));
  for (const auto& entry : queue.Snapshot()) {
    assert(entry.status == EntryStatus::kInFlight);
    assert(entry.attempt_count == 0);
  }

  // release still hands the entries back for the next drain
  assert(Throws([&] { queue.Release(a); }));
  assert(Throws([&] { queue.Release(b); }));
  std::filesystem::remove_all(document);
  assert(queue.DequeueBatch(10, now + 1h).size() == 2);
}

void TestNewIdentityReplacesPendingEntryForPath() {
  TempDir     dir("queue_replace");
  UploadQueue queue(dir / "queue.json", {});
  const auto  now = FixedNow();
  const auto  old = MakeFile(dir, "a.log", "v1");

  queue.Enqueue(old, now);
  auto grown = old;
  grown.size_bytes += 10;
  assert(queue.Enqueue(grown, now + 1s) == UploadQueue::EnqueueResult::kReplaced);
  assert(!queue.Contains(old));
  assert(queue.Contains(grown));
  assert(queue.Depth() == 1);
}

void TestReloadResetsInFlightAndDropsMissing() {
  TempDir    dir("queue_reload");
  const auto now  = FixedNow();
  const auto a    = MakeFile(dir, "a.log");
  const auto b    = MakeFile(dir, "b.log");
  const auto gone = MakeFile(dir, "gone.log");
  const auto bad  = MakeFile(dir, "bad.log");
  const auto lost = MakeFile(dir, "lost.log");

  {
    UploadQueue queue(dir / "queue.json", {});
    queue.Load();
    queue.Enqueue(a, now);
    queue.Enqueue(b, now + 1s);
    queue.Enqueue(gone, now + 2s);
    queue.Enqueue(bad, now + 3s);
    queue.Enqueue(lost, now + 4s);
    queue.DequeueBatch(1, now); // a in flight when the process dies
    auto batch = queue.DequeueBatch(10, now + 10s);
    for (const auto& entry : batch) {
      if (entry.identity == bad || entry.identity == lost) queue.Fail(entry.identity, ErrorKind::kTooLarge, "too big", now);
      else queue.Release(entry.identity);
    }
  }
  std::filesystem::remove(gone.path);
  std::filesystem::remove(lost.path);

  UploadQueue reloaded(dir / "queue.json", {});
  auto        stats = reloaded.Load();
  assert(stats.reset_in_flight == 1);
  assert(stats.dropped_missing == 1);
  assert(stats.dropped_stale_failures == 1);
  assert(stats.permanently_failed == 1);
  assert(stats.loaded == 3);

  auto batch = reloaded.DequeueBatch(10, now + 10s);
  assert(batch.size() == 2);
  assert(batch[0].identity == a);
  assert(batch[1].identity == b);
  assert(reloaded.PermanentlyFailedCount() == 1);

  // sequence numbers keep increasing across restarts
  const auto c = MakeFile(dir, "c.log");
  reloaded.Enqueue(c, now);
  uint64_t c_sequence = 0, max_other = 0;
  for (const auto& entry : reloaded.Snapshot()) {
    if (entry.identity == c) c_sequence = entry.sequence;
    else max_other = std::max(max_other, entry.sequence);
  }
  assert(c_sequence > max_other);
}

void TestPersistenceIsAtomic() {
  TempDir     dir("queue_atomic");
  UploadQueue queue(dir / "state" / "queue.json", {});
  queue.Enqueue(MakeFile(dir, "a.log"), FixedNow());

  assert(std::filesystem::exists(dir / "state" / "queue.json"));
  assert(!std::filesystem::exists(dir / "state" / ".queue.json.tmp"));
}

void TestCorruptDocumentIsFatal() {
  TempDir dir("queue_corrupt");
  WriteFile(dir / "queue.json", "{ this is not json");

  UploadQueue queue(dir / "queue.json", {});
  bool        threw = false;
  try {
    queue.Load();
  } catch (const logship::util::StorageCorrupted&) {
    threw = true;
  }
  assert(threw && "a corrupt queue must stop startup");
}

} // namespace

int main() {
  TestEnqueueIsIdempotent();
  TestDequeueIsFifoAndMarksInFlight();
  TestTransientFailureBacksOff();
  TestPermanentFailureBlocksReenqueue();
  TestRewrittenFileClearsItsFailure();
  TestFailedWriteLeavesQueueUntouched();
  TestNewIdentityReplacesPendingEntryForPath();
  TestReloadResetsInFlightAndDropsMissing();
  TestPersistenceIsAtomic();
  TestCorruptDocumentIsFatal();

  std::cout << "logship_unit_upload_queue: pass\n";
  return 0;
}
