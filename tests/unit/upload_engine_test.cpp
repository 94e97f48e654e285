#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include "internal/model/watch_rule.hpp"
#include "internal/queue/upload_queue.hpp"
#include "internal/registry/processed_registry.hpp"
#include "internal/upload/multipart_transfer.hpp"
#include "internal/upload/remote_key.hpp"
#include "internal/upload/upload_engine.hpp"
#include "internal/upload/upload_error.hpp"
#include "tests/unit/test_support.hpp"

namespace {

using namespace std::chrono_literals;
using logship::model::ErrorKind;
using logship::model::FileIdentity;
using logship::testing::FakeObjectStore;
using logship::testing::FixedNow;
using logship::testing::ReadFile;
using logship::testing::SetModificationTime;
using logship::testing::TempDir;
using logship::testing::WriteFile;
using logship::testing::WriteFileOfSize;
using logship::upload::UploadEngine;

namespace metric = logship::observability::metric;

/*
  One rule rooted at <tmp>/logs, single worker so batch order is
  deterministic, multipart above 1000 bytes in 400 byte parts.
*/
struct Harness {
  explicit Harness(const std::string& name) : dir(name), logs(dir.path() / "logs"), now(FixedNow()) {
    std::filesystem::create_directories(logs);

    logship::model::WatchRule rule;
    rule.root   = logs;
    rule.source = "ros";
    matcher     = std::make_shared<const logship::model::RuleMatcher>(std::vector<logship::model::WatchRule>{rule});

    logship::queue::UploadQueue::Options queue_options;
    queue_options.max_attempts = 3;
    queue    = std::make_shared<logship::queue::UploadQueue>(dir / "queue.json", queue_options);
    registry = std::make_shared<logship::registry::ProcessedRegistry>(dir / "registry.json", 30);
    store    = std::make_shared<FakeObjectStore>();
    metrics  = std::make_shared<logship::testing::RecordingMetricsPublisher>();

    options.vehicle_id                          = "vehicle-001";
    options.workers                             = 1;
    options.transfer.multipart_threshold_bytes = 1000;
    options.transfer.part_size_bytes            = 400;
    options.transfer.part_retries               = 2;
    options.transfer.part_retry_delay           = 0ms;
    options.transfer.max_object_bytes           = 1 << 20;
  }

  ~Harness() {
    if (engine) engine->Stop(1s);
  }

  UploadEngine& Engine() {
    if (!engine) {
      engine = std::make_unique<UploadEngine>(options, matcher, queue, registry, store, metrics, [this] { return now; });
      engine->Start();
    }
    return *engine;
  }

  // Writes a file, stamps its mtime one hour before now and queues it.
  FileIdentity Queue(const std::string& name, size_t size) {
    const auto path = logs / name;
    WriteFileOfSize(path, size);
    SetModificationTime(path, now - 1h);
    auto id = *logship::model::StatIdentity(path);
    queue->Enqueue(id, now);
    return id;
  }

  std::string KeyOf(const FileIdentity& id) const {
    return logship::upload::BuildRemoteKey("vehicle-001", *matcher, id);
  }

  TempDir                                                      dir;
  std::filesystem::path                                        logs;
  logship::util::TimePoint                                     now;
  std::shared_ptr<const logship::model::RuleMatcher>           matcher;
  std::shared_ptr<logship::queue::UploadQueue>                 queue;
  std::shared_ptr<logship::registry::ProcessedRegistry>        registry;
  std::shared_ptr<FakeObjectStore>                             store;
  std::shared_ptr<logship::testing::RecordingMetricsPublisher> metrics;
  UploadEngine::Options                                        options;
  std::unique_ptr<UploadEngine>                                engine;
};

void TestRemoteKeyLayout() {
  TempDir                          dir("engine_keys");
  logship::model::WatchRule        rule;
  rule.root   = dir / "logs";
  rule.source = "ros";
  logship::model::RuleMatcher matcher({rule});

  // 2024-06-14 23:30 UTC
  const auto mtime_ns = logship::util::ToUnixNanos(FixedNow() - 12h - 30min);

  FileIdentity nested{(dir / "logs/run_1/imu.bag").string(), 1, mtime_ns};
  assert(logship::upload::BuildRemoteKey("vehicle-001", matcher, nested) == "vehicle-001/2024-06-14/ros/run_1/imu.bag");

  FileIdentity stray{(dir / "elsewhere/dmesg.txt").string(), 1, mtime_ns};
  assert(logship::upload::BuildRemoteKey("vehicle-001", matcher, stray) == "vehicle-001/2024-06-14/other/dmesg.txt");
}

void TestSmallFileIsPut() {
  Harness h("engine_put");
  auto    id = h.Queue("sub/a.log", 120);

  std::vector<FileIdentity> hooked;
  h.Engine().SetUploadedHook([&](const FileIdentity& uploaded, logship::util::TimePoint) { hooked.push_back(uploaded); });

  auto stats = h.Engine().DrainOnce();
  assert(stats.uploaded == 1);
  assert(stats.bytes == 120);

  const auto key = h.KeyOf(id);
  assert(key == "vehicle-001/2024-06-15/ros/sub/a.log");
  assert(h.store->Has(key));
  assert(h.store->Body(key) == ReadFile(id.path));
  assert(h.store->put_calls == 1);
  assert(h.store->part_calls == 0);

  // registered, then removed from the queue
  assert(h.registry->ShouldSkip(id, h.now));
  assert(h.registry->Find(id)->remote_key == key);
  assert(!h.queue->Contains(id));
  assert(h.queue->Depth() == 0);

  assert(hooked.size() == 1 && hooked[0] == id);
  assert(h.metrics->Counter(metric::kFilesUploaded) == 1);
  assert(h.metrics->Counter(metric::kBytesUploaded) == 120);
  assert(h.metrics->Gauge(metric::kQueueDepth) == 0.0);
  assert(h.Engine().total_uploaded() == 1);

  // nothing left to do
  assert(h.Engine().DrainOnce().uploaded == 0);
}

void TestLargeFileGoesMultipart() {
  Harness h("engine_multipart");
  auto    id = h.Queue("big.bag", 1200);

  auto stats = h.Engine().DrainOnce();
  assert(stats.uploaded == 1);
  assert(h.store->put_calls == 0);
  assert(h.store->completed == 1);
  assert(h.store->last_part_count == 3);
  assert(h.store->Body(h.KeyOf(id)) == ReadFile(id.path));
  assert(h.store->OpenSessions() == 0);
}

void TestThresholdSizedFileIsSinglePut() {
  Harness h("engine_threshold");
  auto    at_threshold = h.Queue("exact.bag", 1000);
  auto    above        = h.Queue("above.bag", 1001);

  auto stats = h.Engine().DrainOnce();
  assert(stats.uploaded == 2);
  assert(h.store->put_calls == 1);
  assert(h.store->completed == 1);
  assert(h.store->Body(h.KeyOf(at_threshold)) == ReadFile(at_threshold.path));
  assert(h.store->Body(h.KeyOf(above)) == ReadFile(above.path));
}

void TestFailedPartIsRetriedInPlace() {
  Harness h("engine_part_retry");
  auto    id = h.Queue("big.bag", 1200);
  h.store->FailNext(FakeObjectStore::Op::kPart, ErrorKind::kNetwork);

  auto stats = h.Engine().DrainOnce();
  assert(stats.uploaded == 1);
  assert(h.store->part_calls == 4);
  assert(h.store->aborted == 0);
  assert(h.store->Body(h.KeyOf(id)) == ReadFile(id.path));
}

void TestExhaustedPartRetriesAbortAndBackOff() {
  Harness h("engine_part_exhausted");
  auto    id = h.Queue("big.bag", 1200);
  // initial try plus two retries
  h.store->FailNext(FakeObjectStore::Op::kPart, ErrorKind::kNetwork, 3);

  auto stats = h.Engine().DrainOnce();
  assert(stats.retried == 1);
  assert(h.store->aborted == 1);
  assert(h.store->OpenSessions() == 0);
  assert(h.store->ObjectCount() == 0);
  assert(h.metrics->Counter(metric::kUploadFailures, {{"kind", "network"}}) == 1);

  auto entry = h.queue->Snapshot().at(0);
  assert(entry.status == logship::model::EntryStatus::kPending);
  assert(entry.attempt_count == 1);
  assert(entry.last_error_kind == ErrorKind::kNetwork);

  // not due until the backoff elapses
  assert(h.Engine().DrainOnce().uploaded == 0);
  h.now += 1s;
  assert(h.Engine().DrainOnce().uploaded == 1);
  assert(h.store->Has(h.KeyOf(id)));
}

void TestBrokenSessionAbortsWithoutPartRetries() {
  Harness h("engine_broken_session");
  auto    id = h.Queue("big.bag", 1200);
  h.store->BreakNextPart();

  auto stats = h.Engine().DrainOnce();
  assert(stats.retried == 1);
  assert(h.store->part_calls == 1);
  assert(h.store->aborted == 1);
  assert(h.store->OpenSessions() == 0);
  assert(h.store->ObjectCount() == 0);

  auto entry = h.queue->Snapshot().at(0);
  assert(entry.attempt_count == 1);
  assert(entry.last_error_kind == ErrorKind::kNetwork);

  // a fresh session on the next due attempt
  h.now += 1s;
  assert(h.Engine().DrainOnce().uploaded == 1);
  assert(h.store->Body(h.KeyOf(id)) == ReadFile(id.path));
}

void TestPermanentPartErrorAborts() {
  Harness h("engine_part_permanent");
  h.Queue("big.bag", 1200);
  h.store->FailNext(FakeObjectStore::Op::kPart, ErrorKind::kBucketMissing);

  auto stats = h.Engine().DrainOnce();
  assert(stats.failed == 1);
  assert(h.store->aborted == 1);
  assert(h.store->ObjectCount() == 0);
  assert(h.queue->PermanentlyFailedCount() == 1);
  assert(h.Engine().total_failed() == 1);
}

void TestAuthFailureStopsTheDrain() {
  Harness h("engine_auth");
  auto    a = h.Queue("a.log", 10);
  auto    b = h.Queue("b.log", 10);
  auto    c = h.Queue("c.log", 10);
  h.store->FailNext(FakeObjectStore::Op::kPut, ErrorKind::kAuth);

  auto stats = h.Engine().DrainOnce();
  assert(stats.auth_failed);
  assert(stats.failed == 1);
  assert(stats.released == 2);
  assert(stats.uploaded == 0);
  assert(h.store->put_calls == 1);

  // the rest were never attempted
  assert(h.queue->PermanentlyFailedCount() == 1);
  assert(h.queue->Depth() == 2);
  for (const auto& entry : h.queue->Snapshot()) {
    if (entry.identity == a) continue;
    assert(entry.status == logship::model::EntryStatus::kPending);
    assert(entry.attempt_count == 0);
  }

  auto retry = h.Engine().DrainOnce();
  assert(retry.uploaded == 2);
  assert(h.store->Has(h.KeyOf(b)) && h.store->Has(h.KeyOf(c)));
  assert(!h.store->Has(h.KeyOf(a)));
}

void TestRegisteredFileIsSkipped() {
  Harness h("engine_skip");
  auto    id = h.Queue("a.log", 10);
  h.registry->Record(id, h.KeyOf(id), h.now - 1h);

  auto stats = h.Engine().DrainOnce();
  assert(stats.skipped == 1);
  assert(h.store->put_calls == 0);
  assert(h.queue->Depth() == 0);
}

void TestRemoteCopyIsRecordedWithoutUpload() {
  Harness h("engine_remote_copy");
  auto    present = h.Queue("present.log", 10);
  auto    partial = h.Queue("partial.log", 10);
  h.store->Seed(h.KeyOf(present), std::string(10, 'x'));
  h.store->Seed(h.KeyOf(partial), std::string(4, 'x'));

  std::vector<FileIdentity> hooked;
  h.Engine().SetUploadedHook([&](const FileIdentity& uploaded, logship::util::TimePoint) { hooked.push_back(uploaded); });

  auto stats = h.Engine().DrainOnce();
  assert(stats.skipped == 1);
  assert(stats.uploaded == 1);
  // only the size mismatch is sent again
  assert(h.store->put_calls == 1);
  assert(h.store->Body(h.KeyOf(partial)) == ReadFile(partial.path));
  assert(h.registry->ShouldSkip(present, h.now));
  assert(h.registry->ShouldSkip(partial, h.now));
  assert(h.queue->Depth() == 0);
  assert(hooked.size() == 2);
}

void TestChangedFileIsSuperseded() {
  Harness h("engine_superseded");
  auto    id = h.Queue("a.log", 10);
  WriteFileOfSize(id.path, 25);

  auto stats = h.Engine().DrainOnce();
  assert(stats.superseded == 1);
  assert(h.store->ObjectCount() == 0);
  assert(!h.queue->Contains(id));
  assert(h.queue->PermanentlyFailedCount() == 0);
}

void TestVanishedFileFailsPermanently() {
  Harness h("engine_vanished");
  auto    id = h.Queue("a.log", 10);
  std::filesystem::remove(id.path);

  auto stats = h.Engine().DrainOnce();
  assert(stats.failed == 1);
  assert(h.queue->PermanentlyFailedCount() == 1);
  assert(h.queue->Snapshot().at(0).last_error_kind == ErrorKind::kSourceVanished);
  assert(h.metrics->Counter(metric::kUploadFailures, {{"kind", "source_vanished"}}) == 1);
}

void TestOversizedFileIsRejected() {
  Harness h("engine_too_large");
  h.options.transfer.max_object_bytes = 100;
  h.Queue("a.log", 200);

  auto stats = h.Engine().DrainOnce();
  assert(stats.failed == 1);
  assert(h.store->put_calls == 0);
  assert(h.queue->Snapshot().at(0).last_error_kind == ErrorKind::kTooLarge);
}

void TestSymlinkEscapeIsRefused() {
  Harness h("engine_escape");
  WriteFile(h.dir / "outside/secret.log", "secret");
  std::filesystem::create_directory_symlink(h.dir / "outside", h.logs / "link");
  auto id = *logship::model::StatIdentity(h.logs / "link/secret.log");
  h.queue->Enqueue(id, h.now);

  auto stats = h.Engine().DrainOnce();
  assert(stats.failed == 1);
  assert(h.store->ObjectCount() == 0);
  assert(h.queue->Snapshot().at(0).last_error_kind == ErrorKind::kPathEscape);
}

void TestUnrecordedUploadStaysQueued() {
  Harness h("engine_registry_failure");
  auto    id = h.Queue("a.log", 10);
  // a directory where the registry document should go
  std::filesystem::create_directories(h.dir / "registry.json");

  auto stats = h.Engine().DrainOnce();
  assert(stats.released == 1);
  assert(h.store->Has(h.KeyOf(id)));
  assert(h.queue->Contains(id));
  assert(h.registry->Size() == 0);

  // the object from the first attempt is found, not sent again
  std::filesystem::remove(h.dir / "registry.json");
  stats = h.Engine().DrainOnce();
  assert(stats.skipped == 1);
  assert(h.store->put_calls == 1);
  assert(h.store->ObjectCount() == 1);
  assert(h.registry->ShouldSkip(id, h.now));
}

void TestCancelledTransferAborts() {
  TempDir dir("engine_cancel");
  WriteFileOfSize(dir / "big.bag", 1000);
  auto id = *logship::model::StatIdentity(dir / "big.bag");

  FakeObjectStore                  store;
  logship::upload::TransferOptions options;
  options.multipart_threshold_bytes = 100;
  options.part_size_bytes           = 100;

  bool threw = false;
  try {
    logship::upload::TransferFile(store, id, "k", options, [] { return true; });
  } catch (const logship::upload::TransferCancelled&) {
    threw = true;
  }
  assert(threw);
  assert(store.aborted == 1);
  assert(store.part_calls == 0);
  assert(store.ObjectCount() == 0);
}

void TestStoppedEngineRefusesDrains() {
  Harness h("engine_stopped");
  h.Queue("a.log", 10);
  h.Engine().Stop(1s);

  auto stats = h.Engine().DrainOnce();
  assert(stats.uploaded == 0 && stats.released == 0);
  assert(h.store->put_calls == 0);
  assert(h.queue->Depth() == 1);
}

void TestRequestedDrainRunsInBackground() {
  Harness h("engine_request");
  auto    id = h.Queue("bg.log", 64);

  h.Engine().RequestDrain();
  const auto key      = h.KeyOf(id);
  const auto deadline = std::chrono::steady_clock::now() + 5s;
  while (h.queue->Depth() != 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(10ms);
  }
  assert(h.queue->Depth() == 0);
  assert(h.registry->Find(id)->remote_key == key);
  assert(h.store->Has(key));

  h.Engine().Stop(1s);
  h.Engine().RequestDrain();
}

} // namespace

int main() {
  logship::testing::UseUtc();

  TestRemoteKeyLayout();
  TestSmallFileIsPut();
  TestLargeFileGoesMultipart();
  TestThresholdSizedFileIsSinglePut();
  TestFailedPartIsRetriedInPlace();
  TestExhaustedPartRetriesAbortAndBackOff();
  TestBrokenSessionAbortsWithoutPartRetries();
  TestPermanentPartErrorAborts();
  TestAuthFailureStopsTheDrain();
  TestRegisteredFileIsSkipped();
  TestRemoteCopyIsRecordedWithoutUpload();
  TestChangedFileIsSuperseded();
  TestVanishedFileFailsPermanently();
  TestOversizedFileIsRejected();
  TestSymlinkEscapeIsRefused();
  TestUnrecordedUploadStaysQueued();
  TestCancelledTransferAborts();
  TestStoppedEngineRefusesDrains();
  TestRequestedDrainRunsInBackground();

  std::cout << "logship_unit_upload_engine: pass\n";
  return 0;
}
