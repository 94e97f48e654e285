#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <vector>

#include "internal/cleanup/deletion_gates.hpp"
#include "internal/cleanup/deletion_manager.hpp"
#include "internal/model/watch_rule.hpp"
#include "internal/registry/processed_registry.hpp"
#include "tests/unit/test_support.hpp"

namespace {

using namespace std::chrono_literals;
using logship::cleanup::DeletionManager;
using logship::cleanup::DiskPressure;
using logship::cleanup::FirstVeto;
using logship::cleanup::Gate;
using logship::model::DeletionPolicy;
using logship::model::DiskThresholds;
using logship::model::FileIdentity;
using logship::model::WatchRule;
using logship::testing::FixedNow;
using logship::testing::SetModificationTime;
using logship::testing::TempDir;
using logship::testing::WriteFile;
using logship::testing::WriteFileOfSize;

namespace metric = logship::observability::metric;

constexpr auto kDay = 24h;

WatchRule MakeRule(const std::filesystem::path& root) {
  WatchRule rule;
  rule.root   = root;
  rule.source = "ros";
  return rule;
}

DeletionPolicy NothingEnabled() {
  DeletionPolicy policy;
  policy.after_upload.enabled = false;
  policy.age_based.enabled    = false;
  policy.emergency.enabled    = false;
  return policy;
}

struct Fixture {
  explicit Fixture(const std::string& name) : dir(name), logs(dir.path() / "logs"), rule(MakeRule(dir.path() / "logs")) {
    std::filesystem::create_directories(logs);
    registry = std::make_shared<logship::registry::ProcessedRegistry>(dir / "registry.json", 30);
    metrics  = std::make_shared<logship::testing::RecordingMetricsPublisher>();
  }

  std::unique_ptr<DeletionManager> Manager(DeletionPolicy policy, DiskThresholds thresholds = {}, uint64_t disk_total = 1ULL << 40) {
    auto gauge   = std::make_shared<logship::testing::FakeDiskGauge>(disk_total, 0, logs);
    auto matcher = std::make_shared<const logship::model::RuleMatcher>(std::vector<WatchRule>{rule});
    return std::make_unique<DeletionManager>(policy, thresholds, matcher, registry, gauge, metrics);
  }

  // File of the given size and mtime, returned as it is on disk.
  FileIdentity Create(const std::string& name, size_t size, logship::util::TimePoint mtime) {
    const auto path = logs / name;
    WriteFileOfSize(path, size);
    SetModificationTime(path, mtime);
    return *logship::model::StatIdentity(path);
  }

  TempDir                                                      dir;
  std::filesystem::path                                        logs;
  WatchRule                                                    rule;
  std::shared_ptr<logship::registry::ProcessedRegistry>        registry;
  std::shared_ptr<logship::testing::RecordingMetricsPublisher> metrics;
};

void TestGatesVetoInOrder() {
  TempDir dir("deletion_gates");
  auto    rule = MakeRule(dir / "logs");
  WriteFile(dir / "logs/a.log", "x");
  WriteFile(dir / "logs/sub/b.log", "x");
  WriteFile(dir / "logs/c.txt", "x");

  assert(!FirstVeto(dir / "logs/a.log", rule));
  assert(!FirstVeto(dir / "logs/sub/b.log", rule));

  rule.pattern = "*.log";
  assert(FirstVeto(dir / "logs/c.txt", rule) == Gate::kPattern);

  rule.recursive = false;
  assert(FirstVeto(dir / "logs/sub/b.log", rule) == Gate::kRecursive);
  assert(!FirstVeto(dir / "logs/a.log", rule));

  // allow_deletion is checked before depth and pattern
  rule.allow_deletion = false;
  assert(FirstVeto(dir / "logs/a.log", rule) == Gate::kAllowDeletion);
  assert(FirstVeto(dir / "logs/c.txt", rule) == Gate::kAllowDeletion);

  // and the system path gate before everything
  auto etc           = MakeRule("/etc");
  etc.allow_deletion = false;
  assert(FirstVeto("/etc/hostname", etc) == Gate::kSystemPath);

  assert(logship::cleanup::ToString(Gate::kRecursive) == "recursive");
}

void TestSystemPathGate() {
  using logship::cleanup::IsProtectedSystemPath;

  assert(IsProtectedSystemPath("/usr/share/doc/readme"));
  assert(IsProtectedSystemPath("/etc/passwd"));
  assert(IsProtectedSystemPath("/var/lib/dpkg/status"));
  assert(IsProtectedSystemPath("/tmp/file.log"));
  assert(IsProtectedSystemPath("/var/log/syslog"));
  assert(IsProtectedSystemPath("/home/notes.txt"));
  assert(IsProtectedSystemPath("relative/file.log"));
  assert(IsProtectedSystemPath("/var/log/../../etc/shadow"));

  assert(!IsProtectedSystemPath("/var/log/ros/run.bag"));
  assert(!IsProtectedSystemPath("/home/robot/logs/run.bag"));
  assert(!IsProtectedSystemPath("/data/logs/run.bag"));
  assert(!IsProtectedSystemPath("/usrdata/run.bag"));

  // a symlinked directory inside the root that leads outside it
  TempDir dir("deletion_symlink");
  WriteFile(dir / "outside/secret.log", "x");
  std::filesystem::create_directories(dir / "logs");
  std::filesystem::create_directory_symlink(dir / "outside", dir / "logs/link");

  auto rule = MakeRule(dir / "logs");
  assert(FirstVeto(dir / "logs/link/secret.log", rule) == Gate::kSystemPath);
  assert(FirstVeto(dir / "logs/../outside/secret.log", rule) == Gate::kSystemPath);
}

void TestImmediateDeletionAfterUpload() {
  Fixture    fx("deletion_immediate");
  const auto now = FixedNow();
  auto       id  = fx.Create("a.log", 10, now - 1h);

  auto policy                   = NothingEnabled();
  policy.after_upload.enabled   = true;
  policy.after_upload.keep_days = 14;
  assert(!fx.Manager(policy)->OnUploaded(id, now));
  assert(std::filesystem::exists(id.path));

  policy.after_upload.keep_days = 0;
  auto manager                  = fx.Manager(policy);

  // the file was appended to after the upload: keep it
  FileIdentity stale = id;
  stale.size_bytes   = 5;
  assert(!manager->OnUploaded(stale, now));
  assert(std::filesystem::exists(id.path));

  assert(manager->OnUploaded(id, now));
  assert(!std::filesystem::exists(id.path));
  assert(manager->total_deleted() == 1);
  assert(fx.metrics->Counter(metric::kFilesDeleted, {{"policy", "after_upload"}}) == 1);

  // allow_deletion=false vetoes even an uploaded file
  fx.rule.allow_deletion = false;
  auto kept              = fx.Create("b.log", 10, now - 1h);
  assert(!fx.Manager(policy)->OnUploaded(kept, now));
  assert(std::filesystem::exists(kept.path));
}

void TestDeferredDeletionWaitsForKeepPeriod() {
  Fixture    fx("deletion_deferred");
  const auto now = FixedNow();

  auto uploaded  = fx.Create("uploaded.log", 10, now - 2h);
  auto rewritten = fx.Create("rewritten.log", 10, now - 2h);
  auto pending   = fx.Create("pending.log", 10, now - 2h);
  fx.registry->Record(uploaded, "k1", now);
  fx.registry->Record(rewritten, "k2", now);

  // a new file now lives at the uploaded path
  WriteFileOfSize(rewritten.path, 20);

  auto policy                   = NothingEnabled();
  policy.after_upload.enabled   = true;
  policy.after_upload.keep_days = 1;
  auto manager                  = fx.Manager(policy);

  assert(manager->RunDeferred(now + kDay - 1s) == 0);
  assert(std::filesystem::exists(uploaded.path));

  assert(manager->RunDeferred(now + kDay) == 1);
  assert(!std::filesystem::exists(uploaded.path));
  assert(std::filesystem::exists(rewritten.path));
  assert(std::filesystem::exists(pending.path));

  // records are left for the registry's own retention
  assert(fx.registry->Size() == 2);

  // a second pass finds nothing left to do
  assert(manager->RunDeferred(now + 2 * kDay) == 0);
}

void TestAgeSweepBoundary() {
  Fixture    fx("deletion_age");
  const auto now = FixedNow();

  auto exact = fx.Create("exact.log", 10, now - 7 * kDay);
  auto older = fx.Create("older.log", 10, now - 7 * kDay - 1s);
  auto fresh = fx.Create("fresh.log", 10, now - kDay);
  auto deep  = fx.Create("sub/deep.log", 10, now - 30 * kDay);
  WriteFile(fx.logs / ".hidden", "x");
  SetModificationTime(fx.logs / ".hidden", now - 30 * kDay);

  auto policy                   = NothingEnabled();
  policy.age_based.enabled      = true;
  policy.age_based.max_age_days = 7;
  auto manager                  = fx.Manager(policy);

  // never uploaded, deleted anyway
  assert(manager->RunAgeSweep(now) == 2);
  assert(std::filesystem::exists(exact.path));
  assert(!std::filesystem::exists(older.path));
  assert(std::filesystem::exists(fresh.path));
  assert(!std::filesystem::exists(deep.path));
  assert(std::filesystem::exists(fx.logs / ".hidden"));
  assert(fx.metrics->Counter(metric::kFilesDeleted, {{"policy", "age_based"}}) == 2);

  policy.age_based.max_age_days = 0;
  assert(fx.Manager(policy)->RunAgeSweep(now + 100 * kDay) == 0);
  assert(std::filesystem::exists(fresh.path));
}

void TestAgeSweepRespectsGates() {
  Fixture    fx("deletion_age_gates");
  const auto now = FixedNow();
  fx.rule.pattern   = "*.bag";
  fx.rule.recursive = false;

  auto bag   = fx.Create("run.bag", 10, now - 30 * kDay);
  auto text  = fx.Create("notes.txt", 10, now - 30 * kDay);
  auto below = fx.Create("sub/run.bag", 10, now - 30 * kDay);

  auto policy                   = NothingEnabled();
  policy.age_based.enabled      = true;
  policy.age_based.max_age_days = 1;
  assert(fx.Manager(policy)->RunAgeSweep(now) == 1);
  assert(!std::filesystem::exists(bag.path));
  assert(std::filesystem::exists(text.path));
  assert(std::filesystem::exists(below.path));
}

void TestDiskClassification() {
  Fixture fx("deletion_classify");

  DiskThresholds thresholds;
  thresholds.warning        = 0.80;
  thresholds.critical       = 0.90;
  thresholds.reserved_bytes = 50;
  auto manager              = fx.Manager(NothingEnabled(), thresholds, 1000);

  auto usage = [](uint64_t used) {
    logship::cleanup::DiskUsage u;
    u.total_bytes     = 1000;
    u.used_bytes      = used;
    u.available_bytes = 1000 - used;
    return u;
  };
  assert(manager->Classify(usage(100)) == DiskPressure::kNormal);
  assert(manager->Classify(usage(800)) == DiskPressure::kWarning);
  assert(manager->Classify(usage(900)) == DiskPressure::kCritical);

  // below the reserve is critical whatever the percentage
  thresholds.warning  = 0.98;
  thresholds.critical = 0.99;
  auto reserve        = fx.Manager(NothingEnabled(), thresholds, 1000);
  assert(reserve->Classify(usage(960)) == DiskPressure::kCritical);
  assert(reserve->Classify(usage(940)) == DiskPressure::kNormal);

  WriteFileOfSize(fx.logs / "a.log", 850);
  assert(manager->CheckDisk()->used_bytes == 850);
  assert(fx.metrics->Gauge(metric::kDiskUsagePercent) > 84.9);
}

void TestEmergencyDeletesOldestUploadedFirst() {
  Fixture    fx("deletion_emergency");
  const auto now = FixedNow();

  auto a = fx.Create("a.log", 100, now - 4 * kDay);
  auto b = fx.Create("b.log", 100, now - 3 * kDay);
  auto c = fx.Create("c.log", 100, now - 2 * kDay);
  auto d = fx.Create("d.log", 100, now - 1 * kDay);
  // oldest of all but never uploaded
  auto e = fx.Create("e.log", 150, now - 10 * kDay);
  for (const auto& id : {d, b, c, a}) {
    fx.registry->Record(id, "k", now);
  }

  DiskThresholds thresholds;
  thresholds.warning  = 0.30;
  thresholds.critical = 0.50;

  auto disabled = fx.Manager(NothingEnabled(), thresholds, 1000);
  assert(disabled->RunEmergency(now) == 0);

  auto policy              = NothingEnabled();
  policy.emergency.enabled = true;
  auto manager             = fx.Manager(policy, thresholds, 1000);

  // 550/1000 used; stops once usage drops below 30%
  assert(manager->RunEmergency(now) == 3);
  assert(!std::filesystem::exists(a.path));
  assert(!std::filesystem::exists(b.path));
  assert(!std::filesystem::exists(c.path));
  assert(std::filesystem::exists(d.path));
  assert(std::filesystem::exists(e.path));
  assert(fx.metrics->Counter(metric::kFilesDeleted, {{"policy", "emergency"}}) == 3);

  // 250/1000 is not critical
  assert(manager->RunEmergency(now) == 0);
}

void TestEmergencyStopsWhenCandidatesRunOut() {
  Fixture    fx("deletion_emergency_exhausted");
  const auto now = FixedNow();

  auto a = fx.Create("a.log", 100, now - 2 * kDay);
  fx.Create("big.log", 800, now - 5 * kDay);
  fx.registry->Record(a, "k", now);

  DiskThresholds thresholds;
  thresholds.warning  = 0.30;
  thresholds.critical = 0.50;
  auto policy              = NothingEnabled();
  policy.emergency.enabled = true;

  assert(fx.Manager(policy, thresholds, 1000)->RunEmergency(now) == 1);
  assert(std::filesystem::exists(fx.logs / "big.log"));
}

} // namespace

int main() {
  logship::testing::UseUtc();

  TestGatesVetoInOrder();
  TestSystemPathGate();
  TestImmediateDeletionAfterUpload();
  TestDeferredDeletionWaitsForKeepPeriod();
  TestAgeSweepBoundary();
  TestAgeSweepRespectsGates();
  TestDiskClassification();
  TestEmergencyDeletesOldestUploadedFirst();
  TestEmergencyStopsWhenCandidatesRunOut();

  std::cout << "logship_unit_deletion: pass\n";
  return 0;
}
