#include <unity.h>

#include <string.h>

#include "SdGate/SdGate.h"
#include "TestRig.h"

using SdGate::ErrorCode;
using SdGate::MountError;
using SdGate::MountOrchestrator;
using SdGate::MountSession;
using SdGate::ReadinessReport;

namespace {

void assertMount(MountError expected, MountError actual) {
  TEST_ASSERT_EQUAL_INT(static_cast<int>(expected), static_cast<int>(actual));
}

struct EntryTally {
  uint32_t files = 0;
  uint32_t dirs = 0;
};

void tallyEntry(const char* name, bool isDir, uint64_t /*size*/, void* user) {
  EntryTally* tally = static_cast<EntryTally*>(user);
  TEST_ASSERT_NOT_NULL(name);
  if (isDir) {
    tally->dirs++;
  } else {
    tally->files++;
  }
}

}  // namespace

void test_mount_after_block0_hang_is_refused_without_filesystem_call() {
  Rig rig;
  rig.card.setHangOnReadAttempt(1);
  rig.handle.claim();
  const ReadinessReport report = rig.validate();

  MountOrchestrator orchestrator(rig.fs, rig.clock, rig.handle.config());
  MountSession session;
  assertMount(MountError::Unmountable, orchestrator.mount(rig.device, rig.handle, report, &session));

  TEST_ASSERT_EQUAL_UINT32(0, rig.fs.mountCalls);
  TEST_ASSERT_FALSE(session.active);
  TEST_ASSERT_FALSE(rig.handle.mounted());
}

void test_mount_after_sustained_read_failure_succeeds() {
  Rig rig;
  rig.card.setErrorOnReadAttempt(2);
  rig.handle.claim();
  const ReadinessReport report = rig.validate();
  TEST_ASSERT_FALSE(report.multiblockReadOk);
  TEST_ASSERT_TRUE(report.mbrReadOk);

  MountOrchestrator orchestrator(rig.fs, rig.clock, rig.handle.config());
  MountSession session;
  assertMount(MountError::Ok, orchestrator.mount(rig.device, rig.handle, report, &session));

  TEST_ASSERT_EQUAL_UINT32(1, rig.fs.mountCalls);
  TEST_ASSERT_TRUE(rig.fs.lastReadOnly);
  TEST_ASSERT_EQUAL_STRING("/sd", rig.fs.lastMountPoint);
  TEST_ASSERT_TRUE(session.active);
  TEST_ASSERT_TRUE(session.handle == &rig.handle);
  TEST_ASSERT_FALSE(session.report.multiblockReadOk);
  TEST_ASSERT_EQUAL_STRING("/sd", session.mountPoint);
  TEST_ASSERT_TRUE(rig.handle.mounted());
}

void test_unmount_then_remount_reuses_handle() {
  Rig rig;
  rig.handle.claim();
  const ReadinessReport report = rig.validate();

  MountOrchestrator orchestrator(rig.fs, rig.clock, rig.handle.config());
  MountSession session;
  assertMount(MountError::Ok, orchestrator.mount(rig.device, rig.handle, report, &session));

  orchestrator.unmount(session);
  TEST_ASSERT_FALSE(session.active);
  TEST_ASSERT_FALSE(rig.handle.mounted());
  TEST_ASSERT_TRUE(rig.handle.claimed());

  orchestrator.unmount(session);
  TEST_ASSERT_EQUAL_UINT32(1, rig.fs.unmountCalls);

  MountSession again;
  assertMount(MountError::Ok, orchestrator.mount(rig.device, rig.handle, report, &again));
  TEST_ASSERT_TRUE(again.active);
  TEST_ASSERT_EQUAL_UINT32(2, rig.fs.mountCalls);
  TEST_ASSERT_EQUAL_UINT32(1, rig.card.claimCount());
  TEST_ASSERT_EQUAL_UINT32(0, rig.card.releaseCount());
}

void test_second_mount_on_mounted_handle_is_rejected() {
  Rig rig;
  rig.handle.claim();
  const ReadinessReport report = rig.validate();

  MountOrchestrator orchestrator(rig.fs, rig.clock, rig.handle.config());
  MountSession first;
  MountSession second;
  assertMount(MountError::Ok, orchestrator.mount(rig.device, rig.handle, report, &first));
  assertMount(MountError::AlreadyMounted,
              orchestrator.mount(rig.device, rig.handle, report, &second));
  TEST_ASSERT_EQUAL_UINT32(1, rig.fs.mountCalls);
  TEST_ASSERT_FALSE(second.active);
}

void test_mount_rejects_invalid_arguments() {
  Rig rig;
  rig.handle.claim();
  const ReadinessReport report = rig.validate();
  MountOrchestrator orchestrator(rig.fs, rig.clock, rig.handle.config());

  assertMount(MountError::InvalidArgument,
              orchestrator.mount(rig.device, rig.handle, report, nullptr));

  SdGate::fakes::FakeSdCard otherCard(rig.clock);
  SdGate::HardwareHandle otherHandle(otherCard, rig.clock, testConfig());
  MountSession session;
  assertMount(MountError::InvalidArgument,
              orchestrator.mount(rig.device, otherHandle, report, &session));
  TEST_ASSERT_EQUAL_UINT32(0, rig.fs.mountCalls);
}

void test_filesystem_mount_failure_is_reported() {
  Rig rig;
  rig.handle.claim();
  const ReadinessReport report = rig.validate();
  rig.fs.mountResult = false;

  MountOrchestrator orchestrator(rig.fs, rig.clock, rig.handle.config());
  MountSession session;
  assertMount(MountError::FilesystemMountFailed,
              orchestrator.mount(rig.device, rig.handle, report, &session));
  TEST_ASSERT_EQUAL_UINT32(1, rig.fs.mountCalls);
  TEST_ASSERT_FALSE(session.active);
  TEST_ASSERT_FALSE(rig.handle.mounted());
  TEST_ASSERT_EQUAL_INT(static_cast<int>(ErrorCode::MountFailed),
                        static_cast<int>(rig.handle.lastErrorInfo().code));
}

void test_mount_settles_and_primes_directory_cache() {
  Rig rig;
  rig.handle.claim();
  const ReadinessReport report = rig.validate();
  const uint32_t delayedBefore = rig.clock.delayedMs();

  MountOrchestrator orchestrator(rig.fs, rig.clock, rig.handle.config());
  MountSession session;
  assertMount(MountError::Ok, orchestrator.mount(rig.device, rig.handle, report, &session));

  TEST_ASSERT_TRUE(rig.clock.delayedMs() - delayedBefore >= 200);
  TEST_ASSERT_EQUAL_UINT32(1, rig.fs.listCalls);
  TEST_ASSERT_EQUAL_STRING("/sd", rig.fs.lastListPath);
  TEST_ASSERT_TRUE(session.mountDurationMs >= 200);
}

void test_mount_without_settle_or_priming() {
  SdGate::SdGateConfig cfg = testConfig();
  cfg.settleDelayMs = 0;
  cfg.primeDirectoryCache = false;
  Rig rig(cfg);
  rig.handle.claim();
  const ReadinessReport report = rig.validate();
  const uint32_t delayCalls = rig.clock.delayCalls();

  MountOrchestrator orchestrator(rig.fs, rig.clock, cfg);
  MountSession session;
  assertMount(MountError::Ok, orchestrator.mount(rig.device, rig.handle, report, &session));
  TEST_ASSERT_EQUAL_UINT32(delayCalls, rig.clock.delayCalls());
  TEST_ASSERT_EQUAL_UINT32(0, rig.fs.listCalls);
}

void test_slow_mount_times_out_and_unmounts() {
  SdGate::SdGateConfig cfg = testConfig();
  cfg.mountTimeoutMs = 100;
  Rig rig(cfg);
  rig.handle.claim();
  const ReadinessReport report = rig.validate();
  rig.fs.mountDelayMs = 500;

  MountOrchestrator orchestrator(rig.fs, rig.clock, cfg);
  MountSession session;
  assertMount(MountError::Timeout, orchestrator.mount(rig.device, rig.handle, report, &session));
  TEST_ASSERT_EQUAL_UINT32(1, rig.fs.unmountCalls);
  TEST_ASSERT_FALSE(rig.handle.mounted());
  TEST_ASSERT_FALSE(session.active);
}

void test_release_and_rebuild_refused_while_mounted() {
  Rig rig;
  rig.handle.claim();
  const ReadinessReport report = rig.validate();
  MountOrchestrator orchestrator(rig.fs, rig.clock, rig.handle.config());
  MountSession session;
  assertMount(MountError::Ok, orchestrator.mount(rig.device, rig.handle, report, &session));

  TEST_ASSERT_EQUAL_INT(static_cast<int>(ErrorCode::NotReady),
                        static_cast<int>(rig.handle.release()));
  TEST_ASSERT_EQUAL_INT(static_cast<int>(ErrorCode::NotReady),
                        static_cast<int>(rig.handle.rebuild()));
  TEST_ASSERT_TRUE(rig.handle.claimed());
  TEST_ASSERT_EQUAL_UINT32(0, rig.handle.generation());

  orchestrator.unmount(session);
  TEST_ASSERT_EQUAL_INT(static_cast<int>(ErrorCode::Ok), static_cast<int>(rig.handle.release()));
  TEST_ASSERT_FALSE(rig.card.claimed());
}

void test_stale_report_after_rebuild_is_unmountable() {
  Rig rig;
  rig.handle.claim();
  const ReadinessReport report = rig.validate();
  TEST_ASSERT_EQUAL_INT(static_cast<int>(ErrorCode::Ok), static_cast<int>(rig.handle.rebuild()));

  MountOrchestrator orchestrator(rig.fs, rig.clock, rig.handle.config());
  MountSession session;
  assertMount(MountError::Unmountable, orchestrator.mount(rig.device, rig.handle, report, &session));
  TEST_ASSERT_EQUAL_UINT32(0, rig.fs.mountCalls);
}

void test_filesystem_queries_are_paced() {
  Rig rig;
  rig.handle.claim();
  const ReadinessReport report = rig.validate();
  MountOrchestrator orchestrator(rig.fs, rig.clock, rig.handle.config());
  MountSession session;
  assertMount(MountError::Ok, orchestrator.mount(rig.device, rig.handle, report, &session));

  EntryTally tally;
  TEST_ASSERT_EQUAL_INT32(2, orchestrator.listDirectory(session, "/sd", tallyEntry, &tally));
  TEST_ASSERT_EQUAL_UINT32(1, tally.dirs);
  TEST_ASSERT_EQUAL_UINT32(1, tally.files);

  SdGate::FsStats stats;
  TEST_ASSERT_TRUE(orchestrator.stats(session, &stats));
  TEST_ASSERT_TRUE(stats.usedBytes == 2000000000ULL);

  // Priming listing, explicit listing, stats.
  TEST_ASSERT_EQUAL_UINT32(3, rig.fs.queryTimesMs.size());
  for (size_t i = 1; i < rig.fs.queryTimesMs.size(); ++i) {
    TEST_ASSERT_TRUE(rig.fs.queryTimesMs[i] - rig.fs.queryTimesMs[i - 1] >= 500);
  }

  // Already spaced: no extra delay.
  rig.clock.advanceMs(600);
  const uint32_t delayCalls = rig.clock.delayCalls();
  TEST_ASSERT_EQUAL_INT32(2, orchestrator.listDirectory(session, nullptr));
  TEST_ASSERT_EQUAL_UINT32(delayCalls, rig.clock.delayCalls());
  TEST_ASSERT_EQUAL_STRING("/sd", rig.fs.lastListPath);
}

void test_queries_on_inactive_session_fail() {
  Rig rig;
  rig.handle.claim();
  const ReadinessReport report = rig.validate();
  MountOrchestrator orchestrator(rig.fs, rig.clock, rig.handle.config());
  MountSession session;
  assertMount(MountError::Ok, orchestrator.mount(rig.device, rig.handle, report, &session));
  orchestrator.unmount(session);

  const uint32_t listCalls = rig.fs.listCalls;
  SdGate::FsStats stats;
  TEST_ASSERT_EQUAL_INT32(-1, orchestrator.listDirectory(session, "/sd"));
  TEST_ASSERT_FALSE(orchestrator.stats(session, &stats));
  TEST_ASSERT_EQUAL_UINT32(listCalls, rig.fs.listCalls);
  TEST_ASSERT_EQUAL_UINT32(0, rig.fs.statsCalls);
}

void test_repeated_listing_is_stable() {
  Rig rig;
  rig.handle.claim();
  const ReadinessReport report = rig.validate();
  MountOrchestrator orchestrator(rig.fs, rig.clock, rig.handle.config());
  MountSession session;
  assertMount(MountError::Ok, orchestrator.mount(rig.device, rig.handle, report, &session));
  const uint32_t listCalls = rig.fs.listCalls;
  const size_t queries = rig.fs.queryTimesMs.size();

  TEST_ASSERT_EQUAL_INT32(-1, orchestrator.verifyStability(session, 5));

  TEST_ASSERT_EQUAL_UINT32(listCalls + 5, rig.fs.listCalls);
  TEST_ASSERT_EQUAL_STRING("/sd", rig.fs.lastListPath);
  for (size_t i = queries; i < rig.fs.queryTimesMs.size(); ++i) {
    TEST_ASSERT_TRUE(rig.fs.queryTimesMs[i] - rig.fs.queryTimesMs[i - 1] >= 500);
  }
}

void test_unstable_listing_reports_first_failing_pass() {
  Rig rig;
  rig.handle.claim();
  const ReadinessReport report = rig.validate();
  MountOrchestrator orchestrator(rig.fs, rig.clock, rig.handle.config());
  MountSession session;
  assertMount(MountError::Ok, orchestrator.mount(rig.device, rig.handle, report, &session));

  // An entry disappears on the third pass.
  uint32_t listCalls = rig.fs.listCalls;
  rig.fs.dropEntryFromCall = listCalls + 3;
  TEST_ASSERT_EQUAL_INT32(3, orchestrator.verifyStability(session, 10));
  TEST_ASSERT_EQUAL_UINT32(listCalls + 3, rig.fs.listCalls);

  // A listing error on the second pass.
  rig.fs.dropEntryFromCall = 0;
  listCalls = rig.fs.listCalls;
  rig.fs.failListOnCall = listCalls + 2;
  TEST_ASSERT_EQUAL_INT32(2, orchestrator.verifyStability(session, 10));

  orchestrator.unmount(session);
  TEST_ASSERT_EQUAL_INT32(1, orchestrator.verifyStability(session, 3));
}
