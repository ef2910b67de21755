/**
 * @file MountOrchestrator.cpp
 * @brief Report-gated filesystem mount, settle, cache priming and paced queries.
 */

#include "SdGate/SdGate.h"

#include "SdGate/Diagnosis.h"

#include "Log.h"
#include "Pacing.h"

namespace SdGate {

MountOrchestrator::MountOrchestrator(IFilesystem& fs, IClock& clock, const SdGateConfig& config)
    : _fs(fs), _clock(clock), _config(config) {
  if (!_config.mountPoint || _config.mountPoint[0] == '\0') {
    _config.mountPoint = "/sd";
  }
}

MountError MountOrchestrator::mount(SdSpiBlockDevice& device, HardwareHandle& handle,
                                    const ReadinessReport& report, MountSession* out) {
  if (!out || &device.handle() != &handle) {
    handle.setLastError(ErrorCode::InvalidArgument, Operation::Mount, 0, INVALID_BLOCK);
    return MountError::InvalidArgument;
  }

  // The filesystem is never touched unless block 0 was read on this handle generation.
  if (!report.mountable() || handle.poisoned() || !handle.claimed() || !device.ready()) {
    handle.setLastError(ErrorCode::MountFailed, Operation::Mount, 0, INVALID_BLOCK);
    internal::logf(_config, LogLevel::Error, "mount refused: %s",
                   verdictToStr(classifyReadiness(report)));
    return MountError::Unmountable;
  }
  if (handle.mounted()) {
    return MountError::AlreadyMounted;
  }

  const uint32_t startMs = _clock.millis();
  if (!_fs.mount(device, _config.mountPoint, _config.readOnly)) {
    handle.setLastError(ErrorCode::MountFailed, Operation::Mount, 0, INVALID_BLOCK);
    internal::logf(_config, LogLevel::Error, "filesystem mount failed at %s",
                   _config.mountPoint);
    return MountError::FilesystemMountFailed;
  }
  handle.setMounted(true);

  if (_config.settleDelayMs > 0) {
    _clock.delay(_config.settleDelayMs);
  }

  if (_config.primeDirectoryCache) {
    const int32_t entries = _fs.listDirectory(_config.mountPoint, nullptr, nullptr);
    _lastQueryMs = _clock.millis();
    _queried = true;
    if (entries < 0) {
      internal::logf(_config, LogLevel::Warn, "directory cache priming failed");
    } else {
      internal::logf(_config, LogLevel::Debug, "directory cache primed (%ld entries)",
                     static_cast<long>(entries));
    }
  }

  const uint32_t tookMs = internal::elapsedMs(startMs, _clock.millis());
  if (_config.mountTimeoutMs > 0 && tookMs > _config.mountTimeoutMs) {
    _fs.unmount(_config.mountPoint);
    handle.setMounted(false);
    _queried = false;
    handle.setLastError(ErrorCode::Timeout, Operation::Mount, 0, INVALID_BLOCK);
    internal::logf(_config, LogLevel::Error, "mount took %lu ms (limit %lu)",
                   static_cast<unsigned long>(tookMs),
                   static_cast<unsigned long>(_config.mountTimeoutMs));
    return MountError::Timeout;
  }

  MountSession session;
  session.handle = &handle;
  session.report = report;
  session.mountPoint = _config.mountPoint;
  session.mountedAtMs = _clock.millis();
  session.mountDurationMs = tookMs;
  session.active = true;
  *out = session;

  internal::logf(_config, LogLevel::Info, "mounted %s (%s%s) in %lu ms", _config.mountPoint,
                 partitionTypeName(report.partitionTypeByte),
                 _config.readOnly ? ", read-only" : "", static_cast<unsigned long>(tookMs));
  return MountError::Ok;
}

void MountOrchestrator::unmount(MountSession& session) {
  if (!session.active) {
    return;
  }
  _fs.unmount(session.mountPoint);
  session.active = false;
  if (session.handle) {
    session.handle->setMounted(false);
  }
  _queried = false;
  internal::logf(_config, LogLevel::Info, "unmounted %s", session.mountPoint);
}

void MountOrchestrator::pace() {
  const uint32_t waitMs = internal::paceWaitMs(_clock.millis(), _lastQueryMs, _queried,
                                               _config.minOperationIntervalMs);
  if (waitMs > 0) {
    internal::logf(_config, LogLevel::Debug, "pacing filesystem query: %lu ms",
                   static_cast<unsigned long>(waitMs));
    _clock.delay(waitMs);
  }
}

int32_t MountOrchestrator::listDirectory(const MountSession& session, const char* path,
                                         DirEntryCallback cb, void* user) {
  if (!session.active) {
    return -1;
  }
  pace();
  const int32_t entries = _fs.listDirectory(path ? path : session.mountPoint, cb, user);
  _lastQueryMs = _clock.millis();
  _queried = true;
  if (entries < 0) {
    internal::logf(_config, LogLevel::Warn, "listing %s failed", path ? path : session.mountPoint);
  }
  return entries;
}

bool MountOrchestrator::stats(const MountSession& session, FsStats* out) {
  if (!session.active || !out) {
    return false;
  }
  pace();
  const bool ok = _fs.stats(session.mountPoint, out);
  _lastQueryMs = _clock.millis();
  _queried = true;
  return ok;
}

int32_t MountOrchestrator::verifyStability(const MountSession& session, uint8_t iterations) {
  int32_t firstCount = -1;
  for (uint8_t pass = 1; pass <= iterations; ++pass) {
    const int32_t entries = listDirectory(session, nullptr);
    if (entries < 0) {
      internal::logf(_config, LogLevel::Error, "stability pass %u: listing failed",
                     static_cast<unsigned>(pass));
      return pass;
    }
    if (pass == 1) {
      firstCount = entries;
    } else if (entries != firstCount) {
      internal::logf(_config, LogLevel::Error, "stability pass %u: %ld entries, first pass had %ld",
                     static_cast<unsigned>(pass), static_cast<long>(entries),
                     static_cast<long>(firstCount));
      return pass;
    }
    internal::logf(_config, LogLevel::Debug, "stability pass %u: %ld entries",
                   static_cast<unsigned>(pass), static_cast<long>(entries));
  }
  internal::logf(_config, LogLevel::Info, "listing stable over %u passes",
                 static_cast<unsigned>(iterations));
  return -1;
}

}  // namespace SdGate
