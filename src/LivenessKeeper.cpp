/**
 * @file LivenessKeeper.cpp
 * @brief Idle-threshold keepalive read.
 */

#include "SdGate/SdGate.h"

#include "Log.h"
#include "Pacing.h"

namespace SdGate {

LivenessKeeper::LivenessKeeper(SdSpiBlockDevice& device)
    : _device(device), _idleThresholdMs(device.handle().config().keepaliveIdleMs) {}

LivenessKeeper::LivenessKeeper(SdSpiBlockDevice& device, uint32_t idleThresholdMs)
    : _device(device), _idleThresholdMs(idleThresholdMs) {}

KeepaliveResult LivenessKeeper::tick() {
  HardwareHandle& handle = _device.handle();
  if (!_device.ready()) {
    return KeepaliveResult::Skipped;
  }

  IClock& clock = handle.clock();
  if (!internal::idleExceeded(clock.millis(), handle.lastActivityMs(), _idleThresholdMs)) {
    return KeepaliveResult::Idle;
  }

  const SdGateConfig& cfg = handle.config();
  const Deadline deadline(clock, cfg.keepaliveReadBudgetMs);
  const ReadError err = _device.readBlockUntil(0, _scratch, &deadline);
  if (err == ReadError::Cancelled) {
    handle.poison(Operation::Keepalive, 0);
    return KeepaliveResult::Failed;
  }
  if (err != ReadError::Ok) {
    internal::logf(cfg, LogLevel::Warn, "keepalive read failed");
    return KeepaliveResult::Failed;
  }
  internal::logf(cfg, LogLevel::Debug, "keepalive read ok");
  return KeepaliveResult::Nudged;
}

}  // namespace SdGate
