/**
 * @file ValidationSequencer.cpp
 * @brief Ordered pre-mount validation stages and report assembly.
 */

#include "SdGate/SdGate.h"

#include "SdGate/Diagnosis.h"

#include "Log.h"
#include "Pacing.h"
#include "SdProtocol.h"

namespace SdGate {

TimeBudget ValidationSequencer::budgetFrom(const SdGateConfig& config) {
  TimeBudget budget;
  budget.commMs = config.commBudgetMs;
  budget.mbrMs = config.mbrBudgetMs;
  budget.multiblockMs = config.multiblockBudgetMs;
  return budget;
}

ReadinessReport ValidationSequencer::validate(SdSpiBlockDevice& device,
                                              const TimeBudget& budget) {
  return run(device, budget, true);
}

ReadinessReport ValidationSequencer::validate(SdSpiBlockDevice& device) {
  return run(device, budgetFrom(device.handle().config()), true);
}

ReadinessReport ValidationSequencer::readMbrOnly(SdSpiBlockDevice& device,
                                                 const TimeBudget& budget) {
  return run(device, budget, false);
}

ReadinessReport ValidationSequencer::run(SdSpiBlockDevice& device, const TimeBudget& budget,
                                         bool includeMultiblock) {
  ReadinessReport report;
  HardwareHandle& handle = device.handle();
  const SdGateConfig& cfg = handle.config();
  IClock& clock = handle.clock();
  report.expectedNominalBytes = cfg.expectedNominalBytes;

  if (handle.poisoned()) {
    report.handlePoisoned = true;
    report.initError = InitError::BusUnavailable;
    handle.setLastError(ErrorCode::Poisoned, Operation::Validate, 0, INVALID_BLOCK);
    internal::logf(cfg, LogLevel::Warn, "validation refused: handle poisoned, rebuild first");
    return report;
  }

  const uint32_t startMs = clock.millis();
  if (runCommProbe(device, budget.commMs, &report) &&
      runMbrRead(device, budget.mbrMs, &report) && includeMultiblock) {
    runMultiblockRead(device, budget.multiblockMs, &report);
  }
  report.handlePoisoned = handle.poisoned();
  report.elapsed.totalMs = internal::elapsedMs(startMs, clock.millis());

  internal::logf(cfg, LogLevel::Info, "validation %s: comm=%d mbr=%d multiblock=%d (%lu ms)",
                 verdictToStr(classifyReadiness(report)), report.commInitOk ? 1 : 0,
                 report.mbrReadOk ? 1 : 0, report.multiblockReadOk ? 1 : 0,
                 static_cast<unsigned long>(report.elapsed.totalMs));
  return report;
}

bool ValidationSequencer::runCommProbe(SdSpiBlockDevice& device, uint32_t budgetMs,
                                       ReadinessReport* report) {
  HardwareHandle& handle = device.handle();
  const SdGateConfig& cfg = handle.config();
  IClock& clock = handle.clock();
  const uint32_t startMs = clock.millis();

  if (!handle.claimed() && handle.claim() != ErrorCode::Ok) {
    report->initError = InitError::BusUnavailable;
    report->elapsed.commMs = internal::elapsedMs(startMs, clock.millis());
    return false;
  }

  const Deadline deadline(clock, budgetMs);
  CardIdentity identity;
  report->initError = device.initialize(&identity, &deadline);
  report->elapsed.commMs = internal::elapsedMs(startMs, clock.millis());
  if (report->initError != InitError::Ok) {
    internal::logf(cfg, LogLevel::Error, "comm probe failed: %s after %lu ms",
                   initErrorToStr(report->initError),
                   static_cast<unsigned long>(report->elapsed.commMs));
    return false;
  }

  report->commInitOk = true;
  report->identity = identity;
  report->blockCount = identity.blockCount;
  report->reportedCapacityBytes = identity.capacityBytes;
  report->nominalClassBytes = nominalCapacityClass(identity.capacityBytes);
  report->capacityMismatch = SdGate::capacityMismatch(identity.capacityBytes,
                                                      cfg.expectedNominalBytes);

  internal::logf(cfg, LogLevel::Info, "comm probe ok: %s, %lu blocks, %llu MB in %lu ms",
                 cardTypeToStr(identity.type), static_cast<unsigned long>(identity.blockCount),
                 static_cast<unsigned long long>(identity.capacityBytes / (1024ULL * 1024ULL)),
                 static_cast<unsigned long>(report->elapsed.commMs));
  if (report->capacityMismatch) {
    internal::logf(cfg, LogLevel::Warn,
                   "capacity mismatch: card reports %llu bytes, expected about %llu",
                   static_cast<unsigned long long>(identity.capacityBytes),
                   static_cast<unsigned long long>(cfg.expectedNominalBytes));
  }
  return true;
}

bool ValidationSequencer::runMbrRead(SdSpiBlockDevice& device, uint32_t budgetMs,
                                     ReadinessReport* report) {
  HardwareHandle& handle = device.handle();
  const SdGateConfig& cfg = handle.config();
  IClock& clock = handle.clock();
  const uint32_t startMs = clock.millis();

  const Deadline deadline(clock, budgetMs);
  const ReadError err = device.readBlockUntil(0, _block, &deadline);
  report->mbrReadError = err;
  report->elapsed.mbrMs = internal::elapsedMs(startMs, clock.millis());

  if (err == ReadError::Cancelled) {
    report->mbrHung = true;
    handle.poison(Operation::Validate, 0);
    internal::logf(cfg, LogLevel::Error, "MBR read hung for %lu ms",
                   static_cast<unsigned long>(report->elapsed.mbrMs));
    return false;
  }
  if (err != ReadError::Ok) {
    internal::logf(cfg, LogLevel::Error, "MBR read failed: %s", readErrorToStr(err));
    return false;
  }

  report->mbrReadOk = true;
  report->mbrSignature[0] = _block[internal::MBR_SIGNATURE_OFFSET];
  report->mbrSignature[1] = _block[internal::MBR_SIGNATURE_OFFSET + 1];
  report->mbrSignatureValid = internal::mbrSignatureValid(_block);
  report->partitionTypeByte = _block[internal::MBR_PARTITION_TYPE_OFFSET];
  report->partitionType = internal::classifyPartition(report->partitionTypeByte);

  internal::logf(cfg, LogLevel::Info, "MBR ok: signature %02X %02X, partition 0x%02X (%s)",
                 static_cast<unsigned>(report->mbrSignature[0]),
                 static_cast<unsigned>(report->mbrSignature[1]),
                 static_cast<unsigned>(report->partitionTypeByte),
                 partitionTypeName(report->partitionTypeByte));
  if (!report->mbrSignatureValid) {
    internal::logf(cfg, LogLevel::Warn, "no boot signature in block 0");
  }
  return true;
}

void ValidationSequencer::runMultiblockRead(SdSpiBlockDevice& device, uint32_t budgetMs,
                                            ReadinessReport* report) {
  HardwareHandle& handle = device.handle();
  const SdGateConfig& cfg = handle.config();
  IClock& clock = handle.clock();
  const uint32_t startMs = clock.millis();
  report->multiblockAttempted = true;

  // Blocks 1..count, never past the end of the card.
  const uint32_t blocks = device.blockCount();
  uint32_t count = cfg.multiblockCount;
  if (blocks <= 1) {
    count = 0;
  } else if (count > blocks - 1) {
    count = blocks - 1;
  }

  const Deadline deadline(clock, budgetMs);
  for (uint32_t index = 1; index <= count; ++index) {
    const ReadError err = device.readBlockUntil(index, _block, &deadline);
    if (err != ReadError::Ok) {
      report->multiblockReadError = err;
      report->multiblockFailedBlock = index;
      report->elapsed.multiblockMs = internal::elapsedMs(startMs, clock.millis());
      if (err == ReadError::Cancelled) {
        report->multiblockHung = true;
        handle.poison(Operation::Validate, index);
      }
      internal::logf(cfg, LogLevel::Warn, "sustained read failed at block %lu: %s",
                     static_cast<unsigned long>(index), readErrorToStr(err));
      return;
    }
    report->multiblockBlocksRead++;
  }

  report->multiblockReadOk = true;
  report->elapsed.multiblockMs = internal::elapsedMs(startMs, clock.millis());
  internal::logf(cfg, LogLevel::Info, "sustained read ok: %u blocks in %lu ms",
                 static_cast<unsigned>(report->multiblockBlocksRead),
                 static_cast<unsigned long>(report->elapsed.multiblockMs));
}

}  // namespace SdGate
