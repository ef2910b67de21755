/**
 * @file Diagnosis.cpp
 * @brief Verdict classification, guidance strings and name helpers.
 */

#include "SdGate/Diagnosis.h"

namespace SdGate {

namespace {

constexpr uint64_t MB = 1000ULL * 1000ULL;
constexpr uint64_t GB = 1000ULL * MB;

constexpr uint64_t NOMINAL_CLASSES[] = {
    128 * MB, 256 * MB, 512 * MB, 1 * GB,   2 * GB,   4 * GB,   8 * GB,
    16 * GB,  32 * GB,  64 * GB,  128 * GB, 256 * GB, 512 * GB, 1024 * GB};

int countDistinct(const int32_t* values, int n) {
  int distinct = 0;
  for (int i = 0; i < n; ++i) {
    bool seen = false;
    for (int j = 0; j < i; ++j) {
      if (values[j] == values[i]) {
        seen = true;
        break;
      }
    }
    if (!seen) {
      distinct++;
    }
  }
  return distinct;
}

}  // namespace

ReadinessVerdict classifyReadiness(const ReadinessReport& report) {
  if (!report.commInitOk) {
    if (report.handlePoisoned) {
      return ReadinessVerdict::HandlePoisoned;
    }
    switch (report.initError) {
      case InitError::NoCard:
        return ReadinessVerdict::NoCard;
      case InitError::Timeout:
        return ReadinessVerdict::InitTimeout;
      default:
        return ReadinessVerdict::InitFailed;
    }
  }
  if (report.mbrHung) {
    return ReadinessVerdict::ReadPathHung;
  }
  if (!report.mbrReadOk) {
    return ReadinessVerdict::ReadPathError;
  }
  if (report.multiblockAttempted && (report.multiblockHung || !report.multiblockReadOk)) {
    return ReadinessVerdict::SustainedReadFailure;
  }
  if (report.handlePoisoned) {
    return ReadinessVerdict::HandlePoisoned;
  }
  if (report.capacityMismatch) {
    return ReadinessVerdict::ReadyWithCapacityWarning;
  }
  return ReadinessVerdict::Ready;
}

const char* verdictGuidance(ReadinessVerdict verdict) {
  switch (verdict) {
    case ReadinessVerdict::Ready:
      return "Card is ready to mount.";
    case ReadinessVerdict::ReadyWithCapacityWarning:
      return "Card works but reports far less than its marketed size; it may be counterfeit. "
             "Back up data and replace it.";
    case ReadinessVerdict::NoCard:
      return "No card answered. Check insertion, wiring, CS pin and card power.";
    case ReadinessVerdict::InitTimeout:
      return "Card never finished initializing. Power-cycle the card or try a lower init clock.";
    case ReadinessVerdict::InitFailed:
      return "Card answered out of protocol. Check MISO wiring and pull-ups, or try another card.";
    case ReadinessVerdict::HandlePoisoned:
      return "A previous read hung. Rebuild the hardware handle, then validate again.";
    case ReadinessVerdict::ReadPathHung:
      return "Commands work but block reads hang. The card's SPI firmware is not compatible; "
             "use another card.";
    case ReadinessVerdict::ReadPathError:
      return "Block 0 could not be read. Lower the SPI clock or use another card.";
    case ReadinessVerdict::SustainedReadFailure:
      return "Card mounts but fails under sustained reads. Lower the SPI clock and check wiring.";
  }
  return "Unknown verdict.";
}

const char* verdictToStr(ReadinessVerdict verdict) {
  switch (verdict) {
    case ReadinessVerdict::Ready:
      return "Ready";
    case ReadinessVerdict::ReadyWithCapacityWarning:
      return "ReadyWithCapacityWarning";
    case ReadinessVerdict::NoCard:
      return "NoCard";
    case ReadinessVerdict::InitTimeout:
      return "InitTimeout";
    case ReadinessVerdict::InitFailed:
      return "InitFailed";
    case ReadinessVerdict::HandlePoisoned:
      return "HandlePoisoned";
    case ReadinessVerdict::ReadPathHung:
      return "ReadPathHung";
    case ReadinessVerdict::ReadPathError:
      return "ReadPathError";
    case ReadinessVerdict::SustainedReadFailure:
      return "SustainedReadFailure";
  }
  return "Unknown";
}

const char* partitionTypeName(uint8_t typeByte) {
  switch (typeByte) {
    case 0x01:
      return "FAT12";
    case 0x04:
      return "FAT16 <32MB";
    case 0x06:
      return "FAT16";
    case 0x07:
      return "NTFS/exFAT";
    case 0x0B:
      return "FAT32";
    case 0x0C:
      return "FAT32 LBA";
    case 0x0E:
      return "FAT16 LBA";
    case 0x83:
      return "Linux";
    default:
      return "Unknown";
  }
}

VisibilityFault classifyVisibility(const VisibilityObservation& obs) {
  const int32_t baseline = obs.immediateCount;
  const bool allCreated = obs.createdCount == obs.attempted;

  if (obs.createdCount == 0) {
    return VisibilityFault::WriteFailed;
  }
  if (allCreated && obs.afterWriteCount == 0) {
    return VisibilityFault::WriteInvisible;
  }
  if (allCreated && obs.afterWriteCount != baseline + obs.attempted) {
    return VisibilityFault::WrongCount;
  }
  const int32_t counts[] = {obs.immediateCount, obs.afterIdleCount, obs.afterWriteCount,
                            obs.afterDeleteCount, obs.finalCount};
  if (countDistinct(counts, 5) > 3) {
    return VisibilityFault::Inconsistent;
  }
  if (obs.immediateCount > 0 && obs.afterIdleCount == 0) {
    return VisibilityFault::IdleTimeout;
  }
  if (allCreated && obs.afterWriteCount == baseline + obs.attempted &&
      obs.deletedCount == obs.createdCount && obs.afterDeleteCount == baseline) {
    return VisibilityFault::None;
  }
  return VisibilityFault::Unexplained;
}

const char* visibilityGuidance(VisibilityFault fault) {
  switch (fault) {
    case VisibilityFault::None:
      return "Directory listings are consistent.";
    case VisibilityFault::WriteFailed:
      return "Card rejected every write. Try a lower SPI clock, check loose wires, or use "
             "another card.";
    case VisibilityFault::WriteInvisible:
      return "Written files vanished from listings. Use a much lower SPI clock; this board may "
             "not work with SD cards.";
    case VisibilityFault::WrongCount:
      return "Listings show the wrong number of files. Lower the SPI clock and check wiring.";
    case VisibilityFault::Inconsistent:
      return "Counts change on every listing (signal quality). Drop the SPI clock to about "
             "100 kHz or use another board.";
    case VisibilityFault::IdleTimeout:
      return "Files disappear after idling. Keep the card active with LivenessKeeper::tick() "
             "or lower the SPI clock.";
    case VisibilityFault::Unexplained:
      return "Counts do not match a known pattern. Re-run the check after a full power cycle.";
  }
  return "Unknown fault.";
}

const char* visibilityFaultToStr(VisibilityFault fault) {
  switch (fault) {
    case VisibilityFault::None:
      return "None";
    case VisibilityFault::WriteFailed:
      return "WriteFailed";
    case VisibilityFault::WriteInvisible:
      return "WriteInvisible";
    case VisibilityFault::WrongCount:
      return "WrongCount";
    case VisibilityFault::Inconsistent:
      return "Inconsistent";
    case VisibilityFault::IdleTimeout:
      return "IdleTimeout";
    case VisibilityFault::Unexplained:
      return "Unexplained";
  }
  return "Unknown";
}

uint64_t nominalCapacityClass(uint64_t bytes) {
  if (bytes == 0) {
    return 0;
  }
  for (uint64_t nominal : NOMINAL_CLASSES) {
    if (bytes <= nominal) {
      return nominal;
    }
  }
  return 0;
}

bool capacityMismatch(uint64_t reportedBytes, uint64_t expectedNominalBytes) {
  if (expectedNominalBytes == 0) {
    return false;
  }
  return reportedBytes * 2 <= expectedNominalBytes;
}

const char* errorCodeToStr(ErrorCode code) {
  switch (code) {
    case ErrorCode::Ok:
      return "Ok";
    case ErrorCode::Timeout:
      return "Timeout";
    case ErrorCode::BusNotAvailable:
      return "BusNotAvailable";
    case ErrorCode::NotClaimed:
      return "NotClaimed";
    case ErrorCode::Poisoned:
      return "Poisoned";
    case ErrorCode::CardInitFailed:
      return "CardInitFailed";
    case ErrorCode::IoError:
      return "IoError";
    case ErrorCode::MountFailed:
      return "MountFailed";
    case ErrorCode::InvalidArgument:
      return "InvalidArgument";
    case ErrorCode::NotReady:
      return "NotReady";
  }
  return "Unknown";
}

const char* initErrorToStr(InitError err) {
  switch (err) {
    case InitError::Ok:
      return "Ok";
    case InitError::Timeout:
      return "Timeout";
    case InitError::NoCard:
      return "NoCard";
    case InitError::BadResponse:
      return "BadResponse";
    case InitError::BusUnavailable:
      return "BusUnavailable";
  }
  return "Unknown";
}

const char* readErrorToStr(ReadError err) {
  switch (err) {
    case ReadError::Ok:
      return "Ok";
    case ReadError::IoError:
      return "IoError";
    case ReadError::Cancelled:
      return "Cancelled";
    case ReadError::NotReady:
      return "NotReady";
    case ReadError::OutOfRange:
      return "OutOfRange";
    case ReadError::InvalidArgument:
      return "InvalidArgument";
  }
  return "Unknown";
}

const char* mountErrorToStr(MountError err) {
  switch (err) {
    case MountError::Ok:
      return "Ok";
    case MountError::Unmountable:
      return "Unmountable";
    case MountError::FilesystemMountFailed:
      return "FilesystemMountFailed";
    case MountError::AlreadyMounted:
      return "AlreadyMounted";
    case MountError::InvalidArgument:
      return "InvalidArgument";
    case MountError::Timeout:
      return "Timeout";
  }
  return "Unknown";
}

const char* operationToStr(Operation op) {
  switch (op) {
    case Operation::None:
      return "None";
    case Operation::Claim:
      return "Claim";
    case Operation::Rebuild:
      return "Rebuild";
    case Operation::Command:
      return "Command";
    case Operation::Init:
      return "Init";
    case Operation::Read:
      return "Read";
    case Operation::Validate:
      return "Validate";
    case Operation::Mount:
      return "Mount";
    case Operation::Unmount:
      return "Unmount";
    case Operation::Keepalive:
      return "Keepalive";
  }
  return "Unknown";
}

const char* cardTypeToStr(CardType type) {
  switch (type) {
    case CardType::Unknown:
      return "Unknown";
    case CardType::Sd1:
      return "SD1";
    case CardType::Sd2:
      return "SD2";
    case CardType::SdHC:
      return "SDHC";
  }
  return "Unknown";
}

const char* keepaliveResultToStr(KeepaliveResult result) {
  switch (result) {
    case KeepaliveResult::Idle:
      return "Idle";
    case KeepaliveResult::Nudged:
      return "Nudged";
    case KeepaliveResult::Failed:
      return "Failed";
    case KeepaliveResult::Skipped:
      return "Skipped";
  }
  return "Unknown";
}

}  // namespace SdGate
