/**
 * @file Status.h
 * @brief Status, error and report types for SdGate.
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

namespace SdGate {

/// @brief Size of one addressable block in bytes.
static constexpr uint32_t BLOCK_SIZE = 512;

/// @brief Invalid block index marker.
static constexpr uint32_t INVALID_BLOCK = UINT32_MAX;

/// @brief General error code for handle operations and error snapshots.
enum class ErrorCode : uint16_t {
  Ok = 0,
  Timeout,
  BusNotAvailable,
  NotClaimed,
  Poisoned,
  CardInitFailed,
  IoError,
  MountFailed,
  InvalidArgument,
  NotReady
};

/// @brief Card bring-up errors.
enum class InitError : uint8_t {
  Ok = 0,
  Timeout,        ///< Initialization polling bound exceeded
  NoCard,         ///< Bus returned no response pattern at all
  BadResponse,    ///< Card answered, but not per protocol (echo, idle state, CSD)
  BusUnavailable  ///< Handle not claimed or poisoned
};

/// @brief Block read errors.
enum class ReadError : uint8_t {
  Ok = 0,
  IoError,         ///< Card returned an error token or a non-zero R1
  Cancelled,       ///< Caller deadline expired between exchanges
  NotReady,        ///< Not initialized, stale identity or poisoned handle
  OutOfRange,      ///< Block index beyond the reported block count
  InvalidArgument  ///< Null buffer
};

/// @brief Mount errors.
enum class MountError : uint8_t {
  Ok = 0,
  Unmountable,            ///< Report shows an unreadable data path; filesystem not called
  FilesystemMountFailed,  ///< Filesystem mount call returned failure
  AlreadyMounted,         ///< Handle already carries a mounted session
  InvalidArgument,        ///< Null output or device not bound to the handle
  Timeout                 ///< Mount, settle and priming exceeded mountTimeoutMs
};

/// @brief Operation enum for structured error reporting.
enum class Operation : uint8_t {
  None = 0,
  Claim,
  Rebuild,
  Command,
  Init,
  Read,
  Validate,
  Mount,
  Unmount,
  Keepalive
};

/// @brief SD card type.
enum class CardType : uint8_t {
  Unknown = 0,
  Sd1,
  Sd2,
  SdHC
};

/// @brief Partition type classes relevant for mounting.
enum class PartitionType : uint8_t {
  Unknown = 0,
  Fat32,    ///< 0x0B
  Fat32Lba  ///< 0x0C
};

/// @brief Outcome of one LivenessKeeper::tick().
enum class KeepaliveResult : uint8_t {
  Idle = 0,  ///< Below threshold, no bus traffic
  Nudged,    ///< Keepalive read succeeded
  Failed,    ///< Keepalive read failed
  Skipped    ///< Device not ready or handle poisoned
};

/// @brief Structured error info snapshot.
struct ErrorInfo {
  /// @brief Error code.
  ErrorCode code = ErrorCode::Ok;

  /// @brief Operation that failed.
  Operation op = Operation::None;

  /// @brief Raw card byte (R1 or data token), if available.
  int32_t detail = 0;

  /// @brief Timestamp of error (millis).
  uint32_t timestampMs = 0;

  /// @brief Block involved in the failure, or INVALID_BLOCK.
  uint32_t block = INVALID_BLOCK;
};

/// @brief Identity read from the card during initialization.
struct CardIdentity {
  /// @brief Card type (SD1/SD2/SDHC).
  CardType type = CardType::Unknown;

  /// @brief Total card blocks (512-byte units).
  uint32_t blockCount = 0;

  /// @brief Total card capacity in bytes.
  uint64_t capacityBytes = 0;

  /// @brief True if the card uses block addressing.
  bool highCapacity = false;

  /// @brief Raw OCR register.
  uint32_t ocr = 0;

  /// @brief CSD register bytes (16).
  uint8_t csd[16]{};
};

/// @brief Per-stage timing of one validation attempt (ms).
struct StageTimings {
  uint32_t commMs = 0;
  uint32_t mbrMs = 0;
  uint32_t multiblockMs = 0;
  uint32_t totalMs = 0;
};

/// @brief Per-stage validation budgets (ms, 0 = unbounded).
struct TimeBudget {
  uint32_t commMs = 0;
  uint32_t mbrMs = 0;
  uint32_t multiblockMs = 0;
};

/**
 * @brief Outcome of one validation attempt.
 *
 * A new attempt produces a new report. Partial reports are meaningful:
 * each stage records its own outcome.
 */
struct ReadinessReport {
  // Communication probe
  bool commInitOk = false;
  InitError initError = InitError::Ok;
  CardIdentity identity{};
  uint32_t blockCount = 0;
  uint64_t reportedCapacityBytes = 0;
  uint64_t nominalClassBytes = 0;
  uint64_t expectedNominalBytes = 0;
  bool capacityMismatch = false;

  // MBR read
  bool mbrReadOk = false;
  bool mbrHung = false;
  ReadError mbrReadError = ReadError::Ok;
  uint8_t mbrSignature[2]{};
  bool mbrSignatureValid = false;
  uint8_t partitionTypeByte = 0;
  PartitionType partitionType = PartitionType::Unknown;

  // Sustained read (not attempted by readMbrOnly or after an earlier failure)
  bool multiblockAttempted = false;
  bool multiblockReadOk = false;
  bool multiblockHung = false;
  uint8_t multiblockBlocksRead = 0;
  uint32_t multiblockFailedBlock = INVALID_BLOCK;
  ReadError multiblockReadError = ReadError::Ok;

  /// @brief True if the handle was (or became) poisoned during this attempt.
  bool handlePoisoned = false;

  /// @brief Per-stage timings.
  StageTimings elapsed{};

  /// @brief All three stages completed without a failure or hang.
  bool usable() const {
    return commInitOk && mbrReadOk && multiblockReadOk && !mbrHung && !multiblockHung &&
           !handlePoisoned;
  }

  /// @brief Data path proven readable; only this gates mounting.
  bool mountable() const { return commInitOk && mbrReadOk && !mbrHung && !handlePoisoned; }
};

/// @brief Filesystem usage snapshot.
struct FsStats {
  /// @brief Filesystem capacity in bytes.
  uint64_t totalBytes = 0;

  /// @brief Free bytes.
  uint64_t freeBytes = 0;

  /// @brief Used bytes.
  uint64_t usedBytes = 0;
};

/// @brief Directory entry callback (invoked synchronously per entry).
using DirEntryCallback = void (*)(const char* name, bool isDir, uint64_t size, void* user);

}  // namespace SdGate
