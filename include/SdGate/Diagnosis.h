/**
 * @file Diagnosis.h
 * @brief Verdicts, operator guidance and name helpers for SdGate results.
 *
 * Everything here is pure: no bus access, no logging.
 */

#pragma once

#include <stdint.h>

#include "SdGate/Status.h"

namespace SdGate {

/// @brief Summary verdict for one ReadinessReport.
enum class ReadinessVerdict : uint8_t {
  Ready = 0,
  ReadyWithCapacityWarning,  ///< Readable, but smaller than the marketed size
  NoCard,                    ///< Nothing answered on the bus
  InitTimeout,               ///< Card never left the idle state
  InitFailed,                ///< Card answered out of protocol
  HandlePoisoned,            ///< Handle must be rebuilt before validating again
  ReadPathHung,              ///< Block 0 read never completed
  ReadPathError,             ///< Block 0 read failed
  SustainedReadFailure       ///< MBR fine, later block failed or hung
};

/// @brief Classify a report. Stage failures take priority in stage order.
ReadinessVerdict classifyReadiness(const ReadinessReport& report);

/// @brief Operator guidance for a verdict (static string).
const char* verdictGuidance(ReadinessVerdict verdict);

/// @brief Short verdict name (static string).
const char* verdictToStr(ReadinessVerdict verdict);

/// @brief Human name of an MBR partition type byte ("Unknown" if unlisted).
const char* partitionTypeName(uint8_t typeByte);

/**
 * @brief File counts observed around a write/list/delete cycle.
 *
 * The application gathers these on a mounted, writable filesystem; SdGate
 * only interprets them.
 */
struct VisibilityObservation {
  /// @brief Entries listed right after mount (baseline).
  int32_t immediateCount = 0;

  /// @brief Entries listed after an idle wait.
  int32_t afterIdleCount = 0;

  /// @brief Files the application managed to create.
  int32_t createdCount = 0;

  /// @brief Entries listed after writing and a short wait.
  int32_t afterWriteCount = 0;

  /// @brief Files the application managed to delete.
  int32_t deletedCount = 0;

  /// @brief Entries listed right after deleting.
  int32_t afterDeleteCount = 0;

  /// @brief Entries listed in a last pass.
  int32_t finalCount = 0;

  /// @brief Files the application tried to create.
  int32_t attempted = 10;
};

/// @brief File-visibility fault classes, in classification priority order.
enum class VisibilityFault : uint8_t {
  None = 0,
  WriteFailed,     ///< No file could be created
  WriteInvisible,  ///< Created files are not listed at all
  WrongCount,      ///< Listing shows a different number than written
  Inconsistent,    ///< Counts keep changing between listings
  IdleTimeout,     ///< Existing entries vanish after idling
  Unexplained      ///< No rule matched
};

/// @brief Classify an observation sequence.
VisibilityFault classifyVisibility(const VisibilityObservation& obs);

/// @brief Operator guidance for a visibility fault (static string).
const char* visibilityGuidance(VisibilityFault fault);

/// @brief Short fault name (static string).
const char* visibilityFaultToStr(VisibilityFault fault);

/**
 * @brief Smallest marketed size class (decimal units) holding bytes.
 * @return Class size in bytes, or 0 for 0 bytes or beyond 1 TB.
 */
uint64_t nominalCapacityClass(uint64_t bytes);

/**
 * @brief True if reported capacity is at most half the expected nominal size.
 * @note Advisory. expectedNominal == 0 never reports a mismatch.
 */
bool capacityMismatch(uint64_t reportedBytes, uint64_t expectedNominalBytes);

const char* errorCodeToStr(ErrorCode code);
const char* initErrorToStr(InitError err);
const char* readErrorToStr(ReadError err);
const char* mountErrorToStr(MountError err);
const char* operationToStr(Operation op);
const char* cardTypeToStr(CardType type);
const char* keepaliveResultToStr(KeepaliveResult result);

}  // namespace SdGate
