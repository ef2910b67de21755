/**
 * @file Pacing.h
 * @brief Internal timing helpers for elapsed time, idle detection and pacing.
 */

#pragma once

#include <stdint.h>

namespace SdGate {
namespace internal {

/// @brief Wrap-safe elapsed time.
inline uint32_t elapsedMs(uint32_t startMs, uint32_t nowMs) {
  return static_cast<uint32_t>(nowMs - startMs);
}

/// @brief True once strictly more than thresholdMs passed since lastActivityMs.
inline bool idleExceeded(uint32_t nowMs, uint32_t lastActivityMs, uint32_t thresholdMs) {
  return elapsedMs(lastActivityMs, nowMs) > thresholdMs;
}

/// @brief Wait needed before the next paced operation.
/// @return 0 if the operation may run now.
inline uint32_t paceWaitMs(uint32_t nowMs, uint32_t lastMs, bool hasLast,
                           uint32_t minIntervalMs) {
  if (!hasLast || minIntervalMs == 0) {
    return 0;
  }
  const uint32_t since = elapsedMs(lastMs, nowMs);
  return (since >= minIntervalMs) ? 0 : (minIntervalMs - since);
}

}  // namespace internal
}  // namespace SdGate
