/**
 * @file Log.h
 * @brief Internal log helpers routed to SdGateConfig::logCallback.
 */

#pragma once

#include "SdGate/Config.h"

namespace SdGate {
namespace internal {

/// @brief True if a line at level would reach the callback.
bool logEnabled(const SdGateConfig& cfg, LogLevel level);

/// @brief Format and emit one log line (truncated to 160 bytes).
void logf(const SdGateConfig& cfg, LogLevel level, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

}  // namespace internal
}  // namespace SdGate
