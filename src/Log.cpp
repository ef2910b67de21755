/**
 * @file Log.cpp
 * @brief Log routing and verbosity filter.
 */

#include "Log.h"

#include <stdarg.h>
#include <stdio.h>

namespace SdGate {
namespace internal {

static LogLevel maxLevelFor(Verbosity verbosity) {
  switch (verbosity) {
    case Verbosity::Silent:
      return LogLevel::Warn;
    case Verbosity::Diags:
      return LogLevel::Info;
    case Verbosity::Debug:
    default:
      return LogLevel::Debug;
  }
}

bool logEnabled(const SdGateConfig& cfg, LogLevel level) {
  if (!cfg.logCallback) {
    return false;
  }
  return static_cast<uint8_t>(level) <= static_cast<uint8_t>(maxLevelFor(cfg.verbosity));
}

void logf(const SdGateConfig& cfg, LogLevel level, const char* fmt, ...) {
  if (!fmt || !logEnabled(cfg, level)) {
    return;
  }
  char line[160];
  va_list args;
  va_start(args, fmt);
  vsnprintf(line, sizeof(line), fmt, args);
  va_end(args);
  cfg.logCallback(level, line, cfg.logUser);
}

}  // namespace internal
}  // namespace SdGate
