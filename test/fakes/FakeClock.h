/**
 * @file FakeClock.h
 * @brief Manually advanced clock with microsecond resolution.
 */

#pragma once

#include <stdint.h>

#include "SdGate/Platform.h"

namespace SdGate {
namespace fakes {

class FakeClock : public IClock {
 public:
  explicit FakeClock(uint32_t startMs = 1000) : _nowUs(static_cast<uint64_t>(startMs) * 1000) {}

  uint32_t millis() const override { return static_cast<uint32_t>(_nowUs / 1000); }

  void delay(uint32_t ms) override {
    _delayCalls++;
    _delayedMs += ms;
    advanceMs(ms);
  }

  void advanceMs(uint32_t ms) { _nowUs += static_cast<uint64_t>(ms) * 1000; }
  void advanceUs(uint32_t us) { _nowUs += us; }

  uint32_t delayCalls() const { return _delayCalls; }
  uint32_t delayedMs() const { return _delayedMs; }

 private:
  uint64_t _nowUs = 0;
  uint32_t _delayCalls = 0;
  uint32_t _delayedMs = 0;
};

}  // namespace fakes
}  // namespace SdGate
