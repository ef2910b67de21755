/**
 * @file Platform.h
 * @brief Collaborator interfaces: SPI transport, clock, block device, filesystem.
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#include "SdGate/Status.h"

namespace SdGate {

/// @brief Pin and mode settings applied when a transport is claimed.
struct SpiBusSettings {
  int pinCs = -1;
  int pinMosi = -1;
  int pinMiso = -1;
  int pinSck = -1;
  bool autoInitSpi = false;
  uint8_t spiMode = 0;
};

/**
 * @brief Raw byte-oriented full-duplex SPI bus with one chip-select line.
 *
 * SdGate never owns the bus. The application provides a transport, and
 * exactly one HardwareHandle claims it at a time.
 */
class ISpiTransport {
 public:
  virtual ~ISpiTransport() = default;

  /// @brief Claim the chip-select pin (and the bus if autoInitSpi).
  /// @return false if the pin or bus is already claimed.
  virtual bool claim(const SpiBusSettings& settings) = 0;

  /// @brief Release the claim taken by claim().
  virtual void release() = 0;

  /// @brief Set the SPI clock rate for subsequent transactions.
  virtual void setClockHz(uint32_t hz) = 0;

  /// @brief Assert chip-select (begins a transaction).
  virtual void select() = 0;

  /// @brief Deassert chip-select (ends a transaction).
  virtual void deselect() = 0;

  /// @brief Exchange one byte.
  virtual uint8_t transfer(uint8_t out) = 0;

  /// @brief Exchange a run of bytes.
  /// @param tx Bytes to send, or nullptr to send 0xFF.
  /// @param rx Receive buffer, or nullptr to discard.
  virtual void transferBytes(const uint8_t* tx, uint8_t* rx, size_t len) {
    for (size_t i = 0; i < len; ++i) {
      const uint8_t in = transfer(tx ? tx[i] : 0xFF);
      if (rx) {
        rx[i] = in;
      }
    }
  }
};

/// @brief Millisecond clock.
class IClock {
 public:
  virtual ~IClock() = default;
  virtual uint32_t millis() const = 0;
  virtual void delay(uint32_t ms) = 0;
};

/**
 * @brief Cooperative deadline checked between bus exchanges.
 *
 * A zero budget never expires.
 */
class Deadline {
 public:
  Deadline() = default;
  Deadline(const IClock& clock, uint32_t budgetMs)
      : _clock(&clock), _expiresMs(clock.millis() + budgetMs), _bounded(budgetMs > 0) {}

  bool bounded() const { return _bounded; }

  bool expired() const {
    if (!_bounded || !_clock) {
      return false;
    }
    return static_cast<int32_t>(_clock->millis() - _expiresMs) >= 0;
  }

 private:
  const IClock* _clock = nullptr;
  uint32_t _expiresMs = 0;
  bool _bounded = false;
};

/// @brief Block storage addressed in BLOCK_SIZE units.
class IBlockDevice {
 public:
  virtual ~IBlockDevice() = default;

  /// @brief Reported block count (0 until initialized).
  virtual uint32_t blockCount() const = 0;

  /// @brief Read one block. No timeout, no retry.
  virtual ReadError readBlock(uint32_t index, uint8_t* buf) = 0;
};

/**
 * @brief External filesystem driver.
 *
 * SdGate hands it a validated block device and never calls mount()
 * when the data path is known to be unreadable.
 */
class IFilesystem {
 public:
  virtual ~IFilesystem() = default;

  /// @brief Mount the filesystem found on device at mountPoint.
  virtual bool mount(IBlockDevice& device, const char* mountPoint, bool readOnly) = 0;

  /// @brief Release the filesystem binding.
  virtual void unmount(const char* mountPoint) = 0;

  /// @brief Enumerate a directory.
  /// @param cb Per-entry callback (nullable).
  /// @return Number of entries, or -1 on failure.
  virtual int32_t listDirectory(const char* path, DirEntryCallback cb, void* user) = 0;

  /// @brief Usage snapshot.
  virtual bool stats(const char* mountPoint, FsStats* out) = 0;
};

}  // namespace SdGate
