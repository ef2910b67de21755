/**
 * @file Config.h
 * @brief Configuration structure for SdGate.
 */

#pragma once

#include <stdint.h>

namespace SdGate {

/// @brief Log verbosity (messages below the selected level are dropped).
enum class Verbosity : uint8_t {
  Silent = 0,  ///< Errors and warnings only
  Diags,       ///< Stage progress and results
  Debug        ///< Raw bytes and timing details
};

/// @brief Severity of a single log line.
enum class LogLevel : uint8_t {
  Error = 0,
  Warn,
  Info,
  Debug
};

/// @brief Log sink callback (invoked synchronously from the calling context).
using LogCallback = void (*)(LogLevel level, const char* message, void* user);

/**
 * @brief Configuration for SdGate bring-up, validation and mount.
 *
 * All hardware-specific parameters (pins, clock rates) are injected here.
 * The library never hardcodes pins or talks to a bus it was not handed.
 */
struct SdGateConfig {
  // ---------------------------
  // SPI configuration
  // ---------------------------

  /// @brief SPI chip select pin (required).
  int pinCs = -1;

  /// @brief SPI MOSI pin. Used only if autoInitSpi is true.
  int pinMosi = -1;

  /// @brief SPI MISO pin. Used only if autoInitSpi is true.
  int pinMiso = -1;

  /// @brief SPI SCK pin. Used only if autoInitSpi is true.
  int pinSck = -1;

  /// @brief If true, the transport calls spi->begin(...) on claim. Default false (app owns bus).
  bool autoInitSpi = false;

  /// @brief SPI clock after initialization in Hz.
  uint32_t spiFrequencyHz = 4000000;

  /// @brief SPI clock during the card wake-up handshake in Hz.
  uint32_t initClockHz = 400000;

  /// @brief SPI mode (0-3).
  uint8_t spiMode = 0;

  // ---------------------------
  // Card handshake limits
  // ---------------------------

  /// @brief CMD0 attempts before giving up on the idle state.
  uint8_t idleRetryLimit = 10;

  /// @brief Maximum ACMD41 polls while the card leaves the idle state.
  uint16_t initPollLimit = 2000;

  /// @brief Delay between ACMD41 polls (ms).
  uint32_t initPollDelayMs = 1;

  /// @brief Overall ACMD41 polling bound (ms).
  uint32_t initTimeoutMs = 2000;

  /// @brief Bytes clocked while waiting for an R1 response.
  uint8_t responsePollLimit = 10;

  /// @brief Bytes clocked while waiting for a register data token (CSD).
  uint16_t tokenPollLimit = 2000;

  /// @brief Idle 0xFF bytes clocked after every chip-select release.
  uint8_t idleClockBytes = 2;

  // ---------------------------
  // Validation policy
  // ---------------------------

  /// @brief Marketed card size in bytes (0 = unknown, no capacity check).
  uint64_t expectedNominalBytes = 0;

  /// @brief Blocks read after the MBR during the sustained read stage.
  uint8_t multiblockCount = 4;

  /// @brief Communication probe budget (ms, 0 = unbounded).
  uint32_t commBudgetMs = 3000;

  /// @brief MBR read budget (ms, 0 = unbounded).
  uint32_t mbrBudgetMs = 1000;

  /// @brief Sustained read budget (ms, 0 = unbounded).
  uint32_t multiblockBudgetMs = 2000;

  // ---------------------------
  // Mount policy
  // ---------------------------

  /// @brief Mount point handed to the filesystem.
  const char* mountPoint = "/sd";

  /// @brief Mount read-only.
  bool readOnly = true;

  /// @brief Delay after the filesystem mount before returning (ms).
  uint32_t settleDelayMs = 200;

  /// @brief Perform one discarded directory listing after mount.
  /// @note Works around boards whose directory metadata is stale right after mount.
  bool primeDirectoryCache = true;

  /// @brief Upper bound for a complete mount call (ms, 0 = unbounded).
  uint32_t mountTimeoutMs = 10000;

  /// @brief Minimum spacing between filesystem queries on a session (ms).
  uint32_t minOperationIntervalMs = 500;

  // ---------------------------
  // Liveness
  // ---------------------------

  /// @brief Idle time after which tick() nudges the card (ms).
  uint32_t keepaliveIdleMs = 900;

  /// @brief Budget for the keepalive read (ms).
  uint32_t keepaliveReadBudgetMs = 250;

  // ---------------------------
  // Logging
  // ---------------------------

  /// @brief Log verbosity.
  Verbosity verbosity = Verbosity::Diags;

  /// @brief Log sink (nullable).
  LogCallback logCallback = nullptr;

  /// @brief User context passed to logCallback.
  void* logUser = nullptr;
};

}  // namespace SdGate
