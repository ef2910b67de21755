/**
 * @file SdGate.h
 * @brief Public API for SdGate SD card bring-up, validation and mount gating.
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#include "SdGate/Config.h"
#include "SdGate/Platform.h"
#include "SdGate/Status.h"

namespace SdGate {

/**
 * @brief Exclusive owner of one SPI transport / chip-select pair.
 *
 * Validation, mount, unmount and keepalive all thread the same handle.
 * There is no process-wide instance; the application creates one per card.
 *
 * @note Not thread-safe. Use from one task only.
 */
class HardwareHandle {
 public:
  HardwareHandle(ISpiTransport& transport, IClock& clock, const SdGateConfig& config);
  ~HardwareHandle();
  HardwareHandle(const HardwareHandle&) = delete;
  HardwareHandle& operator=(const HardwareHandle&) = delete;

  /**
   * @brief Claim the transport and set up chip-select.
   * @return Ok (also when already claimed by this handle), BusNotAvailable if
   *         the transport refused, InvalidArgument if pinCs is unset.
   */
  ErrorCode claim();

  /**
   * @brief Release the transport.
   * @return NotReady while a filesystem is mounted on this handle.
   */
  ErrorCode release();

  /**
   * @brief Full reset after a hang: release, reclaim, new generation.
   * @note Invalidates any CardIdentity read before. Re-run validation afterwards.
   * @return NotReady while mounted, otherwise the claim() result.
   */
  ErrorCode rebuild();

  /// @brief Mark the handle unusable until rebuild().
  void poison(Operation op, uint32_t block);

  bool claimed() const { return _claimed; }
  bool poisoned() const { return _poisoned; }
  bool mounted() const { return _mounted; }

  /// @brief Incremented by every rebuild(); identities from older generations are stale.
  uint32_t generation() const { return _generation; }

  /// @brief Number of times chip-select was set up on the transport.
  uint32_t claimCount() const { return _claimCount; }

  /// @brief Timestamp of the last bus exchange (millis).
  uint32_t lastActivityMs() const { return _lastActivityMs; }

  /// @brief Record bus activity now.
  void touch();

  ISpiTransport& transport() { return _transport; }
  IClock& clock() { return _clock; }
  const IClock& clock() const { return _clock; }
  const SdGateConfig& config() const { return _config; }

  /// @brief Last error snapshot.
  ErrorInfo lastErrorInfo() const { return _lastError; }

  /// @brief Record an error snapshot.
  void setLastError(ErrorCode code, Operation op, int32_t detail, uint32_t block);

 private:
  friend class MountOrchestrator;
  void setMounted(bool mounted) { _mounted = mounted; }

  ISpiTransport& _transport;
  IClock& _clock;
  SdGateConfig _config{};
  ErrorInfo _lastError{};
  uint32_t _generation = 0;
  uint32_t _claimCount = 0;
  uint32_t _lastActivityMs = 0;
  bool _claimed = false;
  bool _poisoned = false;
  bool _mounted = false;
};

/**
 * @brief SD card block device over SPI.
 *
 * Reads are never retried here. Retry policy belongs to the caller so that
 * one bad read stays distinguishable from a broken card.
 */
class SdSpiBlockDevice : public IBlockDevice {
 public:
  explicit SdSpiBlockDevice(HardwareHandle& handle);
  SdSpiBlockDevice(const SdSpiBlockDevice&) = delete;
  SdSpiBlockDevice& operator=(const SdSpiBlockDevice&) = delete;

  /**
   * @brief Wake the card and read its identity.
   * @param out Identity output (nullable).
   * @param deadline Optional caller deadline, checked between polls.
   * @return Ok, Timeout, NoCard, BadResponse or BusUnavailable.
   */
  InitError initialize(CardIdentity* out, const Deadline* deadline = nullptr);

  uint32_t blockCount() const override;

  /**
   * @brief Read one block with no timeout.
   * @note Blocks until the card answers. Use readBlockUntil() on untrusted cards.
   */
  ReadError readBlock(uint32_t index, uint8_t* buf) override;

  /**
   * @brief Read one block, giving up when deadline expires.
   * @note The deadline is checked between token polls, never mid-transfer.
   *       Cancelled leaves the card mid-command; poison the handle.
   */
  ReadError readBlockUntil(uint32_t index, uint8_t* buf, const Deadline* deadline);

  /// @brief True if initialized and the identity matches the handle generation.
  bool ready() const;

  const CardIdentity& identity() const { return _identity; }
  HardwareHandle& handle() { return _handle; }
  const HardwareHandle& handle() const { return _handle; }

 private:
  uint8_t command(uint8_t cmd, uint32_t arg);
  uint8_t appCommand(uint8_t cmd, uint32_t arg);
  void endTransaction();
  bool waitDataToken(uint16_t pollLimit, uint8_t* tokenOut);
  InitError failInit(InitError err, uint8_t detail);
  InitError pollUntilReady(CardType type, const Deadline* deadline);
  InitError readIdentity(CardType type);

  HardwareHandle& _handle;
  CardIdentity _identity{};
  uint32_t _generation = 0;
  bool _initialized = false;
  bool _inTransaction = false;
};

/**
 * @brief Ordered pre-mount validation: communication probe, MBR read,
 *        sustained multi-block read.
 *
 * Every stage is timed and reported on its own. A failed MBR stage ends the
 * attempt; a failed sustained read is recorded only.
 */
class ValidationSequencer {
 public:
  ValidationSequencer() = default;

  /// @brief Run all three stages.
  ReadinessReport validate(SdSpiBlockDevice& device, const TimeBudget& budget);

  /// @brief Run all three stages with budgets from the handle config.
  ReadinessReport validate(SdSpiBlockDevice& device);

  /// @brief Run the communication probe and MBR read only (no mount intended).
  ReadinessReport readMbrOnly(SdSpiBlockDevice& device, const TimeBudget& budget);

  /// @brief Budgets from a config.
  static TimeBudget budgetFrom(const SdGateConfig& config);

 private:
  ReadinessReport run(SdSpiBlockDevice& device, const TimeBudget& budget,
                      bool includeMultiblock);
  bool runCommProbe(SdSpiBlockDevice& device, uint32_t budgetMs, ReadinessReport* report);
  bool runMbrRead(SdSpiBlockDevice& device, uint32_t budgetMs, ReadinessReport* report);
  void runMultiblockRead(SdSpiBlockDevice& device, uint32_t budgetMs, ReadinessReport* report);

  uint8_t _block[BLOCK_SIZE]{};
};

/// @brief Filesystem binding created by a successful mount.
struct MountSession {
  /// @brief Handle the filesystem is mounted through.
  HardwareHandle* handle = nullptr;

  /// @brief Report the mount was gated on.
  ReadinessReport report{};

  /// @brief Mount point passed to the filesystem.
  const char* mountPoint = nullptr;

  /// @brief Mount completion timestamp (millis).
  uint32_t mountedAtMs = 0;

  /// @brief Mount + settle + priming duration (ms).
  uint32_t mountDurationMs = 0;

  /// @brief False after unmount.
  bool active = false;
};

/**
 * @brief Gates and performs the filesystem mount.
 *
 * Never calls the filesystem when the report shows an unreadable data path.
 */
class MountOrchestrator {
 public:
  MountOrchestrator(IFilesystem& fs, IClock& clock, const SdGateConfig& config);
  MountOrchestrator(const MountOrchestrator&) = delete;
  MountOrchestrator& operator=(const MountOrchestrator&) = delete;

  /**
   * @brief Mount the filesystem on a validated device.
   * @param device Block device bound to handle.
   * @param handle The handle used for validation (never re-opened).
   * @param report Report from ValidationSequencer.
   * @param out Session output.
   */
  MountError mount(SdSpiBlockDevice& device, HardwareHandle& handle,
                   const ReadinessReport& report, MountSession* out);

  /**
   * @brief Release the filesystem binding. The handle stays claimed.
   * @note Safe to call multiple times.
   */
  void unmount(MountSession& session);

  /**
   * @brief Paced directory listing on a mounted session.
   * @return Entry count, or -1 on failure or inactive session.
   */
  int32_t listDirectory(const MountSession& session, const char* path,
                        DirEntryCallback cb = nullptr, void* user = nullptr);

  /// @brief Paced usage snapshot on a mounted session.
  bool stats(const MountSession& session, FsStats* out);

  /**
   * @brief Enumerate the mount point repeatedly, paced like any other query.
   *
   * A pass fails when the listing fails or its entry count differs from the
   * first pass. Stops at the first failing pass.
   * @return 1-based index of the first failing pass, or -1 if all passes agree.
   */
  int32_t verifyStability(const MountSession& session, uint8_t iterations);

  const SdGateConfig& config() const { return _config; }

 private:
  void pace();

  IFilesystem& _fs;
  IClock& _clock;
  SdGateConfig _config{};
  uint32_t _lastQueryMs = 0;
  bool _queried = false;
};

/**
 * @brief Cooperative keepalive for cards that power down when idle.
 *
 * Call tick() from the application loop. Nothing runs in the background.
 */
class LivenessKeeper {
 public:
  explicit LivenessKeeper(SdSpiBlockDevice& device);
  LivenessKeeper(SdSpiBlockDevice& device, uint32_t idleThresholdMs);

  /// @brief Re-read block 0 if the bus has been idle past the threshold.
  KeepaliveResult tick();

  uint32_t idleThresholdMs() const { return _idleThresholdMs; }

 private:
  SdSpiBlockDevice& _device;
  uint32_t _idleThresholdMs = 0;
  uint8_t _scratch[BLOCK_SIZE]{};
};

}  // namespace SdGate
