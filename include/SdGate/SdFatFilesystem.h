/**
 * @file SdFatFilesystem.h
 * @brief IFilesystem backed by SdFat FsVolume on a validated block device.
 *
 * Requires SdFat built with USE_BLOCK_DEVICE_INTERFACE=1.
 */

#pragma once

#include <SdFat.h>

#include "SdGate/Platform.h"

namespace SdGate {

/**
 * @brief SdFat volume mounted on an SdGate block device.
 *
 * SdFat never initializes the card itself here; it reads sectors through
 * the IBlockDevice the MountOrchestrator hands over.
 */
class SdFatFilesystem : public IFilesystem {
 public:
  SdFatFilesystem() = default;
  SdFatFilesystem(const SdFatFilesystem&) = delete;
  SdFatFilesystem& operator=(const SdFatFilesystem&) = delete;

  /// @note readOnly is accepted for interface symmetry; the volume is always read-only.
  bool mount(IBlockDevice& device, const char* mountPoint, bool readOnly) override;
  void unmount(const char* mountPoint) override;
  int32_t listDirectory(const char* path, DirEntryCallback cb, void* user) override;
  bool stats(const char* mountPoint, FsStats* out) override;

  bool mounted() const { return _mounted; }

 private:
  /// @brief FsBlockDeviceInterface forwarding sector reads to an IBlockDevice.
  /// @note Writes are always refused; the card is never written.
  class BlockBridge : public FsBlockDeviceInterface {
   public:
    void attach(IBlockDevice* device) { _device = device; }

    void end() override { _device = nullptr; }
    bool isBusy() override { return false; }
    bool readSector(uint32_t sector, uint8_t* dst) override;
    bool readSectors(uint32_t sector, uint8_t* dst, size_t ns) override;
    uint32_t sectorCount() override;
    bool syncDevice() override { return true; }
    bool writeSector(uint32_t sector, const uint8_t* src) override;
    bool writeSectors(uint32_t sector, const uint8_t* src, size_t ns) override;

   private:
    IBlockDevice* _device = nullptr;
  };

  bool resolvePath(const char* in, char* out, size_t outLen) const;

  BlockBridge _bridge;
  FsVolume _volume;
  char _mountPoint[16]{};
  bool _mounted = false;
};

}  // namespace SdGate
