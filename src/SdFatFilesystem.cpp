/**
 * @file SdFatFilesystem.cpp
 * @brief SdFat FsVolume mounted through an SdGate block device.
 */

#include "SdGate/SdFatFilesystem.h"

#include <string.h>

namespace SdGate {

bool SdFatFilesystem::BlockBridge::readSector(uint32_t sector, uint8_t* dst) {
  return _device && _device->readBlock(sector, dst) == ReadError::Ok;
}

bool SdFatFilesystem::BlockBridge::readSectors(uint32_t sector, uint8_t* dst, size_t ns) {
  for (size_t i = 0; i < ns; ++i) {
    if (!readSector(sector + static_cast<uint32_t>(i), dst + i * BLOCK_SIZE)) {
      return false;
    }
  }
  return true;
}

uint32_t SdFatFilesystem::BlockBridge::sectorCount() {
  return _device ? _device->blockCount() : 0;
}

bool SdFatFilesystem::BlockBridge::writeSector(uint32_t /*sector*/, const uint8_t* /*src*/) {
  return false;
}

bool SdFatFilesystem::BlockBridge::writeSectors(uint32_t /*sector*/, const uint8_t* /*src*/,
                                                size_t /*ns*/) {
  return false;
}

bool SdFatFilesystem::mount(IBlockDevice& device, const char* mountPoint, bool /*readOnly*/) {
  if (_mounted || !mountPoint) {
    return false;
  }
  const size_t mpLen = strlen(mountPoint);
  if (mpLen >= sizeof(_mountPoint)) {
    return false;
  }
  memcpy(_mountPoint, mountPoint, mpLen + 1);

  _bridge.attach(&device);
  if (!_volume.begin(&_bridge)) {
    _bridge.end();
    _mountPoint[0] = '\0';
    return false;
  }
  _mounted = true;
  return true;
}

void SdFatFilesystem::unmount(const char* /*mountPoint*/) {
  if (!_mounted) {
    return;
  }
  _volume.end();
  _bridge.end();
  _mountPoint[0] = '\0';
  _mounted = false;
}

bool SdFatFilesystem::resolvePath(const char* in, char* out, size_t outLen) const {
  if (!in || !out || outLen < 2) {
    return false;
  }

  // "/sd/logs" -> "logs", "/sd" -> "/"
  const char* src = in;
  const size_t mpLen = strlen(_mountPoint);
  if (mpLen > 0 && strncmp(src, _mountPoint, mpLen) == 0) {
    if (src[mpLen] == '\0' || src[mpLen] == '/') {
      src += mpLen;
      if (*src == '/') {
        src++;
      }
    }
  }
  if (*src == '\0') {
    src = "/";
  }

  const size_t srcLen = strlen(src);
  if (srcLen >= outLen) {
    return false;
  }
  memcpy(out, src, srcLen + 1);
  return true;
}

int32_t SdFatFilesystem::listDirectory(const char* path, DirEntryCallback cb, void* user) {
  if (!_mounted) {
    return -1;
  }
  char resolved[96];
  if (!resolvePath(path, resolved, sizeof(resolved))) {
    return -1;
  }

  FsFile dir;
  if (!dir.open(&_volume, resolved, O_RDONLY) || !dir.isDir()) {
    dir.close();
    return -1;
  }

  int32_t count = 0;
  char name[64];
  FsFile entry;
  while (entry.openNext(&dir, O_RDONLY)) {
    if (cb) {
      if (entry.getName(name, sizeof(name)) == 0) {
        name[0] = '\0';
      }
      cb(name, entry.isDir(), entry.fileSize(), user);
    }
    entry.close();
    count++;
  }
  dir.close();
  return count;
}

bool SdFatFilesystem::stats(const char* /*mountPoint*/, FsStats* out) {
  if (!_mounted || !out) {
    return false;
  }
  const uint64_t clusterBytes = _volume.bytesPerCluster();
  const int32_t freeClusters = _volume.freeClusterCount();
  if (freeClusters < 0) {
    return false;
  }
  out->totalBytes = clusterBytes * _volume.clusterCount();
  out->freeBytes = clusterBytes * static_cast<uint64_t>(freeClusters);
  out->usedBytes = (out->totalBytes > out->freeBytes) ? (out->totalBytes - out->freeBytes) : 0;
  return true;
}

}  // namespace SdGate
