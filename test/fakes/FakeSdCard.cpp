#include "FakeSdCard.h"

#include <string.h>

namespace SdGate {
namespace fakes {

FakeSdCard::FakeSdCard(FakeClock& clock) : _clock(clock) { setMbr(0x0C, true); }

bool FakeSdCard::claim(const SpiBusSettings& settings) {
  if (_claimed || settings.pinCs < 0) {
    return false;
  }
  _claimed = true;
  _claimCount++;
  return true;
}

void FakeSdCard::release() {
  if (!_claimed) {
    return;
  }
  _claimed = false;
  _selected = false;
  _releaseCount++;
}

void FakeSdCard::select() {
  _selected = true;
  _selectCount++;
}

void FakeSdCard::deselect() {
  _selected = false;
  _idleClocks = 0;
  _out.clear();
  _outPos = 0;
  _cmdLen = 0;
}

void FakeSdCard::setMbr(uint8_t partitionType, bool withSignature) {
  memset(_mbr, 0, sizeof(_mbr));
  _mbr[0x1BE] = 0x00;
  _mbr[0x1BE + 4] = partitionType;
  _mbr[0x1BE + 8] = 0x00;
  _mbr[0x1BE + 9] = 0x20;
  if (withSignature) {
    _mbr[510] = 0x55;
    _mbr[511] = 0xAA;
  }
}

uint32_t FakeSdCard::advertisedBlockCount() const {
  if (_highCapacity && !_legacy) {
    const uint32_t units = (_blockCount < 1024) ? 1 : (_blockCount / 1024);
    return units * 1024;
  }
  uint32_t units = (_blockCount < 512) ? 1 : (_blockCount / 512);
  if (units > 4096) {
    units = 4096;
  }
  return units * 512;
}

void FakeSdCard::buildCsd(uint8_t* csd) const {
  memset(csd, 0, 16);
  if (_highCapacity && !_legacy) {
    const uint32_t cSize = advertisedBlockCount() / 1024 - 1;
    csd[0] = 0x40;
    csd[5] = 0x59;
    csd[7] = static_cast<uint8_t>((cSize >> 16) & 0x3F);
    csd[8] = static_cast<uint8_t>(cSize >> 8);
    csd[9] = static_cast<uint8_t>(cSize);
    return;
  }
  // READ_BL_LEN = 9, C_SIZE_MULT = 7: 512 blocks per C_SIZE unit.
  const uint32_t cSize = advertisedBlockCount() / 512 - 1;
  const uint8_t mult = 7;
  csd[0] = 0x00;
  csd[5] = 0x59;
  csd[6] = static_cast<uint8_t>((cSize >> 10) & 0x03);
  csd[7] = static_cast<uint8_t>(cSize >> 2);
  csd[8] = static_cast<uint8_t>((cSize & 0x03) << 6);
  csd[9] = static_cast<uint8_t>((mult >> 1) & 0x03);
  csd[10] = static_cast<uint8_t>((mult & 0x01) << 7);
}

void FakeSdCard::blockContent(uint32_t index, uint8_t* out) const {
  if (index == 0) {
    memcpy(out, _mbr, sizeof(_mbr));
    return;
  }
  for (uint32_t i = 0; i < 512; ++i) {
    out[i] = static_cast<uint8_t>(index + i);
  }
}

uint8_t FakeSdCard::transfer(uint8_t out) {
  _transferCount++;
  _clock.advanceUs(_usPerByte);
  if (!_selected) {
    _idleClocks++;
    return 0xFF;
  }
  if (!_present) {
    return 0xFF;
  }

  if (_outPos < _out.size()) {
    const uint8_t in = _out[_outPos++];
    if (_outPos == _out.size()) {
      _out.clear();
      _outPos = 0;
    }
    return in;
  }

  if (_cmdLen == 0 && (out & 0xC0) != 0x40) {
    return 0xFF;
  }
  _cmd[_cmdLen++] = out;
  if (_cmdLen == sizeof(_cmd)) {
    _cmdLen = 0;
    runCommand();
  }
  return 0xFF;
}

void FakeSdCard::runCommand() {
  const uint8_t cmd = static_cast<uint8_t>(_cmd[0] & 0x3F);
  const uint32_t arg = (static_cast<uint32_t>(_cmd[1]) << 24) |
                       (static_cast<uint32_t>(_cmd[2]) << 16) |
                       (static_cast<uint32_t>(_cmd[3]) << 8) | static_cast<uint32_t>(_cmd[4]);
  const bool app = _appCommand;
  _appCommand = false;
  _out.clear();
  _outPos = 0;
  queue(0xFF);  // NCR

  const uint8_t idleBit = _idle ? 0x01 : 0x00;
  switch (cmd) {
    case 0:
      _idle = true;
      _acmd41Polls = 0;
      queue(_idleResponse);
      break;
    case 8:
      if (_legacy) {
        queue(0x05);
        break;
      }
      queue(idleBit);
      queue(0x00);
      queue(0x00);
      queue(0x01);
      queue(_ifCondEcho);
      break;
    case 55:
      _appCommand = true;
      queue(idleBit);
      break;
    case 41:
      if (!app) {
        queue(static_cast<uint8_t>(0x04 | idleBit));
        break;
      }
      _acmd41Polls++;
      if (!_neverReady && _acmd41Polls > _acmd41BusyPolls) {
        _idle = false;
      }
      queue(_idle ? 0x01 : 0x00);
      break;
    case 58:
      queue(idleBit);
      queue(static_cast<uint8_t>(0x80 | ((_highCapacity && !_legacy) ? 0x40 : 0x00)));
      queue(0xFF);
      queue(0x80);
      queue(0x00);
      break;
    case 16:
      queue(idleBit);
      break;
    case 9: {
      uint8_t csd[16];
      buildCsd(csd);
      queue(idleBit);
      queue(0xFF);
      queue(0xFE);
      for (uint8_t b : csd) {
        queue(b);
      }
      queue(0x00);
      queue(0x00);
      break;
    }
    case 17: {
      _readAttempts++;
      const uint32_t block = (_highCapacity && !_legacy) ? arg : arg / 512;
      _lastReadBlock = block;
      if (_idle || block >= advertisedBlockCount()) {
        queue(static_cast<uint8_t>(0x40 | idleBit));
        break;
      }
      queue(0x00);
      if (_readAttempts == _hangOnReadAttempt) {
        break;
      }
      queue(0xFF);
      if (_readAttempts == _errorOnReadAttempt) {
        queue(0x08);
        break;
      }
      queue(0xFE);
      uint8_t data[512];
      blockContent(block, data);
      for (uint8_t b : data) {
        queue(b);
      }
      queue(0x00);
      queue(0x00);
      break;
    }
    default:
      queue(static_cast<uint8_t>(0x04 | idleBit));
      break;
  }
}

}  // namespace fakes
}  // namespace SdGate
