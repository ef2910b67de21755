/**
 * @file SdSpiBlockDevice.cpp
 * @brief SD SPI-mode command layer: wake-up handshake, identity, block reads.
 */

#include "SdGate/SdGate.h"

#include "SdGate/Diagnosis.h"

#include "Log.h"
#include "Pacing.h"
#include "SdProtocol.h"

namespace SdGate {

using internal::IDLE_BYTE;
using internal::R1_IDLE_STATE;
using internal::R1_NO_RESPONSE;
using internal::R1_READY_STATE;

SdSpiBlockDevice::SdSpiBlockDevice(HardwareHandle& handle) : _handle(handle) {}

bool SdSpiBlockDevice::ready() const {
  return _initialized && _generation == _handle.generation() && _handle.claimed() &&
         !_handle.poisoned();
}

uint32_t SdSpiBlockDevice::blockCount() const {
  return ready() ? _identity.blockCount : 0;
}

uint8_t SdSpiBlockDevice::command(uint8_t cmd, uint32_t arg) {
  const SdGateConfig& cfg = _handle.config();
  ISpiTransport& bus = _handle.transport();
  if (!_inTransaction) {
    bus.select();
    _inTransaction = true;
  }

  // Card holds MISO low while busy from a previous operation.
  for (uint16_t i = 0; i < cfg.tokenPollLimit; ++i) {
    if (bus.transfer(IDLE_BYTE) == IDLE_BYTE) {
      break;
    }
  }

  uint8_t frame[6];
  internal::buildCommandFrame(cmd, arg, frame);
  bus.transferBytes(frame, nullptr, sizeof(frame));

  uint8_t r1 = R1_NO_RESPONSE;
  for (uint8_t i = 0; i < cfg.responsePollLimit; ++i) {
    r1 = bus.transfer(IDLE_BYTE);
    if (internal::isR1(r1)) {
      break;
    }
  }
  _handle.touch();
  internal::logf(cfg, LogLevel::Debug, "CMD%u arg=0x%08lX -> R1 0x%02X",
                 static_cast<unsigned>(cmd), static_cast<unsigned long>(arg),
                 static_cast<unsigned>(r1));
  return r1;
}

uint8_t SdSpiBlockDevice::appCommand(uint8_t cmd, uint32_t arg) {
  command(internal::CMD55, 0);
  return command(cmd, arg);
}

void SdSpiBlockDevice::endTransaction() {
  ISpiTransport& bus = _handle.transport();
  bus.deselect();
  _inTransaction = false;
  // Extra clocks after deselect let the card latch its last response.
  for (uint8_t i = 0; i < _handle.config().idleClockBytes; ++i) {
    bus.transfer(IDLE_BYTE);
  }
  _handle.touch();
}

bool SdSpiBlockDevice::waitDataToken(uint16_t pollLimit, uint8_t* tokenOut) {
  ISpiTransport& bus = _handle.transport();
  uint8_t token = IDLE_BYTE;
  for (uint16_t i = 0; i < pollLimit; ++i) {
    token = bus.transfer(IDLE_BYTE);
    if (token != IDLE_BYTE) {
      break;
    }
  }
  if (tokenOut) {
    *tokenOut = token;
  }
  return token == internal::DATA_START_BLOCK;
}

InitError SdSpiBlockDevice::failInit(InitError err, uint8_t detail) {
  if (_inTransaction) {
    endTransaction();
  }
  _handle.setLastError(err == InitError::Timeout ? ErrorCode::Timeout
                                                 : ErrorCode::CardInitFailed,
                       Operation::Init, detail, INVALID_BLOCK);
  internal::logf(_handle.config(), LogLevel::Error, "card init failed: %s (0x%02X)",
                 initErrorToStr(err), static_cast<unsigned>(detail));
  return err;
}

InitError SdSpiBlockDevice::initialize(CardIdentity* out, const Deadline* deadline) {
  const SdGateConfig& cfg = _handle.config();
  _initialized = false;
  _identity = CardIdentity{};

  if (!_handle.claimed() || _handle.poisoned()) {
    _handle.setLastError(_handle.poisoned() ? ErrorCode::Poisoned : ErrorCode::NotClaimed,
                         Operation::Init, 0, INVALID_BLOCK);
    return InitError::BusUnavailable;
  }

  ISpiTransport& bus = _handle.transport();
  bus.setClockHz(cfg.initClockHz);
  bus.deselect();
  _inTransaction = false;
  for (uint8_t i = 0; i < internal::WAKE_CLOCK_BYTES; ++i) {
    bus.transfer(IDLE_BYTE);
  }

  // Idle state
  uint8_t r1 = R1_NO_RESPONSE;
  bool answered = false;
  for (uint8_t attempt = 0; attempt < cfg.idleRetryLimit; ++attempt) {
    r1 = command(internal::CMD0, 0);
    endTransaction();
    if (r1 != R1_NO_RESPONSE) {
      answered = true;
    }
    if (r1 == R1_IDLE_STATE) {
      break;
    }
    if (deadline && deadline->expired()) {
      return failInit(InitError::Timeout, r1);
    }
  }
  if (r1 != R1_IDLE_STATE) {
    return failInit(answered ? InitError::BadResponse : InitError::NoCard, r1);
  }

  // Interface condition
  CardType type = CardType::Sd1;
  r1 = command(internal::CMD8, internal::IF_COND_ARG);
  if (r1 == R1_NO_RESPONSE) {
    return failInit(InitError::BadResponse, r1);
  }
  if ((r1 & internal::R1_ILLEGAL_COMMAND) == 0) {
    uint8_t r7[4];
    bus.transferBytes(nullptr, r7, sizeof(r7));
    if (r7[3] != internal::IF_COND_ECHO) {
      return failInit(InitError::BadResponse, r7[3]);
    }
    type = CardType::Sd2;
  }
  endTransaction();

  InitError err = pollUntilReady(type, deadline);
  if (err != InitError::Ok) {
    return err;
  }
  err = readIdentity(type);
  if (err != InitError::Ok) {
    return err;
  }

  bus.setClockHz(cfg.spiFrequencyHz);
  _generation = _handle.generation();
  _initialized = true;
  if (out) {
    *out = _identity;
  }
  internal::logf(cfg, LogLevel::Info, "card ready: %s, %lu blocks",
                 cardTypeToStr(_identity.type), static_cast<unsigned long>(_identity.blockCount));
  return InitError::Ok;
}

InitError SdSpiBlockDevice::pollUntilReady(CardType type, const Deadline* deadline) {
  const SdGateConfig& cfg = _handle.config();
  IClock& clock = _handle.clock();
  const uint32_t arg = (type == CardType::Sd2) ? internal::ACMD41_HCS : 0;
  const uint32_t startMs = clock.millis();

  uint8_t r1 = R1_NO_RESPONSE;
  for (uint16_t poll = 0; poll < cfg.initPollLimit; ++poll) {
    r1 = appCommand(internal::ACMD41, arg);
    endTransaction();
    if (r1 == R1_READY_STATE) {
      internal::logf(cfg, LogLevel::Debug, "card left idle after %u polls",
                     static_cast<unsigned>(poll + 1));
      return InitError::Ok;
    }
    if (deadline && deadline->expired()) {
      break;
    }
    if (cfg.initTimeoutMs > 0 &&
        internal::elapsedMs(startMs, clock.millis()) >= cfg.initTimeoutMs) {
      break;
    }
    if (cfg.initPollDelayMs > 0) {
      clock.delay(cfg.initPollDelayMs);
    }
  }
  return failInit(InitError::Timeout, r1);
}

InitError SdSpiBlockDevice::readIdentity(CardType type) {
  const SdGateConfig& cfg = _handle.config();
  ISpiTransport& bus = _handle.transport();
  CardIdentity id;
  id.type = type;

  if (type == CardType::Sd2) {
    const uint8_t r1 = command(internal::CMD58, 0);
    if (r1 != R1_READY_STATE) {
      return failInit(InitError::BadResponse, r1);
    }
    uint8_t ocr[4];
    bus.transferBytes(nullptr, ocr, sizeof(ocr));
    endTransaction();
    id.ocr = (static_cast<uint32_t>(ocr[0]) << 24) | (static_cast<uint32_t>(ocr[1]) << 16) |
             (static_cast<uint32_t>(ocr[2]) << 8) | static_cast<uint32_t>(ocr[3]);
    if (id.ocr & internal::OCR_CCS) {
      id.type = CardType::SdHC;
      id.highCapacity = true;
    }
  }

  if (!id.highCapacity) {
    const uint8_t r1 = command(internal::CMD16, BLOCK_SIZE);
    endTransaction();
    if (r1 != R1_READY_STATE) {
      return failInit(InitError::BadResponse, r1);
    }
  }

  uint8_t token = IDLE_BYTE;
  const uint8_t r1 = command(internal::CMD9, 0);
  if (r1 != R1_READY_STATE) {
    return failInit(InitError::BadResponse, r1);
  }
  if (!waitDataToken(cfg.tokenPollLimit, &token)) {
    return failInit(InitError::BadResponse, token);
  }
  bus.transferBytes(nullptr, id.csd, sizeof(id.csd));
  bus.transferBytes(nullptr, nullptr, 2);
  endTransaction();

  id.blockCount = internal::csdBlockCount(id.csd);
  if (id.blockCount == 0) {
    return failInit(InitError::BadResponse, id.csd[0]);
  }
  id.capacityBytes = static_cast<uint64_t>(id.blockCount) * BLOCK_SIZE;
  _identity = id;
  return InitError::Ok;
}

ReadError SdSpiBlockDevice::readBlock(uint32_t index, uint8_t* buf) {
  return readBlockUntil(index, buf, nullptr);
}

ReadError SdSpiBlockDevice::readBlockUntil(uint32_t index, uint8_t* buf,
                                           const Deadline* deadline) {
  if (!buf) {
    return ReadError::InvalidArgument;
  }
  if (!ready()) {
    _handle.setLastError(_handle.poisoned() ? ErrorCode::Poisoned : ErrorCode::NotReady,
                         Operation::Read, 0, index);
    return ReadError::NotReady;
  }
  if (index >= _identity.blockCount) {
    _handle.setLastError(ErrorCode::InvalidArgument, Operation::Read, 0, index);
    return ReadError::OutOfRange;
  }

  ISpiTransport& bus = _handle.transport();
  const uint32_t address = _identity.highCapacity ? index : index * BLOCK_SIZE;
  const uint8_t r1 = command(internal::CMD17, address);
  if (r1 != R1_READY_STATE) {
    endTransaction();
    _handle.setLastError(ErrorCode::IoError, Operation::Read, r1, index);
    internal::logf(_handle.config(), LogLevel::Warn, "block %lu: R1 0x%02X",
                   static_cast<unsigned long>(index), static_cast<unsigned>(r1));
    return ReadError::IoError;
  }

  // No data-path timeout: only the caller's deadline ends this wait.
  uint8_t token = IDLE_BYTE;
  for (;;) {
    token = bus.transfer(IDLE_BYTE);
    if (token != IDLE_BYTE) {
      break;
    }
    if (deadline && deadline->expired()) {
      endTransaction();
      _handle.setLastError(ErrorCode::Timeout, Operation::Read, token, index);
      internal::logf(_handle.config(), LogLevel::Error,
                     "block %lu: no data token before deadline",
                     static_cast<unsigned long>(index));
      return ReadError::Cancelled;
    }
  }
  if (token != internal::DATA_START_BLOCK) {
    endTransaction();
    _handle.setLastError(ErrorCode::IoError, Operation::Read, token, index);
    internal::logf(_handle.config(), LogLevel::Warn, "block %lu: error token 0x%02X",
                   static_cast<unsigned long>(index), static_cast<unsigned>(token));
    return ReadError::IoError;
  }

  bus.transferBytes(nullptr, buf, BLOCK_SIZE);
  bus.transferBytes(nullptr, nullptr, 2);
  endTransaction();
  return ReadError::Ok;
}

}  // namespace SdGate
