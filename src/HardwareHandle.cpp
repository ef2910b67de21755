/**
 * @file HardwareHandle.cpp
 * @brief Exclusive transport ownership, poison and rebuild.
 */

#include "SdGate/SdGate.h"

#include "Log.h"

namespace SdGate {

HardwareHandle::HardwareHandle(ISpiTransport& transport, IClock& clock,
                               const SdGateConfig& config)
    : _transport(transport), _clock(clock), _config(config) {}

HardwareHandle::~HardwareHandle() {
  if (_claimed) {
    _transport.deselect();
    _transport.release();
    _claimed = false;
  }
}

ErrorCode HardwareHandle::claim() {
  if (_claimed) {
    return ErrorCode::Ok;
  }
  if (_config.pinCs < 0) {
    setLastError(ErrorCode::InvalidArgument, Operation::Claim, 0, INVALID_BLOCK);
    return ErrorCode::InvalidArgument;
  }

  SpiBusSettings settings;
  settings.pinCs = _config.pinCs;
  settings.pinMosi = _config.pinMosi;
  settings.pinMiso = _config.pinMiso;
  settings.pinSck = _config.pinSck;
  settings.autoInitSpi = _config.autoInitSpi;
  settings.spiMode = _config.spiMode;

  if (!_transport.claim(settings)) {
    setLastError(ErrorCode::BusNotAvailable, Operation::Claim, _config.pinCs, INVALID_BLOCK);
    internal::logf(_config, LogLevel::Error, "CS pin %d already in use", _config.pinCs);
    return ErrorCode::BusNotAvailable;
  }

  _claimed = true;
  _claimCount++;
  _transport.setClockHz(_config.initClockHz);
  _transport.deselect();
  touch();
  internal::logf(_config, LogLevel::Debug, "claimed CS %d (setup #%lu)", _config.pinCs,
                 static_cast<unsigned long>(_claimCount));
  return ErrorCode::Ok;
}

ErrorCode HardwareHandle::release() {
  if (_mounted) {
    setLastError(ErrorCode::NotReady, Operation::Claim, 0, INVALID_BLOCK);
    return ErrorCode::NotReady;
  }
  if (!_claimed) {
    return ErrorCode::Ok;
  }
  _transport.deselect();
  _transport.release();
  _claimed = false;
  return ErrorCode::Ok;
}

ErrorCode HardwareHandle::rebuild() {
  if (_mounted) {
    setLastError(ErrorCode::NotReady, Operation::Rebuild, 0, INVALID_BLOCK);
    return ErrorCode::NotReady;
  }
  internal::logf(_config, LogLevel::Warn, "rebuilding hardware handle (generation %lu)",
                 static_cast<unsigned long>(_generation + 1));
  if (_claimed) {
    _transport.deselect();
    _transport.release();
    _claimed = false;
  }
  _generation++;
  _poisoned = false;
  return claim();
}

void HardwareHandle::poison(Operation op, uint32_t block) {
  _poisoned = true;
  setLastError(ErrorCode::Poisoned, op, 0, block);
  internal::logf(_config, LogLevel::Error,
                 "handle poisoned; rebuild before further bus access");
}

void HardwareHandle::touch() { _lastActivityMs = _clock.millis(); }

void HardwareHandle::setLastError(ErrorCode code, Operation op, int32_t detail,
                                  uint32_t block) {
  _lastError.code = code;
  _lastError.op = op;
  _lastError.detail = detail;
  _lastError.timestampMs = _clock.millis();
  _lastError.block = block;
}

}  // namespace SdGate
