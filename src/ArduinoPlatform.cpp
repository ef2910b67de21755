/**
 * @file ArduinoPlatform.cpp
 * @brief Arduino SPIClass transport, clock and Serial log sink.
 */

#include "SdGate/ArduinoPlatform.h"

#include <string.h>

namespace SdGate {

// One bit per chip-select pin currently claimed by any transport.
static uint64_t s_claimedPins = 0;

static uint64_t pinMask(int pin) {
  return (pin >= 0 && pin < 64) ? (1ULL << pin) : 0;
}

static uint8_t toDataMode(uint8_t mode) {
  switch (mode) {
    case 1:
      return SPI_MODE1;
    case 2:
      return SPI_MODE2;
    case 3:
      return SPI_MODE3;
    default:
      return SPI_MODE0;
  }
}

ArduinoSpiTransport::ArduinoSpiTransport(SPIClass* spi) : _spi(spi) {}

ArduinoSpiTransport::~ArduinoSpiTransport() { release(); }

bool ArduinoSpiTransport::claim(const SpiBusSettings& settings) {
  const uint64_t mask = pinMask(settings.pinCs);
  if (_claimed || !_spi || mask == 0 || (s_claimedPins & mask) != 0) {
    return false;
  }
  s_claimedPins |= mask;
  _claimed = true;
  _pinCs = settings.pinCs;
  _dataMode = toDataMode(settings.spiMode);

  if (settings.autoInitSpi) {
    _spi->begin(static_cast<int8_t>(settings.pinSck), static_cast<int8_t>(settings.pinMiso),
                static_cast<int8_t>(settings.pinMosi), static_cast<int8_t>(settings.pinCs));
  }
  pinMode(static_cast<uint8_t>(_pinCs), OUTPUT);
  digitalWrite(static_cast<uint8_t>(_pinCs), HIGH);
  return true;
}

void ArduinoSpiTransport::release() {
  if (!_claimed) {
    return;
  }
  deselect();
  s_claimedPins &= ~pinMask(_pinCs);
  _claimed = false;
  _pinCs = -1;
}

void ArduinoSpiTransport::setClockHz(uint32_t hz) { _clockHz = hz; }

void ArduinoSpiTransport::select() {
  if (!_claimed || _selected) {
    return;
  }
  _spi->beginTransaction(SPISettings(_clockHz, MSBFIRST, _dataMode));
  digitalWrite(static_cast<uint8_t>(_pinCs), LOW);
  _selected = true;
}

void ArduinoSpiTransport::deselect() {
  if (!_claimed) {
    return;
  }
  digitalWrite(static_cast<uint8_t>(_pinCs), HIGH);
  if (_selected) {
    _spi->endTransaction();
    _selected = false;
  }
}

uint8_t ArduinoSpiTransport::transfer(uint8_t out) {
  // Idle clocks with CS high still need the bus settings applied.
  if (_selected) {
    return _spi->transfer(out);
  }
  _spi->beginTransaction(SPISettings(_clockHz, MSBFIRST, _dataMode));
  const uint8_t in = _spi->transfer(out);
  _spi->endTransaction();
  return in;
}

void ArduinoSpiTransport::transferBytes(const uint8_t* tx, uint8_t* rx, size_t len) {
  if (!tx && rx && _selected) {
    memset(rx, 0xFF, len);
    _spi->transfer(rx, len);
    return;
  }
  ISpiTransport::transferBytes(tx, rx, len);
}

uint32_t ArduinoClock::millis() const { return ::millis(); }

void ArduinoClock::delay(uint32_t ms) { ::delay(ms); }

void serialLogCallback(LogLevel level, const char* message, void* user) {
  Print* out = user ? static_cast<Print*>(user) : &Serial;
  const char* tag = "I";
  switch (level) {
    case LogLevel::Error:
      tag = "E";
      break;
    case LogLevel::Warn:
      tag = "W";
      break;
    case LogLevel::Info:
      tag = "I";
      break;
    case LogLevel::Debug:
      tag = "D";
      break;
  }
  out->print("[SdGate] ");
  out->print(tag);
  out->print(' ');
  out->println(message);
}

}  // namespace SdGate
