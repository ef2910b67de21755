/**
 * @file ArduinoPlatform.h
 * @brief Arduino bindings: SPIClass transport, millis() clock, Serial log sink.
 */

#pragma once

#include <Arduino.h>
#include <SPI.h>

#include "SdGate/Config.h"
#include "SdGate/Platform.h"

namespace SdGate {

/**
 * @brief ISpiTransport over an Arduino SPIClass.
 *
 * A chip-select pin can be claimed by only one transport at a time, across
 * all instances. The bus itself is started only when autoInitSpi is set.
 */
class ArduinoSpiTransport : public ISpiTransport {
 public:
  explicit ArduinoSpiTransport(SPIClass* spi = &SPI);
  ~ArduinoSpiTransport() override;
  ArduinoSpiTransport(const ArduinoSpiTransport&) = delete;
  ArduinoSpiTransport& operator=(const ArduinoSpiTransport&) = delete;

  bool claim(const SpiBusSettings& settings) override;
  void release() override;
  void setClockHz(uint32_t hz) override;
  void select() override;
  void deselect() override;
  uint8_t transfer(uint8_t out) override;
  void transferBytes(const uint8_t* tx, uint8_t* rx, size_t len) override;

 private:
  SPIClass* _spi = nullptr;
  uint32_t _clockHz = 400000;
  uint8_t _dataMode = SPI_MODE0;
  int _pinCs = -1;
  bool _claimed = false;
  bool _selected = false;
};

/// @brief IClock over millis()/delay().
class ArduinoClock : public IClock {
 public:
  uint32_t millis() const override;
  void delay(uint32_t ms) override;
};

/**
 * @brief LogCallback printing "[SdGate] <level> <message>" lines.
 * @param user Print* target, or nullptr for Serial.
 */
void serialLogCallback(LogLevel level, const char* message, void* user);

}  // namespace SdGate
