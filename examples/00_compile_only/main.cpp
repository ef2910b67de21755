/**
 * @file main.cpp
 * @brief Minimal compile-only skeleton for SdGate.
 */

#include <Arduino.h>

#include "examples/common/BoardPins.h"
#include "SdGate/ArduinoPlatform.h"
#include "SdGate/SdFatFilesystem.h"
#include "SdGate/SdGate.h"

static SdGate::ArduinoSpiTransport g_transport;
static SdGate::ArduinoClock g_clock;
static SdGate::SdFatFilesystem g_fs;

static SdGate::SdGateConfig makeConfig() {
  SdGate::SdGateConfig cfg;
  cfg.pinCs = pins::SD_CS;
  cfg.pinMosi = pins::SPI_MOSI;
  cfg.pinMiso = pins::SPI_MISO;
  cfg.pinSck = pins::SPI_SCK;
  cfg.autoInitSpi = true;
  return cfg;
}

static SdGate::HardwareHandle g_handle(g_transport, g_clock, makeConfig());
static SdGate::SdSpiBlockDevice g_device(g_handle);
static SdGate::LivenessKeeper g_keeper(g_device);
static SdGate::MountOrchestrator g_orchestrator(g_fs, g_clock, g_handle.config());
static SdGate::MountSession g_session;

void setup() {
  SdGate::ValidationSequencer sequencer;
  const SdGate::ReadinessReport report = sequencer.validate(g_device);
  (void)g_orchestrator.mount(g_device, g_handle, report, &g_session);
}

void loop() {
  (void)g_keeper.tick();
  delay(1);
}
