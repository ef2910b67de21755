/**
 * @file main.cpp
 * @brief SPI CLI control example for SdGate.
 *
 * Commands:
 *   help
 *   status
 *   validate
 *   mbr
 *   mount
 *   unmount
 *   ls [path]
 *   stats
 *   stability <passes>
 *   tick
 *   keepalive <on|off>
 *   rebuild
 */

#include <Arduino.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include "SdGate/ArduinoPlatform.h"
#include "SdGate/Diagnosis.h"
#include "SdGate/SdFatFilesystem.h"
#include "SdGate/SdGate.h"
#include "SdGate/Version.h"
#include "examples/common/BoardPins.h"
#include "examples/common/Log.h"

static SdGate::SdGateConfig makeConfig() {
  SdGate::SdGateConfig cfg;
  cfg.pinCs = pins::SD_CS;
  cfg.pinMosi = pins::SPI_MOSI;
  cfg.pinMiso = pins::SPI_MISO;
  cfg.pinSck = pins::SPI_SCK;
  cfg.autoInitSpi = true;
  cfg.verbosity = SdGate::Verbosity::Diags;
  cfg.logCallback = SdGate::serialLogCallback;
  return cfg;
}

static SdGate::ArduinoSpiTransport g_transport;
static SdGate::ArduinoClock g_clock;
static SdGate::SdFatFilesystem g_fs;
static SdGate::HardwareHandle g_handle(g_transport, g_clock, makeConfig());
static SdGate::SdSpiBlockDevice g_device(g_handle);
static SdGate::ValidationSequencer g_sequencer;
static SdGate::MountOrchestrator g_orchestrator(g_fs, g_clock, g_handle.config());
static SdGate::LivenessKeeper g_keeper(g_device);

static SdGate::ReadinessReport g_report;
static SdGate::MountSession g_session;
static bool g_haveReport = false;
static bool g_autoKeepalive = true;

static void printHelp() {
  Serial.println(F("SdGate CLI " SDGATE_VERSION));
  Serial.println(F("  help                 Show this help"));
  Serial.println(F("  status               Handle and session state"));
  Serial.println(F("  validate             Full pre-mount validation"));
  Serial.println(F("  mbr                  Communication probe and MBR read only"));
  Serial.println(F("  mount                Mount using the last report"));
  Serial.println(F("  unmount              Release the filesystem"));
  Serial.println(F("  ls [path]            List a directory"));
  Serial.println(F("  stats                Filesystem usage"));
  Serial.println(F("  stability <passes>   Repeat the root listing and compare counts"));
  Serial.println(F("  tick                 Run one keepalive check now"));
  Serial.println(F("  keepalive <on|off>   Automatic keepalive in loop()"));
  Serial.println(F("  rebuild              Discard the handle and re-claim the bus"));
}

static void printBytes(const char* label, uint64_t bytes) {
  Serial.printf("  %-18s %llu (%.2f GB)\n", label, static_cast<unsigned long long>(bytes),
                static_cast<double>(bytes) / 1e9);
}

static void printReport(const SdGate::ReadinessReport& r) {
  const SdGate::ReadinessVerdict verdict = SdGate::classifyReadiness(r);

  Serial.println(F("--- Readiness report ---"));
  Serial.printf("  comm:      %s (%s, %lu ms)\n", r.commInitOk ? "OK" : "FAIL",
                SdGate::initErrorToStr(r.initError), static_cast<unsigned long>(r.elapsed.commMs));
  if (r.commInitOk) {
    Serial.printf("  card:      %s, %lu blocks, OCR 0x%08lX\n",
                  SdGate::cardTypeToStr(r.identity.type), static_cast<unsigned long>(r.blockCount),
                  static_cast<unsigned long>(r.identity.ocr));
    printBytes("reported:", r.reportedCapacityBytes);
    printBytes("nominal class:", r.nominalClassBytes);
    if (r.capacityMismatch) {
      printBytes("expected:", r.expectedNominalBytes);
    }
  }
  Serial.printf("  mbr:       %s%s (%s, %lu ms)\n", r.mbrReadOk ? "OK" : "FAIL",
                r.mbrHung ? " HUNG" : "", SdGate::readErrorToStr(r.mbrReadError),
                static_cast<unsigned long>(r.elapsed.mbrMs));
  if (r.mbrReadOk) {
    Serial.printf("  signature: %02X %02X (%s)\n", r.mbrSignature[0], r.mbrSignature[1],
                  r.mbrSignatureValid ? "valid" : "invalid");
    Serial.printf("  partition: 0x%02X %s\n", r.partitionTypeByte,
                  SdGate::partitionTypeName(r.partitionTypeByte));
  }
  if (r.multiblockAttempted) {
    Serial.printf("  sustained: %s%s (%u blocks, %lu ms)\n", r.multiblockReadOk ? "OK" : "FAIL",
                  r.multiblockHung ? " HUNG" : "", static_cast<unsigned>(r.multiblockBlocksRead),
                  static_cast<unsigned long>(r.elapsed.multiblockMs));
    if (!r.multiblockReadOk) {
      Serial.printf("  failed at: block %lu (%s)\n",
                    static_cast<unsigned long>(r.multiblockFailedBlock),
                    SdGate::readErrorToStr(r.multiblockReadError));
    }
  }
  Serial.printf("  total:     %lu ms\n", static_cast<unsigned long>(r.elapsed.totalMs));
  Serial.printf("  verdict:   %s\n", SdGate::verdictToStr(verdict));
  Serial.printf("  guidance:  %s\n", SdGate::verdictGuidance(verdict));
}

static void printStatus() {
  const SdGate::ErrorInfo err = g_handle.lastErrorInfo();
  Serial.println(F("--- Status ---"));
  Serial.printf("  claimed=%d poisoned=%d mounted=%d generation=%lu\n", g_handle.claimed(),
                g_handle.poisoned(), g_handle.mounted(),
                static_cast<unsigned long>(g_handle.generation()));
  Serial.printf("  device ready=%d  idle=%lu ms  keepalive=%s\n", g_device.ready(),
                static_cast<unsigned long>(g_clock.millis() - g_handle.lastActivityMs()),
                g_autoKeepalive ? "on" : "off");
  Serial.printf("  last error: %s op=%s detail=%ld block=%lu\n", SdGate::errorCodeToStr(err.code),
                SdGate::operationToStr(err.op), static_cast<long>(err.detail),
                static_cast<unsigned long>(err.block));
  if (g_session.active) {
    Serial.printf("  session: %s mounted in %lu ms\n", g_session.mountPoint,
                  static_cast<unsigned long>(g_session.mountDurationMs));
  }
}

static void printEntry(const char* name, bool isDir, uint64_t size, void* user) {
  (void)user;
  if (isDir) {
    Serial.printf("  %s/\n", name);
  } else {
    Serial.printf("  %s  %llu\n", name, static_cast<unsigned long long>(size));
  }
}

static void doValidate(bool mbrOnly) {
  if (g_session.active) {
    LOGE("Unmount first");
    return;
  }
  if (mbrOnly) {
    g_report = g_sequencer.readMbrOnly(g_device,
                                       SdGate::ValidationSequencer::budgetFrom(g_handle.config()));
  } else {
    g_report = g_sequencer.validate(g_device);
  }
  g_haveReport = true;
  printReport(g_report);
}

static void doMount() {
  if (!g_haveReport) {
    LOGE("Run validate first");
    return;
  }
  const SdGate::MountError err = g_orchestrator.mount(g_device, g_handle, g_report, &g_session);
  if (err != SdGate::MountError::Ok) {
    LOGE("Mount failed: %s", SdGate::mountErrorToStr(err));
    return;
  }
  LOGI("Mounted at %s in %lu ms", g_session.mountPoint,
       static_cast<unsigned long>(g_session.mountDurationMs));
}

static void doStats() {
  SdGate::FsStats st{};
  if (!g_orchestrator.stats(g_session, &st)) {
    LOGE("Stats failed");
    return;
  }
  printBytes("total:", st.totalBytes);
  printBytes("used:", st.usedBytes);
  printBytes("free:", st.freeBytes);
}

static void doRebuild() {
  const SdGate::ErrorCode err = g_handle.rebuild();
  if (err != SdGate::ErrorCode::Ok) {
    LOGE("Rebuild failed: %s", SdGate::errorCodeToStr(err));
    return;
  }
  g_haveReport = false;
  LOGI("Handle rebuilt (generation %lu)", static_cast<unsigned long>(g_handle.generation()));
}

static bool parseU32(const char* s, uint32_t* out) {
  if (!s || !out) {
    return false;
  }
  char* end = nullptr;
  const unsigned long v = strtoul(s, &end, 10);
  if (end == s || *end != '\0') {
    return false;
  }
  *out = static_cast<uint32_t>(v);
  return true;
}

static void doStability(const char* arg) {
  uint32_t passes = 0;
  if (!parseU32(arg, &passes) || passes == 0 || passes > 255) {
    LOGE("Usage: stability <1..255>");
    return;
  }
  const int32_t failedPass =
      g_orchestrator.verifyStability(g_session, static_cast<uint8_t>(passes));
  if (failedPass < 0) {
    LOGI("Listing stable over %lu passes", static_cast<unsigned long>(passes));
  } else {
    LOGE("Listing unstable at pass %ld", static_cast<long>(failedPass));
  }
}

static void processLine(char* line) {
  char* cmd = strtok(line, " ");
  if (!cmd) {
    return;
  }

  if (strcmp(cmd, "help") == 0) {
    printHelp();
  } else if (strcmp(cmd, "status") == 0) {
    printStatus();
  } else if (strcmp(cmd, "validate") == 0) {
    doValidate(false);
  } else if (strcmp(cmd, "mbr") == 0) {
    doValidate(true);
  } else if (strcmp(cmd, "mount") == 0) {
    doMount();
  } else if (strcmp(cmd, "unmount") == 0) {
    g_orchestrator.unmount(g_session);
    LOGI("Unmounted");
  } else if (strcmp(cmd, "ls") == 0) {
    char* path = strtok(nullptr, " ");
    const int32_t count = g_orchestrator.listDirectory(g_session, path, printEntry, nullptr);
    if (count < 0) {
      LOGE("List failed");
    } else {
      LOGI("%ld entries", static_cast<long>(count));
    }
  } else if (strcmp(cmd, "stats") == 0) {
    doStats();
  } else if (strcmp(cmd, "stability") == 0) {
    doStability(strtok(nullptr, " "));
  } else if (strcmp(cmd, "tick") == 0) {
    LOGI("Keepalive: %s", SdGate::keepaliveResultToStr(g_keeper.tick()));
  } else if (strcmp(cmd, "keepalive") == 0) {
    char* arg = strtok(nullptr, " ");
    if (arg && strcmp(arg, "on") == 0) {
      g_autoKeepalive = true;
    } else if (arg && strcmp(arg, "off") == 0) {
      g_autoKeepalive = false;
    } else {
      LOGE("Usage: keepalive <on|off>");
    }
  } else if (strcmp(cmd, "rebuild") == 0) {
    doRebuild();
  } else {
    LOGE("Unknown command");
  }
}

void setup() {
  log_begin(115200);
  delay(100);

  if (g_handle.claim() != SdGate::ErrorCode::Ok) {
    LOGE("SPI claim failed");
  }

  printHelp();
  Serial.println(F("Ready."));
}

void loop() {
  if (g_autoKeepalive) {
    const SdGate::KeepaliveResult res = g_keeper.tick();
    if (res == SdGate::KeepaliveResult::Failed) {
      LOGW("Keepalive failed; run status");
    }
  }

  static char lineBuf[128]{};
  static size_t lineLen = 0;
  while (Serial.available()) {
    const char c = static_cast<char>(Serial.read());
    if (c == '\r') {
      continue;
    }
    if (c == '\n') {
      lineBuf[lineLen] = '\0';
      processLine(lineBuf);
      lineLen = 0;
      continue;
    }
    if (lineLen + 1 < sizeof(lineBuf)) {
      lineBuf[lineLen++] = c;
    }
  }
}
