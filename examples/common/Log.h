/**
 * @file Log.h
 * @brief Serial logging helpers for the examples.
 */

#pragma once

#include <Arduino.h>

inline void log_begin(unsigned long baud) {
  Serial.begin(baud);
  while (!Serial && millis() < 2000) {
    delay(10);
  }
}

#define LOGE(fmt, ...) Serial.printf("[E] " fmt "\n", ##__VA_ARGS__)
#define LOGW(fmt, ...) Serial.printf("[W] " fmt "\n", ##__VA_ARGS__)
#define LOGI(fmt, ...) Serial.printf("[I] " fmt "\n", ##__VA_ARGS__)
