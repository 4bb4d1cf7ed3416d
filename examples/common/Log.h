/// @file Log.h
/// @brief Serial logging macros for examples
/// @note NOT part of the library - examples only
#pragma once

#include <Arduino.h>

#define LOGI(fmt, ...) Serial.printf("[I] " fmt "\n", ##__VA_ARGS__)
#define LOGW(fmt, ...) Serial.printf("[W] " fmt "\n", ##__VA_ARGS__)
#define LOGE(fmt, ...) Serial.printf("[E] " fmt "\n", ##__VA_ARGS__)

/// Start the serial console used by the LOG macros
inline void log_begin(uint32_t baud) {
  Serial.begin(baud);
  while (!Serial && millis() < 3000) {
  }
}
