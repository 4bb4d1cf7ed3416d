/// @file I2cScanner.h
/// @brief I2C bus scanner that flags CCS811 candidates
/// @note NOT part of the library - examples only
#pragma once

#include <Arduino.h>
#include <Wire.h>
#include "CCS811/CommandTable.h"
#include "Log.h"

namespace i2c {

/// True if addr is one of the two CCS811 strap addresses (ADDR pin low/high)
inline bool isCcs811Address(uint8_t addr) {
  return addr == CCS811::cmd::I2C_ADDR_PRIMARY ||
         addr == CCS811::cmd::I2C_ADDR_SECONDARY;
}

/// Scan I2C bus and print found devices
/// A CCS811 with nWAKE released does not ACK; pull nWAKE low before scanning.
/// @return Number of devices found
inline int scan() {
  LOGI("Scanning I2C bus...");

  int count = 0;
  for (uint8_t addr = 1; addr < 127; addr++) {
    Wire.beginTransmission(addr);
    if (Wire.endTransmission() != 0) {
      continue;
    }
    Serial.printf("  Found device at 0x%02X%s\n", addr,
                  isCcs811Address(addr) ? " (CCS811?)" : "");
    count++;
  }

  if (count == 0) {
    LOGW("No I2C devices found");
  } else {
    LOGI("Found %d device(s)", count);
  }

  return count;
}

} // namespace i2c
