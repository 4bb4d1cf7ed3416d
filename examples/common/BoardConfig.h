/**
 * @file BoardConfig.h
 * @brief Example wiring of a CCS811 breakout to ESP32-S2 / ESP32-S3 boards.
 *
 * NOT part of the library API. The driver only sees the callbacks and
 * address passed through CCS811::Config.
 */

#pragma once

#include <stdint.h>

#include "common/I2cTransport.h"

namespace board {

/// @brief I2C SDA pin.
static constexpr int I2C_SDA = 8;

/// @brief I2C SCL pin.
static constexpr int I2C_SCL = 9;

/// @brief I2C clock in Hz. CCS811 stretches SCL, 100 kHz is safest.
static constexpr uint32_t I2C_FREQ_HZ = 100000;

/// @brief Per-transaction timeout handed to the driver and to Wire.
static constexpr uint16_t I2C_TIMEOUT_MS = 50;

/// @brief CCS811 nWAKE pin (active low). -1 if nWAKE is tied to GND.
static constexpr int CCS811_WAKE = 10;

/// @brief Bring up Wire with the pins and clock above.
inline bool initI2c() {
  return transport::initWire(I2C_SDA, I2C_SCL, I2C_FREQ_HZ, I2C_TIMEOUT_MS);
}

}  // namespace board
