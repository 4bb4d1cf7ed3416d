/// @file Config.h
/// @brief Configuration structure for CCS811 driver
#pragma once

#include <cstddef>
#include <cstdint>
#include "CCS811/Status.h"

namespace CCS811 {

/// I2C write callback signature
/// @param addr     I2C device address (7-bit)
/// @param data     Pointer to data to write (register address first)
/// @param len      Number of bytes to write
/// @param timeoutMs Maximum time to wait for completion
/// @param user     User context pointer passed through from Config
/// @return Status indicating success or failure. Transport SHOULD distinguish:
///         - Err::I2C_NACK_ADDR (address NACK)
///         - Err::I2C_NACK_DATA (data NACK)
///         - Err::I2C_TIMEOUT (timeout)
///         - Err::I2C_BUS (bus/arbitration error)
///         - Err::I2C_ERROR (unspecified I2C error)
using I2cWriteFn = Status (*)(uint8_t addr, const uint8_t* data, size_t len,
                              uint32_t timeoutMs, void* user);

/// I2C write-read callback signature (register read)
/// @param addr     I2C device address (7-bit)
/// @param txData   Register address to select (1 byte for CCS811)
/// @param txLen    Number of bytes to write before the read
/// @param rxData   Pointer to buffer for read data
/// @param rxLen    Number of bytes to read
/// @param timeoutMs Maximum time to wait for completion
/// @param user     User context pointer passed through from Config
/// @return Status indicating success or failure
/// @note CCS811 accepts a repeated start between the register write and the
///       read, so a combined transaction is allowed.
using I2cWriteReadFn = Status (*)(uint8_t addr, const uint8_t* txData, size_t txLen,
                                  uint8_t* rxData, size_t rxLen, uint32_t timeoutMs,
                                  void* user);

/// Optional nWAKE line callback
/// @param high  true drives the line high (sensor idle), false drives it low (awake)
/// @param user  User context pointer (Config::wakeUser)
/// @return Status indicating success or failure
/// @note Leave Config::wakeWrite as nullptr when nWAKE is tied to GND.
using WakeWriteFn = Status (*)(bool high, void* user);

/// Firmware flashing progress callback
/// @param written Bytes written so far
/// @param total   Image size in bytes
/// @param user    User context pointer passed to flash()
using FlashProgressFn = void (*)(size_t written, size_t total, void* user);

/// Measurement drive mode (MEAS_MODE bits 6:4)
/// @note Switching to a faster mode (e.g. MODE_60S -> MODE_1S) requires the
///       sensor to sit in IDLE for at least 10 minutes first. Not enforced.
enum class DriveMode : uint8_t {
  IDLE = 0,      ///< Measurements disabled
  MODE_1S = 1,   ///< Constant power, sample every second
  MODE_10S = 2,  ///< Pulse heating, sample every 10 seconds
  MODE_60S = 3   ///< Low power pulse heating, sample every 60 seconds
};

/// Configuration for CCS811 driver
struct Config {
  // === I2C Transport (required) ===
  I2cWriteFn i2cWrite = nullptr;        ///< I2C write function pointer
  I2cWriteReadFn i2cWriteRead = nullptr; ///< I2C write-read function pointer
  void* i2cUser = nullptr;               ///< User context for I2C callbacks

  // === nWAKE line (optional) ===
  WakeWriteFn wakeWrite = nullptr;       ///< nWAKE driver, nullptr if not wired
  void* wakeUser = nullptr;              ///< User context for wakeWrite

  // === Device Settings ===
  uint8_t i2cAddress = 0x5A;             ///< 0x5A (ADDR=GND) or 0x5B (ADDR=VDD)
  uint32_t i2cTimeoutMs = 50;            ///< I2C transaction timeout in ms

  // === Health Tracking ===
  uint8_t offlineThreshold = 5;          ///< Consecutive failures before OFFLINE
};

} // namespace CCS811
