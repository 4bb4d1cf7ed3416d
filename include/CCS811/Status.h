/// @file Status.h
/// @brief Error codes and status handling for CCS811 driver
#pragma once

#include <cstdint>

namespace CCS811 {

/// Error codes for all CCS811 operations
enum class Err : uint8_t {
  OK = 0,                     ///< Operation successful
  NOT_INITIALIZED,            ///< begin() not called or did not complete
  INVALID_CONFIG,             ///< Invalid configuration parameter
  I2C_ERROR,                  ///< I2C communication failure (unspecified)
  I2C_NACK_ADDR,              ///< Address not acknowledged
  I2C_NACK_DATA,              ///< Data byte not acknowledged
  I2C_TIMEOUT,                ///< I2C transaction timed out
  I2C_BUS,                    ///< Bus/arbitration error
  GPIO_ERROR,                 ///< WAKE line could not be driven
  TIMEOUT,                    ///< Wait loop timed out (clock stalled)
  INVALID_PARAM,              ///< Invalid parameter value
  DEVICE_NOT_FOUND,           ///< Device not responding on I2C bus
  HW_ID_MISMATCH,             ///< HW_ID != 0x81 (not a CCS811)
  STATUS_MISMATCH,            ///< STATUS lacks required bits at a checkpoint
  OUT_OF_RANGE,               ///< eCO2/tVOC outside the valid range
  SENSOR_ERROR,               ///< Sensor set the error byte in ALG_RESULT_DATA
  FLASH_NOT_VALID,            ///< No valid application before erase
  FLASH_NOT_ERASED,           ///< APP_ERASE not set after erase command
  FLASH_WRITE_FAILED,         ///< Firmware chunk write failed
  FLASH_NOT_VERIFIED,         ///< Verify did not report erase/verify/valid
  FLASH_INVALID_AFTER_RESET   ///< APP_VALID not set after final reset
};

/// Status structure returned by all fallible operations
struct Status {
  Err code = Err::OK;
  int32_t detail = 0;        ///< Implementation-specific detail (e.g., I2C error code)
  const char* msg = "";      ///< Static string describing the error

  constexpr Status() = default;
  constexpr Status(Err c, int32_t d, const char* m) : code(c), detail(d), msg(m) {}

  /// @return true if operation succeeded
  constexpr bool ok() const { return code == Err::OK; }

  /// Create a success status
  static constexpr Status Ok() { return Status{Err::OK, 0, "OK"}; }

  /// Create an error status
  static constexpr Status Error(Err err, const char* message, int32_t detailCode = 0) {
    return Status{err, detailCode, message};
  }
};

} // namespace CCS811
