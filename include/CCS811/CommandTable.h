/// @file CommandTable.h
/// @brief Register map, bit masks and timing for CCS811
#pragma once

#include <cstdint>
#include <cstddef>

namespace CCS811 {
namespace cmd {

// ============================================================================
// I2C Addresses (7-bit)
// ============================================================================

static constexpr uint8_t I2C_ADDR_PRIMARY = 0x5A;
static constexpr uint8_t I2C_ADDR_SECONDARY = 0x5B;

// ============================================================================
// Registers / mailboxes
// ============================================================================

static constexpr uint8_t REG_STATUS = 0x00;           // 1 byte
static constexpr uint8_t REG_MEAS_MODE = 0x01;        // 1 byte
static constexpr uint8_t REG_ALG_RESULT_DATA = 0x02;  // up to 8 bytes
static constexpr uint8_t REG_ENV_DATA = 0x05;         // 4 bytes
static constexpr uint8_t REG_BASELINE = 0x11;         // 2 bytes
static constexpr uint8_t REG_HW_ID = 0x20;            // 1 byte
static constexpr uint8_t REG_HW_VERSION = 0x21;       // 1 byte
static constexpr uint8_t REG_FW_BOOT_VERSION = 0x23;  // 2 bytes
static constexpr uint8_t REG_FW_APP_VERSION = 0x24;   // 2 bytes
static constexpr uint8_t REG_ERROR_ID = 0xE0;         // 1 byte
static constexpr uint8_t REG_APP_ERASE = 0xF1;        // 4 bytes
static constexpr uint8_t REG_APP_DATA = 0xF2;         // 8 bytes per chunk
static constexpr uint8_t REG_APP_VERIFY = 0xF3;       // command, no data
static constexpr uint8_t REG_APP_START = 0xF4;        // command, no data
static constexpr uint8_t REG_SW_RESET = 0xFF;         // 4 bytes

// ============================================================================
// Magic sequences
// ============================================================================

static constexpr uint8_t SW_RESET_SEQ[4] = {0x11, 0xE5, 0x72, 0x8A};
static constexpr uint8_t APP_ERASE_SEQ[4] = {0xE7, 0xA7, 0xE6, 0x09};

static constexpr uint8_t HW_ID_VALUE = 0x81;

// ============================================================================
// STATUS register bit masks
// ============================================================================

static constexpr uint8_t STATUS_APP_MODE = 0x80;    // FW_MODE: else boot mode
static constexpr uint8_t STATUS_APP_ERASE = 0x40;   // erase completed
static constexpr uint8_t STATUS_APP_VERIFY = 0x20;  // verify completed
static constexpr uint8_t STATUS_APP_VALID = 0x10;   // valid application loaded
static constexpr uint8_t STATUS_DATA_READY = 0x08;  // new sample ready
static constexpr uint8_t STATUS_ERROR = 0x01;       // see ERROR_ID

// ============================================================================
// MEAS_MODE fields
// ============================================================================

static constexpr uint8_t MEAS_MODE_DRIVE_SHIFT = 4;
static constexpr uint8_t MEAS_MODE_DRIVE_MASK = 0x70;

// ============================================================================
// Timing (datasheet values, increased where the sensor needs more)
// ============================================================================

static constexpr uint32_t WAIT_AFTER_WAKE_US = 50;
static constexpr uint32_t WAIT_AFTER_RESET_US = 2000;
static constexpr uint32_t WAIT_AFTER_APP_START_US = 1000;
static constexpr uint32_t WAIT_AFTER_APP_ERASE_MS = 500;  // 300 ms from datasheet is not enough
static constexpr uint32_t WAIT_AFTER_APP_DATA_MS = 50;
static constexpr uint32_t WAIT_AFTER_APP_VERIFY_MS = 70;

// ============================================================================
// Data lengths and limits
// ============================================================================

static constexpr size_t ALG_RESULT_LEN = 8;
static constexpr size_t ALG_ERROR_BYTE = 5;
static constexpr size_t ENV_DATA_LEN = 4;
static constexpr size_t BASELINE_LEN = 2;
static constexpr size_t VERSION_LEN = 2;
static constexpr size_t APP_DATA_CHUNK_LEN = 8;

static constexpr uint16_t ECO2_MAX_PPM = 8192;
static constexpr uint16_t TVOC_MAX_PPB = 1187;

static constexpr uint16_t ENV_FRACTION_MAX = 511;  // 9-bit fraction field

} // namespace cmd
} // namespace CCS811
