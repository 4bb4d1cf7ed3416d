/// @file CCS811.h
/// @brief Main driver class for CCS811
#pragma once

#include <cstddef>
#include <cstdint>
#include "CCS811/Status.h"
#include "CCS811/Config.h"
#include "CCS811/CommandTable.h"

namespace CCS811 {

/// Driver state for health monitoring
enum class DriverState : uint8_t {
  UNINIT,    ///< begin() not called, did not complete, or end() called
  READY,     ///< Operational, consecutiveFailures == 0
  DEGRADED,  ///< 1 <= consecutiveFailures < offlineThreshold
  OFFLINE    ///< consecutiveFailures >= offlineThreshold
};

/// Algorithm result (ALG_RESULT_DATA)
struct Measurement {
  uint16_t eco2Ppm = 0;   ///< Equivalent CO2, 0..8192 ppm
  uint16_t tvocPpb = 0;   ///< Total VOC, 0..1187 ppb
  uint8_t raw[cmd::ALG_RESULT_LEN] = {}; ///< Register block as read, for diagnostics
};

/// Parsed STATUS register
struct StatusRegister {
  uint8_t raw = 0;
  bool appMode = false;    ///< Application running (else boot mode)
  bool appErase = false;   ///< Application erase completed
  bool appVerify = false;  ///< Application verify completed
  bool appValid = false;   ///< Valid application firmware loaded
  bool dataReady = false;  ///< New sample in ALG_RESULT_DATA
  bool error = false;      ///< ERROR_ID holds an error
};

/// Raw two-byte version register (not interpreted)
struct VersionBytes {
  uint8_t raw[cmd::VERSION_LEN] = {0, 0};
};

/// CCS811 driver class
class CCS811 {
public:
  // =========================================================================
  // Lifecycle
  // =========================================================================

  /// Initialize the driver and bring the sensor into application mode.
  /// Sequence: wake -> software reset -> HW_ID check -> APP_START ->
  /// STATUS check (FW_MODE) -> sleep. The first failing step aborts.
  /// The configuration is kept even if the sequence fails so that flash()
  /// and the version reads remain usable on a sensor stuck in boot mode.
  /// @param config Configuration including transport callbacks
  /// @return Status::Ok() on success, error otherwise
  Status begin(const Config& config);

  /// Shutdown the driver and forget the configuration
  void end();

  // =========================================================================
  // Diagnostics
  // =========================================================================

  /// Check that a CCS811 answers on the bus (no health tracking)
  /// @return Status::Ok() if HW_ID reads 0x81, error otherwise
  Status probe();

  // =========================================================================
  // Driver State
  // =========================================================================

  /// Get current driver state
  DriverState state() const { return _driverState; }

  /// Check if driver is ready for operations
  bool isOnline() const {
    return _driverState == DriverState::READY ||
           _driverState == DriverState::DEGRADED;
  }

  /// True once begin() completed and the sensor runs its application
  bool isInitialized() const { return _initialized; }

  // =========================================================================
  // Health Tracking
  // =========================================================================

  /// Timestamp of last successful I2C operation
  uint32_t lastOkMs() const { return _lastOkMs; }

  /// Timestamp of last failed I2C operation
  uint32_t lastErrorMs() const { return _lastErrorMs; }

  /// Most recent error status
  Status lastError() const { return _lastError; }

  /// Consecutive failures since last success
  uint8_t consecutiveFailures() const { return _consecutiveFailures; }

  /// Total failure count (lifetime)
  uint32_t totalFailures() const { return _totalFailures; }

  /// Total success count (lifetime)
  uint32_t totalSuccess() const { return _totalSuccess; }

  // =========================================================================
  // Measurement API
  // =========================================================================

  /// Select drive mode. The first sample is available one full interval
  /// after the mode is set (e.g. 60 s for MODE_60S).
  Status start(DriveMode mode);

  /// Read the latest eCO2/tVOC sample (wakes the sensor around the read)
  /// Fails with SENSOR_ERROR if the error byte is set, OUT_OF_RANGE if a
  /// value exceeds its valid range.
  Status read(Measurement& out);

  /// Write compensation data (humidity in %RH, temperature in degC)
  /// Values must satisfy 0 <= v < 128; nothing is checked.
  Status setEnvData(float humidityPct, float temperatureC);

  /// Read the BASELINE calibration word
  Status getBaseline(uint16_t& out);

  /// Write the BASELINE calibration word (value is not validated)
  Status setBaseline(uint16_t baseline);

  // =========================================================================
  // Identification / Status
  // =========================================================================

  /// Read HW_VERSION (typically 0x1X)
  Status hardwareVersion(uint8_t& out);

  /// Read FW_BOOT_VERSION
  Status bootloaderVersion(VersionBytes& out);

  /// Read FW_APP_VERSION
  Status applicationVersion(VersionBytes& out);

  /// Read raw STATUS register
  Status readStatus(uint8_t& raw);

  /// Read and parse STATUS register
  Status readStatus(StatusRegister& out);

  /// Read raw ERROR_ID register
  Status readErrorId(uint8_t& out);

  // =========================================================================
  // Firmware Update
  // =========================================================================

  /// Replace the application firmware.
  /// Sequence: reset -> APP_VALID check -> erase -> APP_ERASE check ->
  /// write 8-byte chunks -> verify -> ERASE|VERIFY|VALID check -> reset ->
  /// APP_VALID check. No step is retried. On failure the bootloader stays
  /// usable and the procedure can be started again. On success the sensor
  /// is in boot mode; call begin() to start the new application.
  /// A failed chunk returns FLASH_WRITE_FAILED with detail = chunk offset.
  /// The underlying transport error is then only available via lastError().
  /// @param image Firmware binary (opaque)
  /// @param len Image size in bytes
  /// @param progress Optional callback invoked after each chunk
  /// @param progressUser User context for progress
  Status flash(const uint8_t* image, size_t len,
               FlashProgressFn progress = nullptr, void* progressUser = nullptr);

  // =========================================================================
  // Helpers
  // =========================================================================

  /// Encode one ENV_DATA field (7-bit integer, 9-bit fraction)
  static void encodeEnvValue(float value, uint8_t out[2]);

  /// Decode and validate an ALG_RESULT_DATA block
  static Status decodeAlgResult(const uint8_t* raw, size_t len, Measurement& out);

  /// Parse STATUS register bits
  static StatusRegister parseStatus(uint8_t raw);

private:
  // =========================================================================
  // Transport Wrappers
  // =========================================================================

  /// Raw I2C write-read (no health tracking)
  Status _i2cWriteReadRaw(const uint8_t* txBuf, size_t txLen,
                          uint8_t* rxBuf, size_t rxLen);

  /// Raw I2C write (no health tracking)
  Status _i2cWriteRaw(const uint8_t* buf, size_t len);

  /// Tracked I2C write-read (updates health)
  Status _i2cWriteReadTracked(const uint8_t* txBuf, size_t txLen,
                              uint8_t* rxBuf, size_t rxLen);

  /// Tracked I2C write (updates health)
  Status _i2cWriteTracked(const uint8_t* buf, size_t len);

  // =========================================================================
  // Register Access
  // =========================================================================

  Status _readRegs(uint8_t reg, uint8_t* buf, size_t len);
  Status _writeRegs(uint8_t reg, const uint8_t* buf, size_t len);
  Status _writeCommand(uint8_t reg);

  // =========================================================================
  // Health Management
  // =========================================================================

  /// Update health counters and state based on operation result
  /// Called ONLY from tracked transport wrappers
  Status _updateHealth(const Status& st);

  // =========================================================================
  // Sequence Steps
  // =========================================================================

  Status _wake();
  Status _sleep();
  Status _softReset();
  Status _checkHwId();
  Status _appStart();
  Status _eraseApp();
  Status _verifyApp();
  Status _requireStatus(uint8_t mask, Err failCode, const char* failMsg);
  Status _writeFirmware(const uint8_t* image, size_t len,
                        FlashProgressFn progress, void* progressUser);
  Status _runBeginSequence();

  Status _waitMs(uint32_t delayMs);
  Status _waitUs(uint32_t delayUs);

  static Status _withContext(const Status& st, const char* msg);
  static bool _timeElapsed(uint32_t now, uint32_t target);

  // =========================================================================
  // State
  // =========================================================================

  Config _config;
  bool _configured = false;
  bool _initialized = false;
  DriverState _driverState = DriverState::UNINIT;

  // Health counters
  uint32_t _lastOkMs = 0;
  uint32_t _lastErrorMs = 0;
  Status _lastError = Status::Ok();
  uint8_t _consecutiveFailures = 0;
  uint32_t _totalFailures = 0;
  uint32_t _totalSuccess = 0;
};

} // namespace CCS811
