/**
 * @file CCS811.cpp
 * @brief CCS811 driver implementation.
 */

#include "CCS811/CCS811.h"

#include <Arduino.h>
#include <cmath>
#include <cstring>
#include <limits>

namespace CCS811 {
namespace {

static constexpr size_t MAX_WRITE_LEN = cmd::APP_DATA_CHUNK_LEN;
static constexpr uint32_t MAX_SPIN_ITERS = 500000;

static bool isValidDriveMode(DriveMode mode) {
  return mode == DriveMode::IDLE || mode == DriveMode::MODE_1S ||
         mode == DriveMode::MODE_10S || mode == DriveMode::MODE_60S;
}

// Truncating float -> integer conversions that saturate instead of
// overflowing. NaN maps to 0.
static uint16_t truncToU16(float value) {
  if (!(value > 0.0f)) {
    return 0;
  }
  if (value >= 65535.0f) {
    return std::numeric_limits<uint16_t>::max();
  }
  return static_cast<uint16_t>(value);
}

static uint8_t truncToU8(float value) {
  if (!(value > 0.0f)) {
    return 0;
  }
  if (value >= 255.0f) {
    return std::numeric_limits<uint8_t>::max();
  }
  return static_cast<uint8_t>(value);
}

}  // namespace

Status CCS811::begin(const Config& config) {
  _configured = false;
  _initialized = false;
  _driverState = DriverState::UNINIT;

  _lastOkMs = 0;
  _lastErrorMs = 0;
  _lastError = Status::Ok();
  _consecutiveFailures = 0;
  _totalFailures = 0;
  _totalSuccess = 0;

  if (config.i2cWrite == nullptr || config.i2cWriteRead == nullptr) {
    return Status::Error(Err::INVALID_CONFIG, "I2C callbacks not set");
  }
  if (config.i2cTimeoutMs == 0) {
    return Status::Error(Err::INVALID_CONFIG, "I2C timeout must be > 0");
  }
  if (config.i2cAddress != cmd::I2C_ADDR_PRIMARY &&
      config.i2cAddress != cmd::I2C_ADDR_SECONDARY) {
    return Status::Error(Err::INVALID_CONFIG, "Invalid I2C address");
  }

  _config = config;
  if (_config.offlineThreshold == 0) {
    _config.offlineThreshold = 1;
  }
  _configured = true;

  Status st = _wake();
  if (!st.ok()) {
    return st;
  }

  st = _runBeginSequence();

  // nWAKE is released on every path once it was asserted.
  Status sleepSt = _sleep();
  if (!st.ok()) {
    return st;
  }
  if (!sleepSt.ok()) {
    return sleepSt;
  }

  _initialized = true;
  _driverState = DriverState::READY;

  return Status::Ok();
}

void CCS811::end() {
  _configured = false;
  _initialized = false;
  _driverState = DriverState::UNINIT;
}

Status CCS811::probe() {
  if (!_configured) {
    return Status::Error(Err::NOT_INITIALIZED, "begin() not called");
  }

  const uint8_t reg = cmd::REG_HW_ID;
  uint8_t hwId = 0;
  Status st = _i2cWriteReadRaw(&reg, 1, &hwId, 1);
  if (!st.ok()) {
    return Status::Error(Err::DEVICE_NOT_FOUND, "Device not responding", st.detail);
  }
  if (hwId != cmd::HW_ID_VALUE) {
    return Status::Error(Err::HW_ID_MISMATCH, "HW_ID is not 0x81", hwId);
  }

  return Status::Ok();
}

Status CCS811::start(DriveMode mode) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "begin() not called");
  }
  if (!isValidDriveMode(mode)) {
    return Status::Error(Err::INVALID_PARAM, "Invalid drive mode");
  }

  Status st = _wake();
  if (!st.ok()) {
    return st;
  }

  const uint8_t measMode = static_cast<uint8_t>(
      (static_cast<uint8_t>(mode) << cmd::MEAS_MODE_DRIVE_SHIFT) & cmd::MEAS_MODE_DRIVE_MASK);
  Status writeSt = _writeRegs(cmd::REG_MEAS_MODE, &measMode, 1);

  st = _sleep();
  if (!writeSt.ok()) {
    return _withContext(writeSt, "Could not set MEAS_MODE");
  }
  return st;
}

Status CCS811::read(Measurement& out) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "begin() not called");
  }

  Status st = _wake();
  if (!st.ok()) {
    return st;
  }

  uint8_t buf[cmd::ALG_RESULT_LEN] = {};
  Status readSt = _readRegs(cmd::REG_ALG_RESULT_DATA, buf, sizeof(buf));

  st = _sleep();
  if (!readSt.ok()) {
    return _withContext(readSt, "Could not read ALG_RESULT_DATA");
  }
  if (!st.ok()) {
    return st;
  }

  return decodeAlgResult(buf, sizeof(buf), out);
}

Status CCS811::setEnvData(float humidityPct, float temperatureC) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "begin() not called");
  }

  uint8_t data[cmd::ENV_DATA_LEN] = {};
  encodeEnvValue(humidityPct, &data[0]);
  encodeEnvValue(temperatureC, &data[2]);

  Status st = _writeRegs(cmd::REG_ENV_DATA, data, sizeof(data));
  if (!st.ok()) {
    return _withContext(st, "Could not write ENV_DATA");
  }
  return Status::Ok();
}

Status CCS811::getBaseline(uint16_t& out) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "begin() not called");
  }

  uint8_t buf[cmd::BASELINE_LEN] = {};
  Status st = _readRegs(cmd::REG_BASELINE, buf, sizeof(buf));
  if (!st.ok()) {
    return _withContext(st, "Could not read BASELINE");
  }

  // SMBus word order: low byte first
  out = static_cast<uint16_t>(buf[0] | (static_cast<uint16_t>(buf[1]) << 8));
  return Status::Ok();
}

Status CCS811::setBaseline(uint16_t baseline) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "begin() not called");
  }

  const uint8_t buf[cmd::BASELINE_LEN] = {
    static_cast<uint8_t>(baseline & 0xFF),
    static_cast<uint8_t>((baseline >> 8) & 0xFF)
  };
  Status st = _writeRegs(cmd::REG_BASELINE, buf, sizeof(buf));
  if (!st.ok()) {
    return _withContext(st, "Could not write BASELINE");
  }
  return Status::Ok();
}

Status CCS811::hardwareVersion(uint8_t& out) {
  if (!_configured) {
    return Status::Error(Err::NOT_INITIALIZED, "begin() not called");
  }

  Status st = _readRegs(cmd::REG_HW_VERSION, &out, 1);
  if (!st.ok()) {
    return _withContext(st, "Could not read HW_VERSION");
  }
  return Status::Ok();
}

Status CCS811::bootloaderVersion(VersionBytes& out) {
  if (!_configured) {
    return Status::Error(Err::NOT_INITIALIZED, "begin() not called");
  }

  Status st = _readRegs(cmd::REG_FW_BOOT_VERSION, out.raw, sizeof(out.raw));
  if (!st.ok()) {
    return _withContext(st, "Could not read FW_BOOT_VERSION");
  }
  return Status::Ok();
}

Status CCS811::applicationVersion(VersionBytes& out) {
  if (!_configured) {
    return Status::Error(Err::NOT_INITIALIZED, "begin() not called");
  }

  Status st = _readRegs(cmd::REG_FW_APP_VERSION, out.raw, sizeof(out.raw));
  if (!st.ok()) {
    return _withContext(st, "Could not read FW_APP_VERSION");
  }
  return Status::Ok();
}

Status CCS811::readStatus(uint8_t& raw) {
  if (!_configured) {
    return Status::Error(Err::NOT_INITIALIZED, "begin() not called");
  }

  Status st = _readRegs(cmd::REG_STATUS, &raw, 1);
  if (!st.ok()) {
    return _withContext(st, "Could not read STATUS");
  }
  return Status::Ok();
}

Status CCS811::readStatus(StatusRegister& out) {
  uint8_t raw = 0;
  Status st = readStatus(raw);
  if (!st.ok()) {
    return st;
  }

  out = parseStatus(raw);
  return Status::Ok();
}

Status CCS811::readErrorId(uint8_t& out) {
  if (!_configured) {
    return Status::Error(Err::NOT_INITIALIZED, "begin() not called");
  }

  Status st = _readRegs(cmd::REG_ERROR_ID, &out, 1);
  if (!st.ok()) {
    return _withContext(st, "Could not read ERROR_ID");
  }
  return Status::Ok();
}

Status CCS811::flash(const uint8_t* image, size_t len,
                     FlashProgressFn progress, void* progressUser) {
  if (!_configured) {
    return Status::Error(Err::NOT_INITIALIZED, "begin() not called");
  }
  if (image == nullptr || len == 0) {
    return Status::Error(Err::INVALID_PARAM, "Empty firmware image");
  }

  // The sensor leaves application mode for the rest of this call.
  _initialized = false;
  _driverState = DriverState::UNINIT;

  Status st = _softReset();
  if (!st.ok()) {
    return st;
  }

  st = _requireStatus(cmd::STATUS_APP_VALID, Err::FLASH_NOT_VALID,
                      "No valid application before erase");
  if (!st.ok()) {
    return st;
  }

  st = _eraseApp();
  if (!st.ok()) {
    return st;
  }

  st = _requireStatus(cmd::STATUS_APP_ERASE, Err::FLASH_NOT_ERASED,
                      "Application not erased");
  if (!st.ok()) {
    return st;
  }

  st = _writeFirmware(image, len, progress, progressUser);
  if (!st.ok()) {
    return st;
  }

  st = _verifyApp();
  if (!st.ok()) {
    return st;
  }

  st = _requireStatus(static_cast<uint8_t>(cmd::STATUS_APP_ERASE | cmd::STATUS_APP_VERIFY |
                                           cmd::STATUS_APP_VALID),
                      Err::FLASH_NOT_VERIFIED, "Application not verified");
  if (!st.ok()) {
    return st;
  }

  st = _softReset();
  if (!st.ok()) {
    return st;
  }

  return _requireStatus(cmd::STATUS_APP_VALID, Err::FLASH_INVALID_AFTER_RESET,
                        "No valid application after reset");
}

void CCS811::encodeEnvValue(float value, uint8_t out[2]) {
  const float base = std::floor(value);
  uint16_t fraction = truncToU16((value - base) * 512.0f - 1.0f);
  if (fraction > cmd::ENV_FRACTION_MAX) {
    fraction = cmd::ENV_FRACTION_MAX;
  }

  const uint8_t integer = static_cast<uint8_t>(truncToU8(base) & 0x7F);
  out[0] = static_cast<uint8_t>((integer << 1) | ((fraction >> 8) & 0x01));
  out[1] = static_cast<uint8_t>(fraction & 0xFF);
}

Status CCS811::decodeAlgResult(const uint8_t* raw, size_t len, Measurement& out) {
  if (raw == nullptr || len < cmd::ALG_RESULT_LEN) {
    return Status::Error(Err::INVALID_PARAM, "ALG_RESULT_DATA too short");
  }

  std::memcpy(out.raw, raw, cmd::ALG_RESULT_LEN);
  out.eco2Ppm = static_cast<uint16_t>((static_cast<uint16_t>(raw[0]) << 8) | raw[1]);
  out.tvocPpb = static_cast<uint16_t>((static_cast<uint16_t>(raw[2]) << 8) | raw[3]);

  if (raw[cmd::ALG_ERROR_BYTE] != 0) {
    return Status::Error(Err::SENSOR_ERROR, "Sensor reported error",
                         raw[cmd::ALG_ERROR_BYTE]);
  }
  if (out.eco2Ppm > cmd::ECO2_MAX_PPM) {
    return Status::Error(Err::OUT_OF_RANGE, "eCO2 above 8192 ppm", out.eco2Ppm);
  }
  if (out.tvocPpb > cmd::TVOC_MAX_PPB) {
    return Status::Error(Err::OUT_OF_RANGE, "tVOC above 1187 ppb", out.tvocPpb);
  }

  return Status::Ok();
}

StatusRegister CCS811::parseStatus(uint8_t raw) {
  StatusRegister out;
  out.raw = raw;
  out.appMode = (raw & cmd::STATUS_APP_MODE) != 0;
  out.appErase = (raw & cmd::STATUS_APP_ERASE) != 0;
  out.appVerify = (raw & cmd::STATUS_APP_VERIFY) != 0;
  out.appValid = (raw & cmd::STATUS_APP_VALID) != 0;
  out.dataReady = (raw & cmd::STATUS_DATA_READY) != 0;
  out.error = (raw & cmd::STATUS_ERROR) != 0;
  return out;
}

Status CCS811::_i2cWriteReadRaw(const uint8_t* txBuf, size_t txLen,
                                uint8_t* rxBuf, size_t rxLen) {
  if (_config.i2cWriteRead == nullptr) {
    return Status::Error(Err::INVALID_CONFIG, "I2C write-read not set");
  }
  return _config.i2cWriteRead(_config.i2cAddress, txBuf, txLen, rxBuf, rxLen,
                              _config.i2cTimeoutMs, _config.i2cUser);
}

Status CCS811::_i2cWriteRaw(const uint8_t* buf, size_t len) {
  if (_config.i2cWrite == nullptr) {
    return Status::Error(Err::INVALID_CONFIG, "I2C write not set");
  }
  return _config.i2cWrite(_config.i2cAddress, buf, len, _config.i2cTimeoutMs,
                          _config.i2cUser);
}

Status CCS811::_i2cWriteReadTracked(const uint8_t* txBuf, size_t txLen,
                                    uint8_t* rxBuf, size_t rxLen) {
  if ((txLen > 0 && txBuf == nullptr) || (rxLen > 0 && rxBuf == nullptr)) {
    return Status::Error(Err::INVALID_PARAM, "Invalid I2C buffer");
  }

  Status st = _i2cWriteReadRaw(txBuf, txLen, rxBuf, rxLen);
  if (st.code == Err::INVALID_CONFIG || st.code == Err::INVALID_PARAM) {
    return st;
  }
  return _updateHealth(st);
}

Status CCS811::_i2cWriteTracked(const uint8_t* buf, size_t len) {
  if (buf == nullptr || len == 0) {
    return Status::Error(Err::INVALID_PARAM, "Invalid I2C buffer");
  }

  Status st = _i2cWriteRaw(buf, len);
  if (st.code == Err::INVALID_CONFIG || st.code == Err::INVALID_PARAM) {
    return st;
  }
  return _updateHealth(st);
}

Status CCS811::_readRegs(uint8_t reg, uint8_t* buf, size_t len) {
  if (buf == nullptr || len == 0) {
    return Status::Error(Err::INVALID_PARAM, "Invalid read buffer");
  }

  return _i2cWriteReadTracked(&reg, 1, buf, len);
}

Status CCS811::_writeRegs(uint8_t reg, const uint8_t* buf, size_t len) {
  if (buf == nullptr || len == 0) {
    return Status::Error(Err::INVALID_PARAM, "Invalid write buffer");
  }
  if (len > MAX_WRITE_LEN) {
    return Status::Error(Err::INVALID_PARAM, "Write length too large");
  }

  uint8_t payload[MAX_WRITE_LEN + 1] = {};
  payload[0] = reg;
  std::memcpy(&payload[1], buf, len);

  return _i2cWriteTracked(payload, len + 1);
}

Status CCS811::_writeCommand(uint8_t reg) {
  return _i2cWriteTracked(&reg, 1);
}

Status CCS811::_updateHealth(const Status& st) {
  const uint32_t now = millis();
  const uint32_t maxU32 = std::numeric_limits<uint32_t>::max();
  const uint8_t maxU8 = std::numeric_limits<uint8_t>::max();

  if (!_initialized) {
    if (st.ok()) {
      _lastOkMs = now;
    } else {
      _lastError = st;
      _lastErrorMs = now;
    }
    return st;
  }

  if (st.ok()) {
    _lastOkMs = now;
    if (_totalSuccess < maxU32) {
      _totalSuccess++;
    }
    _consecutiveFailures = 0;
    _driverState = DriverState::READY;
    return st;
  }

  _lastError = st;
  _lastErrorMs = now;
  if (_totalFailures < maxU32) {
    _totalFailures++;
  }
  if (_consecutiveFailures < maxU8) {
    _consecutiveFailures++;
  }

  if (_consecutiveFailures >= _config.offlineThreshold) {
    _driverState = DriverState::OFFLINE;
  } else {
    _driverState = DriverState::DEGRADED;
  }

  return st;
}

Status CCS811::_wake() {
  if (_config.wakeWrite == nullptr) {
    return Status::Ok();
  }

  Status st = _config.wakeWrite(false, _config.wakeUser);
  if (!st.ok()) {
    return Status::Error(Err::GPIO_ERROR, "nWAKE assert failed", st.detail);
  }

  st = _waitUs(cmd::WAIT_AFTER_WAKE_US);
  if (!st.ok()) {
    // Callers only sleep after a successful wake, so release here.
    (void)_sleep();
    return st;
  }
  return Status::Ok();
}

Status CCS811::_sleep() {
  if (_config.wakeWrite == nullptr) {
    return Status::Ok();
  }

  Status st = _config.wakeWrite(true, _config.wakeUser);
  if (!st.ok()) {
    return Status::Error(Err::GPIO_ERROR, "nWAKE release failed", st.detail);
  }
  return Status::Ok();
}

Status CCS811::_softReset() {
  Status st = _writeRegs(cmd::REG_SW_RESET, cmd::SW_RESET_SEQ, sizeof(cmd::SW_RESET_SEQ));
  if (!st.ok()) {
    return _withContext(st, "Software reset write failed");
  }
  return _waitUs(cmd::WAIT_AFTER_RESET_US);
}

Status CCS811::_checkHwId() {
  uint8_t hwId = 0;
  Status st = _readRegs(cmd::REG_HW_ID, &hwId, 1);
  if (!st.ok()) {
    return _withContext(st, "Could not read HW_ID");
  }
  if (hwId != cmd::HW_ID_VALUE) {
    return Status::Error(Err::HW_ID_MISMATCH, "HW_ID is not 0x81", hwId);
  }
  return Status::Ok();
}

Status CCS811::_appStart() {
  Status st = _writeCommand(cmd::REG_APP_START);
  if (!st.ok()) {
    return _withContext(st, "APP_START write failed");
  }
  return _waitUs(cmd::WAIT_AFTER_APP_START_US);
}

Status CCS811::_eraseApp() {
  Status st = _writeRegs(cmd::REG_APP_ERASE, cmd::APP_ERASE_SEQ, sizeof(cmd::APP_ERASE_SEQ));
  if (!st.ok()) {
    return _withContext(st, "APP_ERASE write failed");
  }
  return _waitMs(cmd::WAIT_AFTER_APP_ERASE_MS);
}

Status CCS811::_verifyApp() {
  Status st = _waitMs(cmd::WAIT_AFTER_APP_DATA_MS);
  if (!st.ok()) {
    return st;
  }

  st = _writeCommand(cmd::REG_APP_VERIFY);
  if (!st.ok()) {
    return _withContext(st, "APP_VERIFY write failed");
  }
  return _waitMs(cmd::WAIT_AFTER_APP_VERIFY_MS);
}

Status CCS811::_requireStatus(uint8_t mask, Err failCode, const char* failMsg) {
  uint8_t raw = 0;
  Status st = _readRegs(cmd::REG_STATUS, &raw, 1);
  if (!st.ok()) {
    return _withContext(st, "Could not read STATUS");
  }
  if ((raw & mask) != mask) {
    return Status::Error(failCode, failMsg, raw);
  }
  return Status::Ok();
}

Status CCS811::_writeFirmware(const uint8_t* image, size_t len,
                              FlashProgressFn progress, void* progressUser) {
  for (size_t offset = 0; offset < len; offset += cmd::APP_DATA_CHUNK_LEN) {
    const size_t remaining = len - offset;
    const size_t chunk = remaining < cmd::APP_DATA_CHUNK_LEN ? remaining : cmd::APP_DATA_CHUNK_LEN;

    Status st = _writeRegs(cmd::REG_APP_DATA, &image[offset], chunk);
    if (!st.ok()) {
      return Status::Error(Err::FLASH_WRITE_FAILED, "Firmware chunk write failed",
                           static_cast<int32_t>(offset));
    }

    if (progress != nullptr) {
      progress(offset + chunk, len, progressUser);
    }
  }

  return Status::Ok();
}

Status CCS811::_runBeginSequence() {
  Status st = _softReset();
  if (!st.ok()) {
    return st;
  }

  st = _checkHwId();
  if (!st.ok()) {
    return st;
  }

  st = _appStart();
  if (!st.ok()) {
    return st;
  }

  return _requireStatus(cmd::STATUS_APP_MODE, Err::STATUS_MISMATCH,
                        "Sensor not in application mode");
}

Status CCS811::_waitMs(uint32_t delayMs) {
  if (delayMs == 0) {
    return Status::Ok();
  }

  const uint32_t startMs = millis();
  const uint32_t deadline = startMs + delayMs;
  const uint32_t timeoutMs = delayMs + _config.i2cTimeoutMs;
  uint32_t lastMs = startMs;
  uint32_t stableLoops = 0;

  while (true) {
    const uint32_t nowMs = millis();
    if (_timeElapsed(nowMs, deadline)) {
      break;
    }
    if (static_cast<uint32_t>(nowMs - startMs) > timeoutMs) {
      return Status::Error(Err::TIMEOUT, "Wait timeout");
    }
    if (nowMs != lastMs) {
      lastMs = nowMs;
      stableLoops = 0;
    } else if (++stableLoops >= MAX_SPIN_ITERS) {
      return Status::Error(Err::TIMEOUT, "Wait timeout");
    }
  }

  return Status::Ok();
}

Status CCS811::_waitUs(uint32_t delayUs) {
  if (delayUs == 0) {
    return Status::Ok();
  }

  const uint32_t target = micros() + delayUs;
  const uint32_t startMs = millis();
  const uint32_t timeoutMs = delayUs / 1000U + 1U + _config.i2cTimeoutMs;
  uint32_t lastMs = startMs;
  uint32_t stableLoops = 0;

  while (!_timeElapsed(micros(), target)) {
    const uint32_t nowMs = millis();
    if (static_cast<uint32_t>(nowMs - startMs) > timeoutMs) {
      return Status::Error(Err::TIMEOUT, "Wait timeout");
    }
    if (nowMs != lastMs) {
      lastMs = nowMs;
      stableLoops = 0;
    } else if (++stableLoops >= MAX_SPIN_ITERS) {
      return Status::Error(Err::TIMEOUT, "Wait timeout");
    }
  }

  return Status::Ok();
}

Status CCS811::_withContext(const Status& st, const char* msg) {
  return Status{st.code, st.detail, msg};
}

bool CCS811::_timeElapsed(uint32_t now, uint32_t target) {
  return static_cast<int32_t>(now - target) >= 0;
}

} // namespace CCS811
