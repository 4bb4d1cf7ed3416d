/// @file main.cpp
/// @brief Basic bringup example for CCS811
/// @note This is an EXAMPLE, not part of the library

#include <Arduino.h>
#include <limits>
#include <cstdlib>
#include "common/Log.h"
#include "common/BoardConfig.h"
#include "common/I2cTransport.h"
#include "common/I2cScanner.h"
#include "common/WakePin.h"

#include "CCS811/CCS811.h"

// ============================================================================
// Globals
// ============================================================================

struct StressStats {
  bool active = false;
  uint32_t startMs = 0;
  int target = 0;
  int attempts = 0;
  int success = 0;
  uint32_t errors = 0;
  uint16_t minEco2 = 0;
  uint16_t maxEco2 = 0;
  uint16_t minTvoc = 0;
  uint16_t maxTvoc = 0;
  uint32_t sumEco2 = 0;
  uint32_t sumTvoc = 0;
  CCS811::Status lastError = CCS811::Status::Ok();
};

CCS811::CCS811 device;
CCS811::Config gConfig;
transport::WakePin gWake;
bool gConfigReady = false;
bool verboseMode = false;
int stressRemaining = 0;
StressStats stressStats;

// ============================================================================
// Helper Functions
// ============================================================================

const char* errToStr(CCS811::Err err) {
  using namespace CCS811;
  switch (err) {
    case Err::OK: return "OK";
    case Err::NOT_INITIALIZED: return "NOT_INITIALIZED";
    case Err::INVALID_CONFIG: return "INVALID_CONFIG";
    case Err::I2C_ERROR: return "I2C_ERROR";
    case Err::I2C_NACK_ADDR: return "I2C_NACK_ADDR";
    case Err::I2C_NACK_DATA: return "I2C_NACK_DATA";
    case Err::I2C_TIMEOUT: return "I2C_TIMEOUT";
    case Err::I2C_BUS: return "I2C_BUS";
    case Err::GPIO_ERROR: return "GPIO_ERROR";
    case Err::TIMEOUT: return "TIMEOUT";
    case Err::INVALID_PARAM: return "INVALID_PARAM";
    case Err::DEVICE_NOT_FOUND: return "DEVICE_NOT_FOUND";
    case Err::HW_ID_MISMATCH: return "HW_ID_MISMATCH";
    case Err::STATUS_MISMATCH: return "STATUS_MISMATCH";
    case Err::OUT_OF_RANGE: return "OUT_OF_RANGE";
    case Err::SENSOR_ERROR: return "SENSOR_ERROR";
    case Err::FLASH_NOT_VALID: return "FLASH_NOT_VALID";
    case Err::FLASH_NOT_ERASED: return "FLASH_NOT_ERASED";
    case Err::FLASH_WRITE_FAILED: return "FLASH_WRITE_FAILED";
    case Err::FLASH_NOT_VERIFIED: return "FLASH_NOT_VERIFIED";
    case Err::FLASH_INVALID_AFTER_RESET: return "FLASH_INVALID_AFTER_RESET";
    default: return "UNKNOWN";
  }
}

const char* stateToStr(CCS811::DriverState st) {
  using namespace CCS811;
  switch (st) {
    case DriverState::UNINIT: return "UNINIT";
    case DriverState::READY: return "READY";
    case DriverState::DEGRADED: return "DEGRADED";
    case DriverState::OFFLINE: return "OFFLINE";
    default: return "UNKNOWN";
  }
}

const char* driveModeToStr(CCS811::DriveMode mode) {
  using namespace CCS811;
  switch (mode) {
    case DriveMode::IDLE: return "IDLE";
    case DriveMode::MODE_1S: return "1s";
    case DriveMode::MODE_10S: return "10s";
    case DriveMode::MODE_60S: return "60s";
    default: return "UNKNOWN";
  }
}

void printStatus(const CCS811::Status& st) {
  Serial.printf("  Status: %s (code=%u, detail=%ld)\n",
                errToStr(st.code),
                static_cast<unsigned>(st.code),
                static_cast<long>(st.detail));
  if (st.msg && st.msg[0]) {
    Serial.printf("  Message: %s\n", st.msg);
  }
}

void printDriverHealth() {
  Serial.println("=== Driver State ===");
  Serial.printf("  State: %s\n", stateToStr(device.state()));
  Serial.printf("  Online: %s\n", device.isOnline() ? "YES" : "NO");
  Serial.printf("  Consecutive failures: %u\n", device.consecutiveFailures());
  Serial.printf("  Total failures: %lu\n", static_cast<unsigned long>(device.totalFailures()));
  Serial.printf("  Total success: %lu\n", static_cast<unsigned long>(device.totalSuccess()));
  Serial.printf("  Last OK at: %lu ms\n", static_cast<unsigned long>(device.lastOkMs()));
  Serial.printf("  Last error at: %lu ms\n", static_cast<unsigned long>(device.lastErrorMs()));
  if (device.lastError().code != CCS811::Err::OK) {
    Serial.printf("  Last error: %s\n", errToStr(device.lastError().code));
  }
}

void printMeasurement(const CCS811::Measurement& m) {
  Serial.printf("eCO2: %u ppm, tVOC: %u ppb\n",
                static_cast<unsigned>(m.eco2Ppm),
                static_cast<unsigned>(m.tvocPpb));
  if (verboseMode) {
    Serial.print("  Raw:");
    for (size_t i = 0; i < sizeof(m.raw); i++) {
      Serial.printf(" %02X", m.raw[i]);
    }
    Serial.println();
  }
}

void printStatusRegister(const CCS811::StatusRegister& s) {
  Serial.printf("STATUS: 0x%02X\n", s.raw);
  Serial.printf("  FW mode: %s\n", s.appMode ? "APPLICATION" : "BOOT");
  Serial.printf("  App valid: %s\n", s.appValid ? "YES" : "NO");
  Serial.printf("  App erase: %s\n", s.appErase ? "YES" : "NO");
  Serial.printf("  App verify: %s\n", s.appVerify ? "YES" : "NO");
  Serial.printf("  Data ready: %s\n", s.dataReady ? "YES" : "NO");
  Serial.printf("  Error: %s\n", s.error ? "YES" : "NO");
}

void printVersions() {
  transport::WakeHold hold(gWake);
  uint8_t hw = 0;
  CCS811::Status st = device.hardwareVersion(hw);
  if (!st.ok()) {
    printStatus(st);
    return;
  }
  Serial.printf("HW version: 0x%02X\n", hw);

  CCS811::VersionBytes boot;
  st = device.bootloaderVersion(boot);
  if (!st.ok()) {
    printStatus(st);
    return;
  }
  Serial.printf("Bootloader: %02X %02X\n", boot.raw[0], boot.raw[1]);

  CCS811::VersionBytes app;
  st = device.applicationVersion(app);
  if (!st.ok()) {
    printStatus(st);
    return;
  }
  Serial.printf("Application: %02X %02X\n", app.raw[0], app.raw[1]);
}

void resetStressStats(int target) {
  stressStats = StressStats{};
  stressStats.active = true;
  stressStats.startMs = millis();
  stressStats.target = target;
  stressStats.minEco2 = std::numeric_limits<uint16_t>::max();
  stressStats.minTvoc = std::numeric_limits<uint16_t>::max();
}

void noteStressError(const CCS811::Status& st) {
  stressStats.errors++;
  stressStats.lastError = st;
}

void updateStressStats(const CCS811::Measurement& m) {
  if (m.eco2Ppm < stressStats.minEco2) {
    stressStats.minEco2 = m.eco2Ppm;
  }
  if (m.eco2Ppm > stressStats.maxEco2) {
    stressStats.maxEco2 = m.eco2Ppm;
  }
  if (m.tvocPpb < stressStats.minTvoc) {
    stressStats.minTvoc = m.tvocPpb;
  }
  if (m.tvocPpb > stressStats.maxTvoc) {
    stressStats.maxTvoc = m.tvocPpb;
  }
  stressStats.sumEco2 += m.eco2Ppm;
  stressStats.sumTvoc += m.tvocPpb;
  stressStats.success++;
}

void finishStressStats() {
  stressStats.active = false;
  const uint32_t durationMs = millis() - stressStats.startMs;

  Serial.println("=== Stress Summary ===");
  Serial.printf("  Target: %d\n", stressStats.target);
  Serial.printf("  Attempts: %d\n", stressStats.attempts);
  Serial.printf("  Success: %d\n", stressStats.success);
  Serial.printf("  Errors: %lu\n", static_cast<unsigned long>(stressStats.errors));
  Serial.printf("  Duration: %lu ms\n", static_cast<unsigned long>(durationMs));

  if (stressStats.success > 0) {
    Serial.printf("  eCO2 ppm: min=%u avg=%lu max=%u\n",
                  static_cast<unsigned>(stressStats.minEco2),
                  static_cast<unsigned long>(stressStats.sumEco2 / stressStats.success),
                  static_cast<unsigned>(stressStats.maxEco2));
    Serial.printf("  tVOC ppb: min=%u avg=%lu max=%u\n",
                  static_cast<unsigned>(stressStats.minTvoc),
                  static_cast<unsigned long>(stressStats.sumTvoc / stressStats.success),
                  static_cast<unsigned>(stressStats.maxTvoc));
  } else {
    Serial.println("  No valid samples");
  }

  if (!stressStats.lastError.ok()) {
    Serial.printf("  Last error: %s\n", errToStr(stressStats.lastError.code));
    if (stressStats.lastError.msg && stressStats.lastError.msg[0]) {
      Serial.printf("  Message: %s\n", stressStats.lastError.msg);
    }
  }
}

void runStressStep() {
  CCS811::Measurement m;
  CCS811::Status st = device.read(m);
  stressStats.attempts++;
  if (st.ok()) {
    updateStressStats(m);
  } else {
    noteStressError(st);
  }
  stressRemaining--;
  if (stressRemaining == 0) {
    finishStressStats();
  }
}

bool parseDriveMode(const String& token, CCS811::DriveMode& out) {
  if (token == "idle" || token == "0") {
    out = CCS811::DriveMode::IDLE;
    return true;
  }
  if (token == "1") {
    out = CCS811::DriveMode::MODE_1S;
    return true;
  }
  if (token == "10") {
    out = CCS811::DriveMode::MODE_10S;
    return true;
  }
  if (token == "60") {
    out = CCS811::DriveMode::MODE_60S;
    return true;
  }
  return false;
}

bool parseU16(const String& token, uint16_t& out) {
  const char* str = token.c_str();
  char* end = nullptr;
  unsigned long value = std::strtoul(str, &end, 0);
  if (end == str || *end != '\0') {
    return false;
  }
  if (value > 0xFFFFUL) {
    return false;
  }
  out = static_cast<uint16_t>(value);
  return true;
}

bool parseFloat(const String& token, float& out) {
  const char* str = token.c_str();
  char* end = nullptr;
  const float value = std::strtof(str, &end);
  if (end == str || *end != '\0') {
    return false;
  }
  out = value;
  return true;
}

/// Scan with nWAKE held low so a sleeping CCS811 answers
void scanBus() {
  transport::WakeHold hold(gWake);
  i2c::scan();
}

void printHelp() {
  Serial.println("=== Commands ===");
  Serial.println("  help                     - Show this help");
  Serial.println("  scan                     - Scan I2C bus");
  Serial.println("  begin                    - Reset and start application");
  Serial.println("  end                      - End driver session");
  Serial.println("  probe                    - Probe device (no health tracking)");
  Serial.println("  start <idle|1|10|60>      - Set drive mode");
  Serial.println("  read                     - Read eCO2/tVOC");
  Serial.println("  status                   - Read status register");
  Serial.println("  errid                    - Read ERROR_ID register");
  Serial.println("  versions                 - Read HW/boot/app versions");
  Serial.println("  baseline [hex]            - Read or write baseline");
  Serial.println("  env <rh> <t>              - Write humidity/temperature compensation");
  Serial.println("  drv                      - Show driver state and health");
  Serial.println("  verbose [0|1]             - Enable/disable verbose output");
  Serial.println("  stress [n]                - Read n samples (default 10)");
}

// ============================================================================
// Command Processing
// ============================================================================

void processCommand(const String& cmdLine) {
  String cmd = cmdLine;
  cmd.trim();

  if (cmd == "help" || cmd == "?") {
    printHelp();
    return;
  }

  if (cmd == "scan") {
    scanBus();
    return;
  }

  if (cmd == "begin") {
    if (!gConfigReady) {
      LOGW("Config not ready");
      return;
    }
    stressRemaining = 0;
    CCS811::Status st = device.begin(gConfig);
    printStatus(st);
    return;
  }

  if (cmd == "end") {
    stressRemaining = 0;
    device.end();
    LOGI("Driver ended");
    return;
  }

  if (cmd == "probe") {
    LOGI("Probing device (no health tracking)...");
    transport::WakeHold hold(gWake);
    CCS811::Status st = device.probe();
    printStatus(st);
    return;
  }

  if (cmd.startsWith("start ")) {
    String arg = cmd.substring(6);
    arg.trim();
    CCS811::DriveMode mode;
    if (!parseDriveMode(arg, mode)) {
      LOGW("Invalid mode: %s", arg.c_str());
      return;
    }
    CCS811::Status st = device.start(mode);
    printStatus(st);
    if (st.ok()) {
      LOGI("Drive mode %s, first sample after one interval", driveModeToStr(mode));
    }
    return;
  }

  if (cmd == "read") {
    CCS811::Measurement m;
    CCS811::Status st = device.read(m);
    if (!st.ok()) {
      printStatus(st);
      return;
    }
    printMeasurement(m);
    return;
  }

  if (cmd == "status") {
    CCS811::StatusRegister s;
    transport::WakeHold hold(gWake);
    CCS811::Status st = device.readStatus(s);
    if (!st.ok()) {
      printStatus(st);
      return;
    }
    printStatusRegister(s);
    return;
  }

  if (cmd == "errid") {
    uint8_t errId = 0;
    transport::WakeHold hold(gWake);
    CCS811::Status st = device.readErrorId(errId);
    if (!st.ok()) {
      printStatus(st);
      return;
    }
    Serial.printf("ERROR_ID: 0x%02X\n", errId);
    return;
  }

  if (cmd == "versions") {
    printVersions();
    return;
  }

  if (cmd == "baseline") {
    uint16_t baseline = 0;
    transport::WakeHold hold(gWake);
    CCS811::Status st = device.getBaseline(baseline);
    if (!st.ok()) {
      printStatus(st);
      return;
    }
    Serial.printf("Baseline: 0x%04X\n", static_cast<unsigned>(baseline));
    return;
  }

  if (cmd.startsWith("baseline ")) {
    String arg = cmd.substring(9);
    arg.trim();
    uint16_t baseline = 0;
    if (!parseU16(arg, baseline)) {
      LOGW("Invalid baseline: %s", arg.c_str());
      return;
    }
    transport::WakeHold hold(gWake);
    CCS811::Status st = device.setBaseline(baseline);
    printStatus(st);
    return;
  }

  if (cmd.startsWith("env ")) {
    String args = cmd.substring(4);
    args.trim();
    const int split = args.indexOf(' ');
    if (split < 0) {
      LOGW("Usage: env <rh> <t>");
      return;
    }
    String rhArg = args.substring(0, split);
    String tArg = args.substring(split + 1);
    tArg.trim();
    float rh = 0.0f;
    float t = 0.0f;
    if (!parseFloat(rhArg, rh) || !parseFloat(tArg, t)) {
      LOGW("Invalid values");
      return;
    }
    if (rh < 0.0f || rh >= 128.0f || t < 0.0f || t >= 128.0f) {
      LOGW("Values must be in [0, 128)");
      return;
    }
    uint8_t rhBytes[2] = {};
    uint8_t tBytes[2] = {};
    CCS811::CCS811::encodeEnvValue(rh, rhBytes);
    CCS811::CCS811::encodeEnvValue(t, tBytes);
    if (verboseMode) {
      Serial.printf("ENV_DATA: %02X %02X %02X %02X\n", rhBytes[0], rhBytes[1], tBytes[0], tBytes[1]);
    }
    transport::WakeHold hold(gWake);
    CCS811::Status st = device.setEnvData(rh, t);
    printStatus(st);
    return;
  }

  if (cmd == "drv") {
    printDriverHealth();
    return;
  }

  if (cmd == "verbose") {
    Serial.printf("  Verbose: %s\n", verboseMode ? "ON" : "OFF");
    return;
  }

  if (cmd.startsWith("verbose ")) {
    const int val = cmd.substring(8).toInt();
    verboseMode = (val != 0);
    LOGI("Verbose mode: %s", verboseMode ? "ON" : "OFF");
    return;
  }

  if (cmd.startsWith("stress")) {
    int count = 10;
    if (cmd.length() > 6) {
      count = cmd.substring(6).toInt();
    }
    if (count <= 0) {
      LOGW("Invalid stress count");
      return;
    }

    stressRemaining = count;
    resetStressStats(count);
    LOGI("Starting stress test: %d reads", count);
    return;
  }

  LOGW("Unknown command: %s", cmd.c_str());
}

// ============================================================================
// Setup and Loop
// ============================================================================

void setup() {
  log_begin(115200);

  LOGI("=== CCS811 Bringup Example ===");

  if (!board::initI2c()) {
    LOGE("Failed to initialize I2C");
    return;
  }
  LOGI("I2C initialized (SDA=%d, SCL=%d)", board::I2C_SDA, board::I2C_SCL);

  gConfig.i2cWrite = transport::wireWrite;
  gConfig.i2cWriteRead = transport::wireWriteRead;
  gConfig.i2cAddress = CCS811::cmd::I2C_ADDR_PRIMARY;
  gConfig.i2cTimeoutMs = board::I2C_TIMEOUT_MS;
  gConfig.offlineThreshold = 5;

  gWake.pin = board::CCS811_WAKE;
  if (transport::initWakePin(gWake)) {
    gConfig.wakeWrite = transport::gpioWakeWrite;
    gConfig.wakeUser = &gWake;
    LOGI("nWAKE on GPIO%d", gWake.pin);
  } else {
    LOGI("nWAKE not wired, sensor always awake");
  }
  scanBus();
  gConfigReady = true;

  CCS811::Status st = device.begin(gConfig);
  if (!st.ok()) {
    LOGE("Failed to initialize device");
    printStatus(st);
    return;
  }

  LOGI("Device initialized successfully");
  printVersions();
  printDriverHealth();
  printHelp();
  Serial.print("> ");
}

void loop() {
  static uint32_t lastStressMs = 0;
  if (stressStats.active && stressRemaining > 0 && millis() - lastStressMs >= 1000) {
    lastStressMs = millis();
    runStressStep();
  }

  static String inputBuffer;
  while (Serial.available()) {
    const char c = static_cast<char>(Serial.read());
    if (c == '\n' || c == '\r') {
      if (inputBuffer.length() > 0) {
        processCommand(inputBuffer);
        inputBuffer = "";
        Serial.print("> ");
      }
    } else {
      inputBuffer += c;
    }
  }
}
