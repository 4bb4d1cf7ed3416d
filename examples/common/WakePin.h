/// @file WakePin.h
/// @brief GPIO adapter for the CCS811 nWAKE line
/// @note NOT part of the library - examples only
#pragma once

#include <Arduino.h>
#include "CCS811/CommandTable.h"
#include "CCS811/Status.h"

namespace transport {

/// nWAKE pin context, passed as Config::wakeUser
struct WakePin {
  int pin = -1;
};

/// Put the nWAKE pin into output mode, released (high)
/// @return true if a pin is configured
inline bool initWakePin(const WakePin& wake) {
  if (wake.pin < 0) {
    return false;
  }
  pinMode(static_cast<uint8_t>(wake.pin), OUTPUT);
  digitalWrite(static_cast<uint8_t>(wake.pin), HIGH);
  return true;
}

/// Config::wakeWrite callback using digitalWrite()
inline CCS811::Status gpioWakeWrite(bool high, void* user) {
  auto* wake = static_cast<WakePin*>(user);
  if (wake == nullptr || wake->pin < 0) {
    return CCS811::Status::Error(CCS811::Err::GPIO_ERROR, "nWAKE pin not set");
  }
  digitalWrite(static_cast<uint8_t>(wake->pin), high ? HIGH : LOW);
  return CCS811::Status::Ok();
}

/// Holds nWAKE low for its lifetime, for driver calls that do not wake the
/// sensor themselves (versions, STATUS, ERROR_ID, baseline, ENV_DATA, probe).
/// Does nothing if no pin is wired.
class WakeHold {
public:
  explicit WakeHold(WakePin& wake) : _wake(wake) {
    if (_wake.pin < 0) {
      return;
    }
    _held = gpioWakeWrite(false, &_wake).ok();
    if (_held) {
      delayMicroseconds(CCS811::cmd::WAIT_AFTER_WAKE_US);
    }
  }

  ~WakeHold() {
    if (_held) {
      (void)gpioWakeWrite(true, &_wake);
    }
  }

  WakeHold(const WakeHold&) = delete;
  WakeHold& operator=(const WakeHold&) = delete;

  bool held() const { return _held; }

private:
  WakePin& _wake;
  bool _held = false;
};

} // namespace transport
