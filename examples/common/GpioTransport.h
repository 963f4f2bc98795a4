/**
 * @file GpioTransport.h
 * @brief Arduino GPIO and timing adapter for ClockGate examples.
 *
 * This file provides Arduino-backed pin and delay callbacks that can be
 * used with the ClockGate library. The library does not depend on the
 * Arduino core directly; this adapter bridges them.
 *
 * NOT part of the library API. Example-only.
 */

#pragma once

#include <Arduino.h>

#include "ClockGate/Config.h"
#include "ClockGate/Status.h"

namespace transport {

/// @brief Highest GPIO number accepted by the adapter (ESP32-S3 range)
static constexpr int kMaxGpio = 48;

inline bool validPin(int pin) {
  return pin >= 0 && pin <= kMaxGpio;
}

/**
 * @brief digitalWrite() implementation of Config::pinWrite.
 *
 * @param pin GPIO number
 * @param high Level to drive
 * @param user Unused
 * @return GPIO_ERROR for an unusable pin
 */
inline ClockGate::Status gpioWrite(int pin, bool high, void* user) {
  (void)user;
  if (!validPin(pin)) {
    return ClockGate::Status::Error(ClockGate::Err::GPIO_ERROR, "Invalid GPIO", pin);
  }
  digitalWrite(pin, high ? HIGH : LOW);
  return ClockGate::Status::Ok();
}

/**
 * @brief digitalRead() implementation of Config::pinRead.
 */
inline ClockGate::Status gpioRead(int pin, bool& high, void* user) {
  (void)user;
  if (!validPin(pin)) {
    return ClockGate::Status::Error(ClockGate::Err::GPIO_ERROR, "Invalid GPIO", pin);
  }
  high = digitalRead(pin) == HIGH;
  return ClockGate::Status::Ok();
}

/**
 * @brief pinMode() implementation of Config::pinMode.
 */
inline ClockGate::Status gpioMode(int pin, ClockGate::PinMode mode, void* user) {
  (void)user;
  if (!validPin(pin)) {
    return ClockGate::Status::Error(ClockGate::Err::GPIO_ERROR, "Invalid GPIO", pin);
  }
  switch (mode) {
    case ClockGate::PinMode::Output:
      pinMode(pin, OUTPUT);
      break;
    case ClockGate::PinMode::Input:
      pinMode(pin, INPUT);
      break;
    case ClockGate::PinMode::InputPullup:
      pinMode(pin, INPUT_PULLUP);
      break;
  }
  return ClockGate::Status::Ok();
}

/**
 * @brief delayMicroseconds() implementation of Config::delayUs.
 */
inline void delayUs(uint32_t us, void* user) {
  (void)user;
  delayMicroseconds(us);
}

/**
 * @brief millis() implementation of ButtonConfig::nowMs.
 */
inline uint32_t nowMs(void* user) {
  (void)user;
  return millis();
}

/**
 * @brief Task-yielding delay for ButtonConfig::delayMs.
 *
 * On the Arduino ESP32 core delay() maps to vTaskDelay(), so other tasks
 * run while the button task waits.
 */
inline void delayMs(uint32_t ms, void* user) {
  (void)user;
  delay(ms);
}

}  // namespace transport
