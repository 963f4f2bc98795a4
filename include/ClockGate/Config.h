/**
 * @file Config.h
 * @brief Hardware callbacks and configuration for the DS1302 three-wire transport
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#include "Status.h"

namespace ClockGate {

/**
 * @enum PinMode
 * @brief Electrical mode requested from the pin driver
 */
enum class PinMode : uint8_t {
  Output = 0,      ///< Push-pull output
  Input = 1,       ///< High-impedance input
  InputPullup = 2  ///< Input with internal pull-up (buttons)
};

/// @brief Drive a digital output pin.
using PinWriteFn = Status (*)(int pin, bool high, void* user);

/// @brief Sample a digital input pin.
using PinReadFn = Status (*)(int pin, bool& high, void* user);

/// @brief Switch a pin between output and input.
using PinModeFn = Status (*)(int pin, PinMode mode, void* user);

/// @brief Busy-wait for the given number of microseconds.
using DelayUsFn = void (*)(uint32_t us, void* user);

/// @brief Monotonic millisecond clock (wraps after ~49 days).
using MillisFn = uint32_t (*)(void* user);

/// @brief Suspend the calling task for the given number of milliseconds.
using DelayMsFn = void (*)(uint32_t ms, void* user);

/**
 * @struct Config
 * @brief DS1302 transport configuration
 *
 * All hardware resources are application-provided. The library does not
 * define any pin defaults - board-specific values must be passed by user.
 */
struct Config {
  /// @brief Output pin callback (required).
  PinWriteFn pinWrite = nullptr;

  /// @brief Input pin callback (required).
  PinReadFn pinRead = nullptr;

  /// @brief Pin direction callback (required).
  PinModeFn pinMode = nullptr;

  /// @brief Microsecond delay callback (required).
  DelayUsFn delayUs = nullptr;

  /// @brief User context passed to all GPIO callbacks.
  void* gpioUser = nullptr;

  /// @brief Serial clock pin (SCLK).
  int sclkPin = -1;

  /// @brief Bidirectional data pin (I/O).
  int ioPin = -1;

  /// @brief Reset / chip-enable pin (CE). High while a transaction is open.
  int cePin = -1;

  /// @brief Hold time on each half of every clock cycle in microseconds (default: 1)
  /// @note Tunable. The DS1302 needs a 4 µs clock period at 2.0 V and 1 µs at 5 V;
  ///       raise this on low-voltage boards.
  uint32_t guardDelayUs = 1;

  /// @brief Clear the write-protect bit during begin() (default: true)
  /// @note Field writes are ignored by the chip while write protection is set.
  bool disableWriteProtectOnBegin = true;
};

}  // namespace ClockGate
