/**
 * @file BoardPins.h
 * @brief Example default pin mapping for the ESP32 access-node reference board.
 *
 * These are convenience defaults for our reference design only.
 * NOT part of the library API. Override for your hardware.
 *
 * @warning The library itself is pin-agnostic. All pins are passed via Config.
 *          These defaults are provided for examples only.
 */

#pragma once

#include <stdint.h>

namespace pins {

// ====================================================================
// EXAMPLE DEFAULT PIN MAPPING - ESP32 ACCESS-NODE REFERENCE HARDWARE
// ====================================================================
// These pins are NOT library defaults. They are example-only values.
// Override them for your board by creating your own BoardPins.h or
// passing explicit values to Config structs in your application.
// ====================================================================

/// @brief DS1302 serial clock (SCLK).
static constexpr int RTC_SCLK = 1;

/// @brief DS1302 bidirectional data line (I/O).
static constexpr int RTC_IO = 2;

/// @brief DS1302 chip enable (CE, also labelled RST).
static constexpr int RTC_CE = 3;

/// @brief Push button to GND, internal pull-up.
static constexpr int BUTTON = 4;

/// @brief Light sensor module digital output (low = bright).
static constexpr int LIGHT = 5;

/// @brief AM2302 (DHT22) single-wire data pin.
static constexpr int AM2302 = 6;

/// @brief Indicator LEDs, active high.
static constexpr int LED_ACCESS = 7;
static constexpr int LED_ELIGIBLE = 8;
static constexpr int LED_LOCKED = 9;

/// @brief On-board LED used for the fatal-error blink. Set to -1 to disable.
static constexpr int LED = 48;

}  // namespace pins
