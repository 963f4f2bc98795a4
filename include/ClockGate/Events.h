/**
 * @file Events.h
 * @brief Messages carried by the node's channels
 *
 * All message types are trivially copyable so they can travel through RTOS
 * queues by value.
 */

#pragma once

#include <stdint.h>

#include "Ds1302.h"

namespace ClockGate {

/**
 * @enum Gesture
 * @brief Classified button interaction
 */
enum class Gesture : uint8_t {
  ShortPress = 0,
  LongPress = 1,
  DoublePress = 2
};

/**
 * @struct GestureEvent
 * @brief One completed press sequence
 */
struct GestureEvent {
  Gesture gesture = Gesture::ShortPress;
  uint32_t durationMs = 0;  ///< Duration of the first press
};

/**
 * @struct TickEvent
 * @brief Time snapshot taken by the RTC poller
 */
struct TickEvent {
  ClockFields time;
};

/**
 * @enum SampleKind
 * @brief Sensor reading kind. Also the display cursor order.
 */
enum class SampleKind : uint8_t {
  Temperature = 0,
  Moisture = 1,
  Light = 2,
  Pressure = 3
};

/// @brief Number of SampleKind values (display cursor modulus)
static constexpr uint8_t kSampleKindCount = 4;

/**
 * @struct SensorSample
 * @brief Tagged sensor reading. Read the union member matching kind.
 */
struct SensorSample {
  SampleKind kind = SampleKind::Temperature;
  union {
    float celsius;     ///< Temperature
    float percentRh;   ///< Moisture
    bool bright;       ///< Light
    float hpa;         ///< Pressure
  };

  SensorSample() : celsius(0.0f) {}

  static SensorSample temperature(float c) {
    SensorSample s;
    s.kind = SampleKind::Temperature;
    s.celsius = c;
    return s;
  }

  static SensorSample moisture(float rh) {
    SensorSample s;
    s.kind = SampleKind::Moisture;
    s.percentRh = rh;
    return s;
  }

  static SensorSample light(bool isBright) {
    SensorSample s;
    s.kind = SampleKind::Light;
    s.bright = isBright;
    return s;
  }

  static SensorSample pressure(float p) {
    SensorSample s;
    s.kind = SampleKind::Pressure;
    s.hpa = p;
    return s;
  }
};

inline const char* gestureToStr(Gesture g) {
  switch (g) {
    case Gesture::ShortPress:  return "short";
    case Gesture::LongPress:   return "long";
    case Gesture::DoublePress: return "double";
  }
  return "unknown";
}

inline const char* sampleKindToStr(SampleKind k) {
  switch (k) {
    case SampleKind::Temperature: return "temperature";
    case SampleKind::Moisture:    return "moisture";
    case SampleKind::Light:       return "light";
    case SampleKind::Pressure:    return "pressure";
  }
  return "unknown";
}

}  // namespace ClockGate
