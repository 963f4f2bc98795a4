/**
 * @file SensorSampler.h
 * @brief Periodic ambient sampling: temperature, moisture, pressure and light
 *
 * The humidity/temperature device is driven by an external driver reached
 * through a callback; this class only decides what to publish.
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#include "Config.h"
#include "Events.h"
#include "Status.h"

namespace ClockGate {

/// @brief Read temperature (°C) and relative humidity (%RH) from the external sensor.
using ClimateReadFn = Status (*)(float& celsius, float& humidity, void* user);

/**
 * @struct SamplerConfig
 * @brief Sensor sources and cadence
 */
struct SamplerConfig {
  /// @brief Humidity/temperature driver callback (required).
  ClimateReadFn readClimate = nullptr;

  /// @brief User context passed to readClimate (e.g., AM2302::AM2302_Sensor*).
  void* climateUser = nullptr;

  /// @brief Light pin read callback (required).
  PinReadFn pinRead = nullptr;

  /// @brief User context passed to pinRead.
  void* gpioUser = nullptr;

  /// @brief Light sensor digital output. Active low = bright.
  int lightPin = -1;

  /// @brief Sampling period used by the runtime (default: 200ms)
  uint32_t intervalMs = 200;
};

/// @brief Maximum samples produced by one cycle
static constexpr size_t kMaxSamplesPerCycle = 4;

/**
 * @class SensorSampler
 * @brief One call to sample() is one sampling cycle
 */
class SensorSampler {
 public:
  Status begin(const SamplerConfig& config);

  bool isInitialized() const { return _initialized; }

  /**
   * @brief Run one sampling cycle
   *
   * On a successful climate read, emits Temperature, Moisture and Pressure.
   * Light is emitted every cycle. A failed climate read only drops the three
   * climate samples and is counted; it is not an error.
   *
   * @param[out] out Destination array
   * @param capacity Size of out (kMaxSamplesPerCycle is always enough)
   * @param[out] count Number of samples written
   * @return OK, INVALID_PARAM if capacity is too small, or the light pin error
   * @note count is valid on a light pin error; climate samples already written stand.
   */
  Status sample(SensorSample* out, size_t capacity, size_t& count);

  const SamplerConfig& getConfig() const { return _config; }

  /// @brief Status of the most recent climate read
  Status lastClimateStatus() const { return _lastClimate; }

  uint32_t climateFailures() const { return _climateFailures; }
  uint32_t climateSuccesses() const { return _climateSuccesses; }

  /**
   * @brief Estimate station pressure from temperature and humidity
   *
   * Standard sea-level pressure minus the water vapour partial pressure
   * (Magnus formula, Sonntag constants).
   */
  static float estimatePressureHpa(float celsius, float humidity);

 private:
  SamplerConfig _config;
  bool _initialized = false;
  Status _lastClimate = Status::Ok();
  uint32_t _climateFailures = 0;
  uint32_t _climateSuccesses = 0;
};

}  // namespace ClockGate
