/**
 * @file SensorSampler.cpp
 * @brief Ambient sensor sampling cycle
 */

#include "ClockGate/SensorSampler.h"

#include <climits>
#include <cmath>

namespace ClockGate {

namespace {
constexpr float kSeaLevelHpa = 1013.25f;
constexpr float kMagnusBaseHpa = 6.112f;
constexpr float kMagnusA = 17.62f;
constexpr float kMagnusB = 243.12f;
}  // namespace

Status SensorSampler::begin(const SamplerConfig& config) {
  _initialized = false;
  if (!config.readClimate || !config.pinRead) {
    return Status::Error(Err::INVALID_CONFIG, "Sampler callbacks are null");
  }
  if (config.lightPin < 0) {
    return Status::Error(Err::INVALID_CONFIG, "Light pin not set");
  }
  if (config.intervalMs == 0) {
    return Status::Error(Err::INVALID_CONFIG, "Sampling interval must be > 0");
  }

  _config = config;
  _lastClimate = Status::Ok();
  _climateFailures = 0;
  _climateSuccesses = 0;
  _initialized = true;
  return Status::Ok();
}

Status SensorSampler::sample(SensorSample* out, size_t capacity, size_t& count) {
  count = 0;
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Call begin() first");
  }
  if (out == nullptr || capacity < kMaxSamplesPerCycle) {
    return Status::Error(Err::INVALID_PARAM, "Sample buffer too small",
                         static_cast<int32_t>(capacity));
  }

  float celsius = 0.0f;
  float humidity = 0.0f;
  _lastClimate = _config.readClimate(celsius, humidity, _config.climateUser);
  if (_lastClimate.ok() && (std::isnan(celsius) || std::isnan(humidity))) {
    _lastClimate = Status::Error(Err::SENSOR_READ_FAILED, "Climate sensor returned NaN");
  }

  if (_lastClimate.ok()) {
    if (_climateSuccesses < UINT32_MAX) {
      ++_climateSuccesses;
    }
    out[count++] = SensorSample::temperature(celsius);
    out[count++] = SensorSample::moisture(humidity);
    out[count++] = SensorSample::pressure(estimatePressureHpa(celsius, humidity));
  } else if (_climateFailures < UINT32_MAX) {
    // Skipped this cycle; the consumer keeps its last values
    ++_climateFailures;
  }

  bool high = true;
  Status st = _config.pinRead(_config.lightPin, high, _config.gpioUser);
  if (!st.ok()) {
    return st;
  }
  out[count++] = SensorSample::light(!high);  // active low = bright
  return Status::Ok();
}

float SensorSampler::estimatePressureHpa(float celsius, float humidity) {
  const float saturation = kMagnusBaseHpa * std::exp(kMagnusA * celsius / (kMagnusB + celsius));
  const float vapour = saturation * (humidity / 100.0f);
  return kSeaLevelHpa - vapour;
}

}  // namespace ClockGate
