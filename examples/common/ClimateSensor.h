/**
 * @file ClimateSensor.h
 * @brief AM2302 (DHT22) adapter for SamplerConfig::readClimate.
 *
 * NOT part of the library API. Example-only.
 *
 * The AM2302 needs about 2 s between conversions. Faster sampling cycles get
 * the sensor's own error code back and are counted as climate failures by the
 * sampler; light samples are unaffected.
 */

#pragma once

#include <Arduino.h>
#include <AM2302-Sensor.h>
#include <math.h>

#include "ClockGate/Status.h"

namespace climate {

/**
 * @brief Read temperature and humidity.
 *
 * Pass an AM2302::AM2302_Sensor* as user.
 *
 * @return SENSOR_READ_FAILED with the sensor status as detail on failure
 */
inline ClockGate::Status readAm2302(float& celsius, float& humidity, void* user) {
  AM2302::AM2302_Sensor* sensor = static_cast<AM2302::AM2302_Sensor*>(user);
  if (sensor == nullptr) {
    return ClockGate::Status::Error(ClockGate::Err::INVALID_CONFIG, "AM2302 instance is null");
  }

  auto status = sensor->read();
  if (status != 0) {
    return ClockGate::Status::Error(ClockGate::Err::SENSOR_READ_FAILED, "AM2302 read failed",
                                    static_cast<int32_t>(status));
  }

  const float t = sensor->get_Temperature();
  const float h = sensor->get_Humidity();
  if (isnan(t) || isnan(h)) {
    return ClockGate::Status::Error(ClockGate::Err::SENSOR_READ_FAILED, "AM2302 returned NaN");
  }
  celsius = t;
  humidity = h;
  return ClockGate::Status::Ok();
}

}  // namespace climate
