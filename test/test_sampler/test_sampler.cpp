#include <math.h>
#include <stddef.h>
#include <stdint.h>
#include <unity.h>

#include "ClockGate/SensorSampler.h"
#include "support/FakeTime.h"

using ClockGate::Err;
using ClockGate::SampleKind;
using ClockGate::SamplerConfig;
using ClockGate::SensorSample;
using ClockGate::SensorSampler;
using ClockGate::Status;

namespace {

sim::FakeTime g_pins;
sim::FakeClimate g_climate;

SamplerConfig makeConfig() {
  SamplerConfig cfg;
  cfg.readClimate = sim::FakeClimate::read;
  cfg.climateUser = &g_climate;
  cfg.pinRead = sim::FakeTime::pinRead;
  cfg.gpioUser = &g_pins;
  cfg.lightPin = sim::FakeTime::kLightPin;
  return cfg;
}

void beginSampler(SensorSampler& sampler) {
  Status st = sampler.begin(makeConfig());
  TEST_ASSERT_TRUE_MESSAGE(st.ok(), st.msg);
}

Status nanClimate(float& c, float& h, void*) {
  c = NAN;
  h = 40.0f;
  return Status::Ok();
}

}  // namespace

void setUp() {
  g_pins = sim::FakeTime();
  g_climate = sim::FakeClimate();
}

void tearDown() {}

void test_begin_validates_config() {
  SensorSampler sampler;
  SamplerConfig cfg = makeConfig();
  TEST_ASSERT_EQUAL_UINT32(200, cfg.intervalMs);

  cfg.readClimate = nullptr;
  TEST_ASSERT_EQUAL(Err::INVALID_CONFIG, sampler.begin(cfg).code);
  cfg = makeConfig();
  cfg.lightPin = -1;
  TEST_ASSERT_EQUAL(Err::INVALID_CONFIG, sampler.begin(cfg).code);

  SensorSample out[ClockGate::kMaxSamplesPerCycle];
  size_t count = 99;
  TEST_ASSERT_EQUAL(Err::NOT_INITIALIZED, sampler.sample(out, ClockGate::kMaxSamplesPerCycle, count).code);
  TEST_ASSERT_EQUAL_UINT32(0, count);
}

void test_full_cycle_emits_four_samples() {
  SensorSampler sampler;
  beginSampler(sampler);
  g_pins.lightHigh = false;  // bright

  SensorSample out[ClockGate::kMaxSamplesPerCycle];
  size_t count = 0;
  TEST_ASSERT_TRUE(sampler.sample(out, ClockGate::kMaxSamplesPerCycle, count).ok());
  TEST_ASSERT_EQUAL_UINT32(4, count);

  TEST_ASSERT_EQUAL(SampleKind::Temperature, out[0].kind);
  TEST_ASSERT_EQUAL_FLOAT(21.5f, out[0].celsius);
  TEST_ASSERT_EQUAL(SampleKind::Moisture, out[1].kind);
  TEST_ASSERT_EQUAL_FLOAT(40.0f, out[1].percentRh);
  TEST_ASSERT_EQUAL(SampleKind::Pressure, out[2].kind);
  TEST_ASSERT_EQUAL(SampleKind::Light, out[3].kind);
  TEST_ASSERT_TRUE(out[3].bright);
  TEST_ASSERT_EQUAL_UINT32(1, sampler.climateSuccesses());
}

void test_climate_failure_skips_climate_samples() {
  SensorSampler sampler;
  beginSampler(sampler);
  g_climate.fail = true;

  SensorSample out[ClockGate::kMaxSamplesPerCycle];
  size_t count = 0;
  TEST_ASSERT_TRUE(sampler.sample(out, ClockGate::kMaxSamplesPerCycle, count).ok());
  TEST_ASSERT_EQUAL_UINT32(1, count);
  TEST_ASSERT_EQUAL(SampleKind::Light, out[0].kind);
  TEST_ASSERT_FALSE(out[0].bright);
  TEST_ASSERT_EQUAL_UINT32(1, sampler.climateFailures());
  TEST_ASSERT_EQUAL(Err::SENSOR_READ_FAILED, sampler.lastClimateStatus().code);

  // Recovers on the next cycle
  g_climate.fail = false;
  TEST_ASSERT_TRUE(sampler.sample(out, ClockGate::kMaxSamplesPerCycle, count).ok());
  TEST_ASSERT_EQUAL_UINT32(4, count);
  TEST_ASSERT_TRUE(sampler.lastClimateStatus().ok());
  TEST_ASSERT_EQUAL_UINT32(1, sampler.climateFailures());
}

void test_nan_reading_counts_as_failure() {
  SamplerConfig cfg = makeConfig();
  cfg.readClimate = nanClimate;
  SensorSampler sampler;
  TEST_ASSERT_TRUE(sampler.begin(cfg).ok());

  SensorSample out[ClockGate::kMaxSamplesPerCycle];
  size_t count = 0;
  TEST_ASSERT_TRUE(sampler.sample(out, ClockGate::kMaxSamplesPerCycle, count).ok());
  TEST_ASSERT_EQUAL_UINT32(1, count);
  TEST_ASSERT_EQUAL_UINT32(1, sampler.climateFailures());
}

void test_light_pin_failure_is_reported() {
  SensorSampler sampler;
  beginSampler(sampler);
  g_pins.failLightRead = true;

  SensorSample out[ClockGate::kMaxSamplesPerCycle];
  size_t count = 0;
  Status st = sampler.sample(out, ClockGate::kMaxSamplesPerCycle, count);
  TEST_ASSERT_EQUAL(Err::GPIO_ERROR, st.code);
  TEST_ASSERT_EQUAL_UINT32(3, count);  // climate samples stand
}

void test_small_buffer_rejected() {
  SensorSampler sampler;
  beginSampler(sampler);

  SensorSample out[2];
  size_t count = 0;
  TEST_ASSERT_EQUAL(Err::INVALID_PARAM, sampler.sample(out, 2, count).code);
  TEST_ASSERT_EQUAL_UINT32(0, g_climate.reads);
}

void test_pressure_estimate() {
  // Dry air reads standard pressure
  TEST_ASSERT_FLOAT_WITHIN(0.01f, 1013.25f, SensorSampler::estimatePressureHpa(20.0f, 0.0f));
  // 20 C saturation vapour pressure is about 23.33 hPa
  TEST_ASSERT_FLOAT_WITHIN(0.1f, 1013.25f - 23.33f,
                           SensorSampler::estimatePressureHpa(20.0f, 100.0f));
  TEST_ASSERT_FLOAT_WITHIN(0.1f, 1013.25f - 11.66f,
                           SensorSampler::estimatePressureHpa(20.0f, 50.0f));
  TEST_ASSERT_TRUE(SensorSampler::estimatePressureHpa(30.0f, 60.0f) <
                   SensorSampler::estimatePressureHpa(10.0f, 60.0f));
}

int main(int, char**) {
  UNITY_BEGIN();
  RUN_TEST(test_begin_validates_config);
  RUN_TEST(test_full_cycle_emits_four_samples);
  RUN_TEST(test_climate_failure_skips_climate_samples);
  RUN_TEST(test_nan_reading_counts_as_failure);
  RUN_TEST(test_light_pin_failure_is_reported);
  RUN_TEST(test_small_buffer_rejected);
  RUN_TEST(test_pressure_estimate);
  return UNITY_END();
}
