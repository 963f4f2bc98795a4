/**
 * @file Aggregator.cpp
 * @brief Channel draining and output publishing
 */

#include "ClockGate/Aggregator.h"

#include <string.h>

namespace ClockGate {

Status Aggregator::begin(AccessController& access, Channel<TickEvent>& ticks,
                         Channel<GestureEvent>& gestures, Channel<SensorSample>& samples,
                         const AggregatorConfig& config) {
  if (!access.isInitialized()) {
    return Status::Error(Err::NOT_INITIALIZED, "AccessController not started");
  }
  if (!ticks.isInitialized() || !gestures.isInitialized() || !samples.isInitialized()) {
    return Status::Error(Err::NOT_INITIALIZED, "Channels not bound");
  }
  if (!config.pinWrite || !config.pinMode) {
    return Status::Error(Err::INVALID_CONFIG, "Indicator callbacks are null");
  }
  if (config.accessLedPin < 0 || config.eligibleLedPin < 0 || config.lockedLedPin < 0) {
    return Status::Error(Err::INVALID_CONFIG, "Indicator pins must be set");
  }

  _config = config;
  _access = &access;
  _ticks = &ticks;
  _gestures = &gestures;
  _samples = &samples;
  _ledsValid = false;
  _shownText[0] = '\0';

  const int pins[] = {config.accessLedPin, config.eligibleLedPin, config.lockedLedPin};
  for (int pin : pins) {
    Status st = _config.pinMode(pin, PinMode::Output, _config.gpioUser);
    if (!st.ok()) return st;
  }
  Status st = publishOutputs();
  if (!st.ok()) return st;

  _initialized = true;
  return Status::Ok();
}

Status Aggregator::runCycle() {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Call begin() first");
  }
  // Ticks first so gestures see the latest eligibility
  drainTicks();
  Status st = drainGestures();
  if (!st.ok()) return st;
  drainSamples();
  return publishOutputs();
}

void Aggregator::drainTicks() {
  TickEvent tick;
  while (_ticks->tryReceive(tick)) {
    const bool wasEligible = _access->isEligible();
    _access->onTick(tick);
    if (_access->isEligible() != wasEligible && _config.onEligibility) {
      _config.onEligibility(_access->isEligible(), tick.time, _config.reportUser);
    }
  }
}

Status Aggregator::drainGestures() {
  GestureEvent gesture;
  while (_gestures->tryReceive(gesture)) {
    Outcome outcome = Outcome::AccessDenied;
    Status st = _access->onGesture(gesture, outcome);
    if (st.isBusFault()) {
      return st;
    }
    if (!st.ok()) {
      if (_config.onGestureError) {
        _config.onGestureError(gesture, st, _config.reportUser);
      }
      continue;
    }
    if (_config.onOutcome) {
      _config.onOutcome(gesture, outcome, *_access, _config.reportUser);
    }
  }
  return Status::Ok();
}

void Aggregator::drainSamples() {
  SensorSample sample;
  while (_samples->tryReceive(sample)) {
    _access->onSample(sample);
  }
}

Status Aggregator::publishOutputs() {
  const IndicatorState leds = _access->indicators();
  if (!_ledsValid || leds.access != _shownLeds.access || leds.eligible != _shownLeds.eligible ||
      leds.locked != _shownLeds.locked) {
    Status st = _config.pinWrite(_config.accessLedPin, leds.access, _config.gpioUser);
    if (!st.ok()) return st;
    st = _config.pinWrite(_config.eligibleLedPin, leds.eligible, _config.gpioUser);
    if (!st.ok()) return st;
    st = _config.pinWrite(_config.lockedLedPin, leds.locked, _config.gpioUser);
    if (!st.ok()) return st;
    _shownLeds = leds;
    _ledsValid = true;
  }

  if (_config.display) {
    char text[kDisplayTextSize];
    AccessController::formatDisplay(_access->display(), text, sizeof(text));
    if (strcmp(text, _shownText) != 0) {
      _config.display(text, _config.displayUser);
      strncpy(_shownText, text, sizeof(_shownText) - 1);
      _shownText[sizeof(_shownText) - 1] = '\0';
    }
  }
  return Status::Ok();
}

}  // namespace ClockGate
