/**
 * @file ButtonClassifier.cpp
 * @brief Blocking button gesture reader
 */

#include "ClockGate/ButtonClassifier.h"

namespace ClockGate {

Status validateButtonTiming(const ButtonConfig& config) {
  if (config.longPressMs == 0) {
    return Status::Error(Err::INVALID_CONFIG, "Long-press threshold must be > 0");
  }
  if (config.doublePressWindowMs == 0) {
    return Status::Error(Err::INVALID_CONFIG, "Double-press window must be > 0");
  }
  if (config.doublePressWindowMs >= config.longPressMs) {
    return Status::Error(Err::INVALID_CONFIG, "Double-press window must be shorter than long press");
  }
  return Status::Ok();
}

Gesture classifyPress(uint32_t durationMs, bool secondPress, uint32_t longPressMs) {
  if (durationMs >= longPressMs) {
    return Gesture::LongPress;
  }
  if (durationMs > 0 && secondPress) {
    return Gesture::DoublePress;
  }
  return Gesture::ShortPress;
}

Status ButtonClassifier::begin(const ButtonConfig& config) {
  _initialized = false;

  if (!config.pinRead || !config.nowMs || !config.delayMs) {
    return Status::Error(Err::INVALID_CONFIG, "Button callbacks are null");
  }
  if (config.pin < 0) {
    return Status::Error(Err::INVALID_CONFIG, "Button pin not set");
  }
  if (config.idlePollMs == 0 || config.pressPollMs == 0) {
    return Status::Error(Err::INVALID_CONFIG, "Poll periods must be > 0");
  }
  Status st = validateButtonTiming(config);
  if (!st.ok()) {
    return st;
  }

  _config = config;
  if (_config.pinMode) {
    st = _config.pinMode(_config.pin, PinMode::InputPullup, _config.gpioUser);
    if (!st.ok()) {
      return st;
    }
  }

  _initialized = true;
  return Status::Ok();
}

Status ButtonClassifier::waitForGesture(GestureEvent& out) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Call begin() first");
  }

  // Idle polling until the pin goes active
  for (;;) {
    bool pressed = false;
    Status st = isPressed(pressed);
    if (!st.ok()) {
      return st;
    }
    if (pressed) {
      break;
    }
    sleep(_config.idlePollMs);
  }

  uint32_t durationMs = 0;
  Status st = measurePress(durationMs);
  if (!st.ok()) {
    return st;
  }

  bool secondPress = false;
  if (durationMs > 0 && durationMs < _config.longPressMs) {
    st = watchForSecondPress(secondPress);
    if (!st.ok()) {
      return st;
    }
  }

  out.gesture = classifyPress(durationMs, secondPress, _config.longPressMs);
  out.durationMs = durationMs;

  // Debounce against re-triggering on the same physical press
  sleep(_config.cooldownMs);
  return Status::Ok();
}

Status ButtonClassifier::isPressed(bool& pressed) {
  bool high = true;
  Status st = _config.pinRead(_config.pin, high, _config.gpioUser);
  if (!st.ok()) {
    return st;
  }
  pressed = !high;  // active low
  return Status::Ok();
}

Status ButtonClassifier::measurePress(uint32_t& durationMs) {
  const uint32_t start = now();
  for (;;) {
    bool pressed = false;
    Status st = isPressed(pressed);
    if (!st.ok()) {
      return st;
    }
    if (!pressed) {
      break;
    }
    sleep(_config.pressPollMs);
  }
  durationMs = now() - start;
  return Status::Ok();
}

Status ButtonClassifier::watchForSecondPress(bool& seen) {
  seen = false;
  const uint32_t releasedAt = now();
  while (now() - releasedAt < _config.doublePressWindowMs) {
    bool pressed = false;
    Status st = isPressed(pressed);
    if (!st.ok()) {
      return st;
    }
    if (pressed) {
      // Wait for the second release so it cannot start a new gesture
      uint32_t secondMs = 0;
      st = measurePress(secondMs);
      if (!st.ok()) {
        return st;
      }
      seen = true;
      return Status::Ok();
    }
    sleep(_config.pressPollMs);
  }
  return Status::Ok();
}

uint32_t ButtonClassifier::now() {
  return _config.nowMs(_config.timeUser);
}

void ButtonClassifier::sleep(uint32_t ms) {
  _config.delayMs(ms, _config.timeUser);
}

}  // namespace ClockGate
