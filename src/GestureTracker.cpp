/**
 * @file GestureTracker.cpp
 * @brief Edge-driven gesture state machine
 */

#include "ClockGate/ButtonClassifier.h"

#include <climits>

namespace ClockGate {

namespace {
/// @brief Wraparound-safe deadline check (millis() wraps after ~49 days).
bool hasDeadlinePassed(uint32_t nowMs, uint32_t deadlineMs) {
  return static_cast<int32_t>(nowMs - deadlineMs) >= 0;
}
}  // namespace

Status GestureTracker::begin(const ButtonConfig& config) {
  Status st = validateButtonTiming(config);
  if (!st.ok()) {
    return st;
  }
  _config = config;
  _state = State::Idle;
  _level = false;
  _pressStartMs = 0;
  _firstDurationMs = 0;
  _deadlineMs = 0;
  return Status::Ok();
}

bool GestureTracker::onEdge(bool pressed, uint32_t nowMs, GestureEvent& out) {
  if (pressed == _level) {
    return false;  // bounce or repeated report
  }
  _level = pressed;

  switch (_state) {
    case State::Idle:
      if (pressed) {
        _pressStartMs = nowMs;
        _state = State::FirstPress;
      }
      return false;

    case State::FirstPress: {
      if (pressed) {
        return false;
      }
      const uint32_t duration = nowMs - _pressStartMs;
      _firstDurationMs = duration;
      if (duration >= _config.longPressMs || duration == 0) {
        emit(classifyPress(duration, false, _config.longPressMs), nowMs, out);
        return true;
      }
      _deadlineMs = nowMs + _config.doublePressWindowMs;
      _state = State::AwaitSecond;
      return false;
    }

    case State::AwaitSecond:
      if (pressed && !hasDeadlinePassed(nowMs, _deadlineMs)) {
        _state = State::SecondPress;
        return false;
      }
      if (pressed) {
        // Window already over: close it out, this press starts after cooldown
        emit(Gesture::ShortPress, nowMs, out);
        return true;
      }
      return false;

    case State::SecondPress:
      if (!pressed) {
        emit(Gesture::DoublePress, nowMs, out);
        return true;
      }
      return false;

    case State::Cooldown:
      return false;
  }
  return false;
}

bool GestureTracker::poll(uint32_t nowMs, GestureEvent& out) {
  switch (_state) {
    case State::AwaitSecond:
      if (hasDeadlinePassed(nowMs, _deadlineMs)) {
        emit(Gesture::ShortPress, nowMs, out);
        return true;
      }
      return false;

    case State::Cooldown:
      if (hasDeadlinePassed(nowMs, _deadlineMs)) {
        if (_level) {
          // Held through the cooldown: treat as a fresh press
          _pressStartMs = nowMs;
          _state = State::FirstPress;
        } else {
          _state = State::Idle;
        }
      }
      return false;

    case State::Idle:
    case State::FirstPress:
    case State::SecondPress:
      return false;
  }
  return false;
}

uint32_t GestureTracker::msUntilDeadline(uint32_t nowMs) const {
  if (_state != State::AwaitSecond && _state != State::Cooldown) {
    return UINT32_MAX;
  }
  if (hasDeadlinePassed(nowMs, _deadlineMs)) {
    return 0;
  }
  return _deadlineMs - nowMs;
}

void GestureTracker::emit(Gesture gesture, uint32_t nowMs, GestureEvent& out) {
  out.gesture = gesture;
  out.durationMs = _firstDurationMs;
  _deadlineMs = nowMs + _config.cooldownMs;
  _state = State::Cooldown;
}

}  // namespace ClockGate
