/**
 * @file AccessController.cpp
 * @brief Setup/access state machine implementation
 */

#include "ClockGate/AccessController.h"

#include <cstdio>

namespace ClockGate {

Status AccessController::begin(const AccessConfig& config) {
  _initialized = false;
  if (!config.incrementField) {
    return Status::Error(Err::INVALID_CONFIG, "Clock increment callback is null");
  }

  _config = config;
  _setup = SetupMode::Idle;
  _access = AccessMode::Locked;
  _eligible = false;
  _cursor = 0;
  _hasTime = false;
  _lastTime = ClockFields{};
  for (uint8_t i = 0; i < kSampleKindCount; ++i) {
    _hasSample[i] = false;
  }
  _initialized = true;
  return Status::Ok();
}

void AccessController::onTick(const TickEvent& tick) {
  _lastTime = tick.time;
  _hasTime = true;
  _eligible = (tick.time.minute % 2) == 1;
}

Status AccessController::onGesture(const GestureEvent& gesture, Outcome& outcome) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Call begin() first");
  }

  switch (gesture.gesture) {
    case Gesture::LongPress:
      outcome = onLongPress();
      return Status::Ok();
    case Gesture::ShortPress:
      return onShortPress(outcome);
    case Gesture::DoublePress:
      outcome = onDoublePress();
      return Status::Ok();
  }
  return Status::Error(Err::INVALID_PARAM, "Unknown gesture");
}

void AccessController::onSample(const SensorSample& sample) {
  const uint8_t slot = static_cast<uint8_t>(sample.kind);
  if (slot >= kSampleKindCount) {
    return;
  }
  _samples[slot] = sample;
  _hasSample[slot] = true;
}

bool AccessController::cachedSample(SampleKind kind, SensorSample& out) const {
  const uint8_t slot = static_cast<uint8_t>(kind);
  if (slot >= kSampleKindCount || !_hasSample[slot]) {
    return false;
  }
  out = _samples[slot];
  return true;
}

// ===== Transitions =====

Outcome AccessController::onLongPress() {
  const SetupMode previous = _setup;
  _setup = nextSetupMode(_setup);
  if (previous == SetupMode::Idle) {
    return Outcome::SetupEntered;
  }
  return _setup == SetupMode::Idle ? Outcome::SetupExited : Outcome::SetupAdvanced;
}

Status AccessController::onShortPress(Outcome& outcome) {
  if (_setup == SetupMode::Idle) {
    _cursor = static_cast<uint8_t>((_cursor + 1) % kSampleKindCount);
    outcome = Outcome::CursorAdvanced;
    return Status::Ok();
  }

  ClockFields updated;
  Status st = _config.incrementField(fieldForSetup(_setup), updated, _config.clockUser);
  if (!st.ok()) {
    return st;
  }
  _lastTime = updated;
  _hasTime = true;
  outcome = Outcome::FieldIncremented;
  return Status::Ok();
}

Outcome AccessController::onDoublePress() {
  if (_access == AccessMode::FullAccess) {
    _access = AccessMode::Locked;
    return Outcome::AccessRevoked;
  }
  if (_eligible) {
    _access = AccessMode::FullAccess;
    return Outcome::AccessGranted;
  }
  return Outcome::AccessDenied;
}

// ===== Outputs =====

IndicatorState AccessController::indicators() const {
  IndicatorState leds;
  if (_access == AccessMode::FullAccess) {
    leds.access = true;
  } else {
    leds.locked = true;
    leds.eligible = _eligible;
  }
  return leds;
}

DisplayContent AccessController::display() const {
  DisplayContent content;
  if (_setup != SetupMode::Idle) {
    content.kind = DisplayKind::SetupField;
    content.field = fieldForSetup(_setup);
    return content;
  }

  content.sampleKind = (_access == AccessMode::FullAccess) ? cursor() : SampleKind::Temperature;
  content.kind = cachedSample(content.sampleKind, content.sample) ? DisplayKind::Sample
                                                                  : DisplayKind::Unavailable;
  return content;
}

size_t AccessController::formatDisplay(const DisplayContent& content, char* buf, size_t len) {
  if (buf == nullptr || len == 0) {
    return 0;
  }

  int n = 0;
  if (content.kind == DisplayKind::SetupField) {
    const char* name = "HOURS";
    if (content.field == ClockField::Minutes) {
      name = "MINUTES";
    } else if (content.field == ClockField::Seconds) {
      name = "SECONDS";
    }
    n = std::snprintf(buf, len, "SET %s", name);
  } else {
    const SensorSample& s = content.sample;
    const bool have = content.kind == DisplayKind::Sample;
    switch (content.sampleKind) {
      case SampleKind::Temperature:
        n = have ? std::snprintf(buf, len, "TEMP %.1fC", static_cast<double>(s.celsius))
                 : std::snprintf(buf, len, "TEMP ---");
        break;
      case SampleKind::Moisture:
        n = have ? std::snprintf(buf, len, "HUM %.1f%%", static_cast<double>(s.percentRh))
                 : std::snprintf(buf, len, "HUM ---");
        break;
      case SampleKind::Light:
        n = have ? std::snprintf(buf, len, "LIGHT %s", s.bright ? "BRIGHT" : "DARK")
                 : std::snprintf(buf, len, "LIGHT ---");
        break;
      case SampleKind::Pressure:
        n = have ? std::snprintf(buf, len, "PRES %.1fhPa", static_cast<double>(s.hpa))
                 : std::snprintf(buf, len, "PRES ---");
        break;
    }
  }

  if (n < 0) {
    buf[0] = '\0';
    return 0;
  }
  const size_t written = static_cast<size_t>(n);
  return written < len ? written : len - 1;
}

// ===== Static Helpers =====

SetupMode AccessController::nextSetupMode(SetupMode mode) {
  switch (mode) {
    case SetupMode::Idle:    return SetupMode::Hours;
    case SetupMode::Hours:   return SetupMode::Minutes;
    case SetupMode::Minutes: return SetupMode::Seconds;
    case SetupMode::Seconds: return SetupMode::Idle;
  }
  return SetupMode::Idle;
}

ClockField AccessController::fieldForSetup(SetupMode mode) {
  switch (mode) {
    case SetupMode::Minutes: return ClockField::Minutes;
    case SetupMode::Seconds: return ClockField::Seconds;
    case SetupMode::Hours:
    case SetupMode::Idle:
      break;
  }
  return ClockField::Hours;
}

}  // namespace ClockGate
