/**
 * @file EdgeButtonReader.cpp
 * @brief Interrupt edge queue consumer
 */

#include "ClockGate/ButtonClassifier.h"

namespace ClockGate {

Status EdgeButtonReader::begin(const ButtonConfig& config, Queue& edges) {
  if (!config.nowMs) {
    return Status::Error(Err::INVALID_CONFIG, "Time callback is null");
  }
  if (edges.itemSize() != sizeof(ButtonEdge)) {
    return Status::Error(Err::INVALID_CONFIG, "Edge queue item size does not match",
                         static_cast<int32_t>(edges.itemSize()));
  }
  Status st = _tracker.begin(config);
  if (!st.ok()) {
    return st;
  }
  _config = config;
  _edges = &edges;
  _hasPending = false;
  _lastMs = config.nowMs(config.timeUser);
  _initialized = true;
  return Status::Ok();
}

Status EdgeButtonReader::waitForGesture(GestureEvent& out) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Call begin() first");
  }

  for (;;) {
    if (!_hasPending) {
      _hasPending = _edges->receive(&_pending, 0);
    }

    if (_hasPending) {
      // A window that closed before this edge reports first; the edge stays pending
      if (advanceTo(_pending.atMs, out)) {
        return Status::Ok();
      }
      _hasPending = false;
      if (_tracker.onEdge(_pending.pressed, _pending.atMs, out)) {
        return Status::Ok();
      }
      continue;
    }

    const uint32_t now = _config.nowMs(_config.timeUser);
    if (advanceTo(now, out)) {
      return Status::Ok();
    }
    const uint32_t wait = _tracker.msUntilDeadline(now);
    _hasPending = _edges->receive(&_pending, wait == UINT32_MAX ? kWaitForever : wait);
  }
}

bool EdgeButtonReader::advanceTo(uint32_t nowMs, GestureEvent& out) {
  for (;;) {
    const uint32_t wait = _tracker.msUntilDeadline(_lastMs);
    if (wait == UINT32_MAX ||
        static_cast<int32_t>(nowMs - _lastMs) < static_cast<int32_t>(wait)) {
      break;
    }
    _lastMs += wait;
    if (_tracker.poll(_lastMs, out)) {
      return true;
    }
  }
  if (static_cast<int32_t>(nowMs - _lastMs) > 0) {
    _lastMs = nowMs;
  }
  return false;
}

}  // namespace ClockGate
