/**
 * @file RtcClock.cpp
 * @brief Clock resource: cached time over the DS1302 transport
 */

#include "ClockGate/RtcClock.h"

namespace ClockGate {

Status RtcClock::begin(const Config& config) {
  _cached = ClockFields{};
  return _rtc.begin(config);
}

Status RtcClock::read(ClockFields& out) {
  ClockFields now;
  Status st = _rtc.readTime(now);
  if (!st.ok()) {
    return st;
  }
  _cached = now;
  out = now;
  return Status::Ok();
}

Status RtcClock::incrementField(ClockField field, ClockFields& out) {
  ClockFields now;
  Status st = read(now);
  if (!st.ok()) {
    return st;
  }

  const uint8_t next = nextValue(field, fieldValue(now, field));
  st = _rtc.writeField(field, next);
  if (!st.ok()) {
    return st;
  }

  setFieldValue(now, field, next);
  _cached = now;
  out = now;
  return Status::Ok();
}

Status RtcClock::setTime(const ClockFields& time) {
  Status st = _rtc.setTime(time);
  if (!st.ok()) {
    return st;
  }
  _cached = time;
  return Status::Ok();
}

Status RtcClock::execute(const RtcRequest& request, ClockFields& out) {
  switch (request.op) {
    case RtcOp::Read:
      return read(out);
    case RtcOp::Increment:
      return incrementField(request.field, out);
    case RtcOp::SetTime: {
      Status st = setTime(request.time);
      if (st.ok()) {
        out = _cached;
      }
      return st;
    }
  }
  return Status::Error(Err::INVALID_PARAM, "Unknown RTC request");
}

uint8_t RtcClock::nextValue(ClockField field, uint8_t value) {
  const uint8_t modulus = Ds1302::fieldModulus(field);
  return static_cast<uint8_t>((value + 1u) % modulus);
}

uint8_t RtcClock::fieldValue(const ClockFields& time, ClockField field) {
  switch (field) {
    case ClockField::Hours:   return time.hour;
    case ClockField::Minutes: return time.minute;
    case ClockField::Seconds: return time.second;
  }
  return 0;
}

void RtcClock::setFieldValue(ClockFields& time, ClockField field, uint8_t value) {
  switch (field) {
    case ClockField::Hours:   time.hour = value; break;
    case ClockField::Minutes: time.minute = value; break;
    case ClockField::Seconds: time.second = value; break;
  }
}

}  // namespace ClockGate
