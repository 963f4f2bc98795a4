/**
 * @file DataLine.cpp
 * @brief Direction-tagged I/O line implementation
 */

#include "ClockGate/DataLine.h"

namespace ClockGate {

Status DataLine::attach(const Config& config) {
  if (!config.pinWrite || !config.pinRead || !config.pinMode) {
    return Status::Error(Err::INVALID_CONFIG, "GPIO callbacks are null");
  }
  if (config.ioPin < 0) {
    return Status::Error(Err::INVALID_CONFIG, "I/O pin not set");
  }

  _pinWrite = config.pinWrite;
  _pinRead = config.pinRead;
  _pinMode = config.pinMode;
  _user = config.gpioUser;
  _pin = config.ioPin;

  Status st = _pinMode(_pin, PinMode::Output, _user);
  if (!st.ok()) {
    return st;
  }
  _direction = Direction::Output;
  return Status::Ok();
}

Status DataLine::write(bool high) {
  if (_direction != Direction::Output) {
    return Status::Error(Err::WRONG_DIRECTION, "I/O line is in input mode", _pin);
  }
  return _pinWrite(_pin, high, _user);
}

Status DataLine::read(bool& high) {
  if (_direction != Direction::Input) {
    return Status::Error(Err::WRONG_DIRECTION, "I/O line is in output mode", _pin);
  }
  return _pinRead(_pin, high, _user);
}

Status DataLine::toInput() {
  if (_direction == Direction::Input) {
    return Status::Ok();
  }
  Status st = _pinMode(_pin, PinMode::Input, _user);
  if (st.ok()) {
    _direction = Direction::Input;
  }
  return st;
}

Status DataLine::toOutput() {
  if (_direction == Direction::Output) {
    return Status::Ok();
  }
  Status st = _pinMode(_pin, PinMode::Output, _user);
  if (st.ok()) {
    _direction = Direction::Output;
  }
  return st;
}

}  // namespace ClockGate
