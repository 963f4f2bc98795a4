/**
 * @file DataLine.h
 * @brief Direction-tagged wrapper for the DS1302 bidirectional I/O pin
 */

#pragma once

#include <stdint.h>

#include "Config.h"
#include "Status.h"

namespace ClockGate {

/**
 * @class DataLine
 * @brief The I/O line of the three-wire bus, tagged with its current direction.
 *
 * write() is only legal in Output direction and read() only in Input
 * direction; the other combination returns WRONG_DIRECTION without touching
 * the pin. Direction changes go through toInput()/toOutput(), which call the
 * pin-mode callback and update the tag only when the driver succeeded.
 */
class DataLine {
 public:
  enum class Direction : uint8_t { Output, Input };

  /**
   * @brief Bind the line to a pin and force it to Output direction.
   */
  Status attach(const Config& config);

  Status write(bool high);
  Status read(bool& high);

  Status toInput();
  Status toOutput();

  Direction direction() const { return _direction; }
  bool isOutput() const { return _direction == Direction::Output; }

 private:
  PinWriteFn _pinWrite = nullptr;
  PinReadFn _pinRead = nullptr;
  PinModeFn _pinMode = nullptr;
  void* _user = nullptr;
  int _pin = -1;
  Direction _direction = Direction::Output;
};

}  // namespace ClockGate
