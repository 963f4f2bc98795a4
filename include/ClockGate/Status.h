/**
 * @file Status.h
 * @brief Error status codes for the ClockGate node library
 */

#pragma once

#include <stdint.h>

namespace ClockGate {

/**
 * @enum Err
 * @brief Error codes returned by library operations
 */
enum class Err : uint8_t {
  OK = 0,              ///< Operation successful
  NOT_INITIALIZED,     ///< Component not initialized (call begin() first)
  INVALID_CONFIG,      ///< Invalid configuration parameter
  INVALID_PARAM,       ///< Invalid parameter value
  GPIO_ERROR,          ///< Pin driver reported a failure (fatal on the RTC bus)
  WRONG_DIRECTION,     ///< Data line used against its current direction
  INVALID_TIME,        ///< Time value out of range or corrupt BCD from the chip
  SENSOR_READ_FAILED,  ///< External sensor read failed (recoverable)
  QUEUE_FULL,          ///< Queue still full when the send wait expired
  RESOURCE_ERROR       ///< RTOS task or queue could not be created
};

/**
 * @struct Status
 * @brief Status result from library operations
 *
 * All library functions return Status to indicate success or failure.
 * Check status.ok() to determine if operation succeeded.
 */
struct Status {
  Err code = Err::OK;      ///< Error category
  int32_t detail = 0;      ///< Pin number, driver code or other detail
  const char* msg = "";    ///< Static error message (never heap-allocated)

  constexpr Status() = default;

  constexpr Status(Err c, int32_t d, const char* m) : code(c), detail(d), msg(m) {}

  /**
   * @brief Check if operation succeeded
   * @return true if code == Err::OK
   */
  constexpr bool ok() const { return code == Err::OK; }

  /**
   * @brief Check if the error leaves the RTC bus in an undefined state
   * @return true for pin driver and direction failures
   */
  constexpr bool isBusFault() const {
    return code == Err::GPIO_ERROR || code == Err::WRONG_DIRECTION;
  }

  /**
   * @brief Create successful status
   */
  static constexpr Status Ok() { return Status{Err::OK, 0, "OK"}; }

  /**
   * @brief Create error status
   * @param err Error code
   * @param message Static error message
   * @param detailCode Optional detail code
   */
  static constexpr Status Error(Err err, const char* message, int32_t detailCode = 0) {
    return Status{err, detailCode, message};
  }
};

/**
 * @brief Convert Err enum to a printable name.
 */
inline const char* errToStr(Err code) {
  switch (code) {
    case Err::OK:                 return "OK";
    case Err::NOT_INITIALIZED:    return "NOT_INITIALIZED";
    case Err::INVALID_CONFIG:     return "INVALID_CONFIG";
    case Err::INVALID_PARAM:      return "INVALID_PARAM";
    case Err::GPIO_ERROR:         return "GPIO_ERROR";
    case Err::WRONG_DIRECTION:    return "WRONG_DIRECTION";
    case Err::INVALID_TIME:       return "INVALID_TIME";
    case Err::SENSOR_READ_FAILED: return "SENSOR_READ_FAILED";
    case Err::QUEUE_FULL:         return "QUEUE_FULL";
    case Err::RESOURCE_ERROR:     return "RESOURCE_ERROR";
  }
  return "UNKNOWN";
}

}  // namespace ClockGate
