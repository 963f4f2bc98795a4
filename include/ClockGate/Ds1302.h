/**
 * @file Ds1302.h
 * @brief Bit-banged driver for the Maxim DS1302 three-wire real-time clock
 *
 * The DS1302 is clocked entirely in software over three GPIO lines:
 * - SCLK: serial clock, always driven by the MCU
 * - I/O: bidirectional data, switched to input for the read phase
 * - CE: chip enable / reset, high while a transaction is open
 *
 * Only the time-of-day registers are used. Bytes travel least-significant bit
 * first; every transaction is one command byte followed by one data byte or by
 * a clock burst.
 *
 * @par Thread Safety
 * Not thread-safe. Share it through RtcService (one owning task), never by
 * calling it from two tasks.
 *
 * @par Error Handling
 * All errors returned as Status. A GPIO or direction failure leaves the chip
 * mid-frame and must be treated as fatal by the caller.
 */

#pragma once

#include <stdint.h>

#include "Config.h"
#include "DataLine.h"
#include "Status.h"

namespace ClockGate {

/**
 * @struct ClockFields
 * @brief Time of day in decimal (not BCD), 24-hour format.
 */
struct ClockFields {
  uint8_t hour = 0;    ///< Hour (0-23)
  uint8_t minute = 0;  ///< Minute (0-59)
  uint8_t second = 0;  ///< Second (0-59)
};

/**
 * @enum ClockField
 * @brief Selects one writable time-of-day register
 */
enum class ClockField : uint8_t {
  Hours = 0,
  Minutes = 1,
  Seconds = 2
};

/**
 * @class Ds1302
 * @brief Three-wire protocol engine for the DS1302
 */
class Ds1302 {
 public:
  /**
   * @brief Validate configuration and put the bus in its idle state
   *
   * @param config Hardware callbacks, pins and timing
   * @return OK on success, INVALID_CONFIG or a GPIO error otherwise
   * @note Clears write protection when config.disableWriteProtectOnBegin is set.
   */
  Status begin(const Config& config);

  /**
   * @brief Forget the configuration. Pins are left as they are.
   */
  void end();

  bool isInitialized() const { return _initialized; }

  const Config& getConfig() const { return _config; }

  // ===== Register Operations =====

  /**
   * @brief Clear the write-protect bit (command 0x8E, data 0x00)
   */
  Status disableWriteProtect();

  /**
   * @brief Write one time-of-day register
   *
   * @param field Register to write
   * @param value Decimal value (0-23 for hours, 0-59 otherwise)
   * @return INVALID_TIME if value is out of range, bus error otherwise
   * @note Seconds are written with the clock-halt bit cleared, hours in 24-hour mode.
   */
  Status writeField(ClockField field, uint8_t value);

  /**
   * @brief Write write-protect off, then seconds, minutes and hours
   *
   * @param time Time to set (validated before any bus activity)
   */
  Status setTime(const ClockFields& time);

  /**
   * @brief Burst-read seconds, minutes and hours in one transaction
   *
   * @param[out] out Decoded time; untouched on error
   * @return INVALID_TIME if the chip returned non-BCD or out-of-range data
   * @note The date, month, day and year bytes are clocked out and discarded so the
   *       burst frame is always consumed in full.
   */
  Status readTime(ClockFields& out);

  // ===== Static Utility Functions =====

  /**
   * @brief Packed BCD to decimal: (bcd >> 4) * 10 + (bcd & 0x0F)
   */
  static uint8_t bcdToDecimal(uint8_t bcd);

  /**
   * @brief Decimal to packed BCD: (dec / 10) << 4 | (dec % 10)
   * @note Only meaningful for 0-99. Callers range-check first.
   */
  static uint8_t decimalToBcd(uint8_t dec);

  /**
   * @brief Check that both nibbles of a BCD byte are 0-9
   */
  static bool isValidBcd(uint8_t v);

  /**
   * @brief Upper bound (exclusive) of a field: 24 for hours, 60 otherwise
   */
  static uint8_t fieldModulus(ClockField field);

  static bool isValidTime(const ClockFields& time);

  /**
   * @brief Parse compiler build time (__TIME__) into ClockFields
   *
   * @param[out] out Structure to receive parsed time
   * @return true if parsing successful, false otherwise
   * @warning Time is the local time of the build machine.
   */
  static bool parseBuildTime(ClockFields& out);

  /// @brief Parse an "HH:MM:SS" string (exposed for parseBuildTime and tests)
  static bool parseTimeString(const char* text, ClockFields& out);

 private:
  Config _config;
  DataLine _io;
  bool _initialized = false;

  // Transaction framing
  Status openTransaction();
  Status closeTransaction();
  /// @brief Restore I/O to output and drop CE after a failed frame, returning cause
  Status abortTransaction(const Status& cause);

  // Bit/byte transfer, least-significant bit first
  Status sendByte(uint8_t value);
  Status receiveByte(uint8_t& value);
  Status setClock(bool high);

  Status writeRegister(uint8_t command, uint8_t value);
  void guardDelay();
};

}  // namespace ClockGate
