/**
 * @file RtcClock.h
 * @brief DS1302 transport plus cached time, exposing whole-transaction operations
 */

#pragma once

#include <stdint.h>

#include "Config.h"
#include "Ds1302.h"
#include "Status.h"

namespace ClockGate {

/**
 * @enum RtcOp
 * @brief Operation carried by an RtcRequest
 */
enum class RtcOp : uint8_t {
  Read = 0,       ///< Burst read, refresh cache
  Increment = 1,  ///< Read, then write (field + 1) mod modulus
  SetTime = 2     ///< Write all three fields
};

/**
 * @struct RtcRequest
 * @brief One unit of work for the clock. Executed start to finish with no other
 *        bus activity in between.
 */
struct RtcRequest {
  RtcOp op = RtcOp::Read;
  ClockField field = ClockField::Seconds;  ///< Increment only
  ClockFields time;                        ///< SetTime only
};

/**
 * @class RtcClock
 * @brief The only owner of the SCLK / I/O / CE lines.
 *
 * Every public operation is one complete transaction (or, for increment, a
 * read transaction followed by a write transaction) and updates the cached
 * fields on success.
 *
 * @par Thread Safety
 * Not thread-safe. In the firmware it is owned by the RtcService task, which
 * executes requests one at a time.
 */
class RtcClock {
 public:
  /**
   * @brief Start the underlying transport
   */
  Status begin(const Config& config);

  bool isInitialized() const { return _rtc.isInitialized(); }

  /**
   * @brief Burst-read the chip and refresh the cache
   *
   * @param[out] out Snapshot of the time just read
   */
  Status read(ClockFields& out);

  /**
   * @brief Advance one field by one, wrapping at its modulus
   *
   * Reads first so the write never uses a stale value, then writes
   * (current + 1) % modulus (60 for seconds/minutes, 24 for hours).
   *
   * @param field Field to advance
   * @param[out] out Snapshot after the write
   */
  Status incrementField(ClockField field, ClockFields& out);

  /**
   * @brief Write all three fields and refresh the cache
   */
  Status setTime(const ClockFields& time);

  /**
   * @brief Run one request (dispatch point for RtcService)
   */
  Status execute(const RtcRequest& request, ClockFields& out);

  /// @brief Last successfully read or written time
  const ClockFields& cached() const { return _cached; }

  /**
   * @brief (value + 1) % modulus of the field
   */
  static uint8_t nextValue(ClockField field, uint8_t value);

  static uint8_t fieldValue(const ClockFields& time, ClockField field);
  static void setFieldValue(ClockFields& time, ClockField field, uint8_t value);

 private:
  Ds1302 _rtc;
  ClockFields _cached;
};

}  // namespace ClockGate
