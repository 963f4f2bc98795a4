/**
 * @file RtcServer.h
 * @brief Mailbox front end of the RtcClock: callers post, one server executes
 *
 * The RTC poller and the aggregator both need the clock. Instead of sharing
 * the driver behind a lock, one context owns it and every caller posts an
 * RtcRequest to a mailbox, then waits on its Completion until the request has
 * been executed. Bus activity from two requests can never interleave.
 *
 * The server does not own a thread. The firmware runs serveOne() in a
 * FreeRTOS task (RtcService); host tests run it in a std::thread.
 */

#pragma once

#include <stdint.h>

#include "Queue.h"
#include "RtcClock.h"
#include "Status.h"

namespace ClockGate {

/**
 * @class RtcServer
 * @brief Request/response serialization of RtcClock access
 *
 * @par Error Handling
 * After a bus fault (GPIO_ERROR, WRONG_DIRECTION) the server stops touching
 * the bus and answers every later request with the same fault.
 */
class RtcServer {
 public:
  /**
   * @struct Envelope
   * @brief Mailbox item. Points into the caller's frame, which stays alive
   *        until done is signalled.
   */
  struct Envelope {
    RtcRequest request;
    ClockFields* out;
    Status* result;
    Completion* done;
  };

  RtcServer() = default;
  RtcServer(const RtcServer&) = delete;
  RtcServer& operator=(const RtcServer&) = delete;

  /**
   * @brief Bind the clock and the mailbox
   *
   * @param clock Initialized clock; only serveOne() touches it from now on
   * @param mailbox Queue with itemSize() == sizeof(Envelope)
   */
  Status begin(RtcClock& clock, Queue& mailbox);

  bool isInitialized() const { return _clock != nullptr; }

  /**
   * @brief Post a request and wait until it has been served
   *
   * @param request Operation to run
   * @param[out] out Time after the operation
   * @param done Completion owned by the calling context
   * @return Result of the operation, or the latched bus fault
   */
  Status call(const RtcRequest& request, ClockFields& out, Completion& done);

  /**
   * @brief Serve the next request, waiting up to timeoutMs for one
   * @return false if nothing arrived in time
   */
  bool serveOne(uint32_t timeoutMs);

  /// @brief Latched bus fault, OK while the bus is healthy. Read from the serving context.
  const Status& fault() const { return _fault; }

 private:
  RtcClock* _clock = nullptr;
  Queue* _mailbox = nullptr;
  Status _fault = Status::Ok();
};

}  // namespace ClockGate
