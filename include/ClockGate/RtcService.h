/**
 * @file RtcService.h
 * @brief FreeRTOS task that runs the RtcServer
 *
 * Callers in any task post through read()/increment()/setTime() and sleep on
 * their own task notification until the service task has executed the request.
 */

#pragma once

#include <stdint.h>

#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

#include "FreeRtosPort.h"
#include "RtcClock.h"
#include "RtcServer.h"
#include "Status.h"

namespace ClockGate {

/**
 * @struct RtcServiceConfig
 * @brief Actor task parameters
 */
struct RtcServiceConfig {
  /// @brief Mailbox depth (pending requests before callers block)
  UBaseType_t mailboxDepth = 4;

  /// @brief Task stack size in words
  uint32_t stackWords = 3072;

  /// @brief Task priority. Above the workers so requests finish promptly.
  UBaseType_t priority = 3;
};

/**
 * @class RtcService
 * @brief Request/response front end of the RTC clock
 *
 * @par Error Handling
 * Bus faults are latched by the RtcServer and logged once.
 */
class RtcService {
 public:
  RtcService() = default;
  RtcService(const RtcService&) = delete;
  RtcService& operator=(const RtcService&) = delete;

  /**
   * @brief Create the mailbox and start the owning task
   *
   * @param clock Initialized clock; owned by the service from now on
   */
  Status begin(RtcClock& clock, const RtcServiceConfig& config);

  /// @brief Burst-read the time (blocks until served)
  Status read(ClockFields& out);

  /// @brief Read-then-write increment of one field (blocks until served)
  Status increment(ClockField field, ClockFields& out);

  /// @brief Write all three fields (blocks until served)
  Status setTime(const ClockFields& time);

  /**
   * @brief IncrementFieldFn adapter; pass the service as user
   */
  static Status incrementField(ClockField field, ClockFields& out, void* user);

 private:
  FreeRtosQueue _mailbox;
  RtcServer _server;
  TaskHandle_t _task = nullptr;

  Status call(const RtcRequest& request, ClockFields& out);
  void run();
  static void taskEntry(void* arg);
};

}  // namespace ClockGate
