/**
 * @file Queue.h
 * @brief Byte-copy message queue and completion signal, implemented per platform
 *
 * The core only sees these two interfaces. The firmware backs them with a
 * FreeRTOS queue and a task notification (FreeRtosPort.h); host tests back
 * them with a mutex and condition variable.
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#include "Status.h"

namespace ClockGate {

/// @brief Timeout value meaning "wait until it happens"
static constexpr uint32_t kWaitForever = UINT32_MAX;

/**
 * @class Queue
 * @brief Fixed-size items, copied in and out by value, FIFO order
 */
class Queue {
 public:
  virtual ~Queue() = default;

  /**
   * @brief Copy one item in, waiting up to timeoutMs for space
   *
   * @param item itemSize() bytes
   * @param timeoutMs 0 = no wait, kWaitForever = wait for space
   * @return OK, or QUEUE_FULL if no space freed up in time
   */
  virtual Status send(const void* item, uint32_t timeoutMs) = 0;

  /**
   * @brief Copy the oldest item out, waiting up to timeoutMs for one
   * @return false on timeout
   */
  virtual bool receive(void* item, uint32_t timeoutMs) = 0;

  virtual uint32_t pending() const = 0;
  virtual size_t itemSize() const = 0;
};

/**
 * @class Completion
 * @brief One-shot wake-up of a single waiting caller
 *
 * signal() may come before wait(); the wake-up is not lost.
 */
class Completion {
 public:
  virtual ~Completion() = default;
  virtual void signal() = 0;
  virtual void wait() = 0;
};

}  // namespace ClockGate
