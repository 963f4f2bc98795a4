/**
 * @file FreeRtosPort.h
 * @brief FreeRTOS implementations of Queue and Completion
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>
#include <freertos/task.h>

#include "Queue.h"
#include "Status.h"

namespace ClockGate {

/**
 * @class FreeRtosQueue
 * @brief Queue over a FreeRTOS queue handle, allocated in create()
 */
class FreeRtosQueue : public Queue {
 public:
  FreeRtosQueue() = default;
  FreeRtosQueue(const FreeRtosQueue&) = delete;
  FreeRtosQueue& operator=(const FreeRtosQueue&) = delete;
  ~FreeRtosQueue() override;

  /**
   * @brief Allocate the queue
   * @param depth Buffered items before senders wait
   * @param itemSize Bytes per item
   */
  Status create(UBaseType_t depth, size_t itemSize);

  Status send(const void* item, uint32_t timeoutMs) override;
  bool receive(void* item, uint32_t timeoutMs) override;
  uint32_t pending() const override;
  size_t itemSize() const override { return _itemSize; }

  /**
   * @brief Enqueue from an interrupt handler without waiting
   *
   * @param[out] woken Set when a higher-priority task was unblocked
   * @return false if the queue was full
   */
  bool sendFromIsr(const void* item, BaseType_t* woken);

 private:
  QueueHandle_t _handle = nullptr;
  size_t _itemSize = 0;
};

/**
 * @class TaskNotifyCompletion
 * @brief Completion over the direct-to-task notification of the constructing task
 *
 * Construct it in the task that will wait().
 */
class TaskNotifyCompletion : public Completion {
 public:
  TaskNotifyCompletion() : _waiter(xTaskGetCurrentTaskHandle()) {}

  void signal() override { xTaskNotifyGive(_waiter); }
  void wait() override { ulTaskNotifyTake(pdTRUE, portMAX_DELAY); }

 private:
  TaskHandle_t _waiter;
};

/// @brief Milliseconds to ticks; kWaitForever maps to portMAX_DELAY
TickType_t toTicks(uint32_t ms);

}  // namespace ClockGate
