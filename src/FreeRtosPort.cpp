/**
 * @file FreeRtosPort.cpp
 * @brief FreeRTOS queue adapter
 */

#include "ClockGate/FreeRtosPort.h"

namespace ClockGate {

TickType_t toTicks(uint32_t ms) {
  if (ms == kWaitForever) {
    return portMAX_DELAY;
  }
  const TickType_t ticks = pdMS_TO_TICKS(ms);
  // A non-zero wait shorter than one tick still waits one tick
  return (ms != 0 && ticks == 0) ? 1 : ticks;
}

FreeRtosQueue::~FreeRtosQueue() {
  if (_handle != nullptr) {
    vQueueDelete(_handle);
  }
}

Status FreeRtosQueue::create(UBaseType_t depth, size_t itemSize) {
  if (_handle != nullptr) {
    return Status::Ok();
  }
  if (depth == 0 || itemSize == 0) {
    return Status::Error(Err::INVALID_CONFIG, "Queue depth and item size must be > 0");
  }
  _handle = xQueueCreate(depth, static_cast<UBaseType_t>(itemSize));
  if (_handle == nullptr) {
    return Status::Error(Err::RESOURCE_ERROR, "Queue allocation failed",
                         static_cast<int32_t>(depth));
  }
  _itemSize = itemSize;
  return Status::Ok();
}

Status FreeRtosQueue::send(const void* item, uint32_t timeoutMs) {
  if (_handle == nullptr) {
    return Status::Error(Err::NOT_INITIALIZED, "Queue not created");
  }
  if (xQueueSend(_handle, item, toTicks(timeoutMs)) != pdTRUE) {
    return Status::Error(Err::QUEUE_FULL, "Queue full after send wait",
                         static_cast<int32_t>(timeoutMs));
  }
  return Status::Ok();
}

bool FreeRtosQueue::receive(void* item, uint32_t timeoutMs) {
  if (_handle == nullptr) {
    return false;
  }
  return xQueueReceive(_handle, item, toTicks(timeoutMs)) == pdTRUE;
}

uint32_t FreeRtosQueue::pending() const {
  return _handle != nullptr ? static_cast<uint32_t>(uxQueueMessagesWaiting(_handle)) : 0;
}

bool FreeRtosQueue::sendFromIsr(const void* item, BaseType_t* woken) {
  if (_handle == nullptr) {
    return false;
  }
  return xQueueSendFromISR(_handle, item, woken) == pdTRUE;
}

}  // namespace ClockGate
