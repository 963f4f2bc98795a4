/**
 * @file Channel.h
 * @brief Typed one-directional FIFO channel over a Queue
 */

#pragma once

#include <stdint.h>
#include <type_traits>

#include "Queue.h"
#include "Status.h"

namespace ClockGate {

/**
 * @class Channel
 * @brief Typed message channel. Messages are never dropped.
 *
 * Messages are copied by value, so T must be trivially copyable. The queue
 * depth only sizes the buffer: a producer that finds it full waits for the
 * consumer to make room. With the default kWaitForever send() returns only
 * after the message is queued.
 *
 * @tparam T Message type
 */
template <typename T>
class Channel {
  static_assert(std::is_trivially_copyable<T>::value, "Channel messages are copied by value");

 public:
  Channel() = default;
  Channel(const Channel&) = delete;
  Channel& operator=(const Channel&) = delete;

  /**
   * @brief Bind to a queue sized for T
   *
   * @param queue Backing queue; must outlive the channel
   * @param sendWaitMs Longest a producer waits for space (default: forever)
   */
  Status begin(Queue& queue, uint32_t sendWaitMs = kWaitForever) {
    if (queue.itemSize() != sizeof(T)) {
      return Status::Error(Err::INVALID_CONFIG, "Queue item size does not match message",
                           static_cast<int32_t>(queue.itemSize()));
    }
    _queue = &queue;
    _sendWaitMs = sendWaitMs;
    return Status::Ok();
  }

  bool isInitialized() const { return _queue != nullptr; }

  /**
   * @brief Enqueue, waiting for space if the queue is full
   * @return QUEUE_FULL only if a finite send wait expired; the message was not queued
   */
  Status send(const T& message) {
    if (_queue == nullptr) {
      return Status::Error(Err::NOT_INITIALIZED, "Channel not bound");
    }
    return _queue->send(&message, _sendWaitMs);
  }

  /**
   * @brief Dequeue without waiting
   * @return false if the channel is empty
   */
  bool tryReceive(T& out) {
    if (_queue == nullptr) {
      return false;
    }
    return _queue->receive(&out, 0);
  }

  uint32_t pending() const { return _queue != nullptr ? _queue->pending() : 0; }

 private:
  Queue* _queue = nullptr;
  uint32_t _sendWaitMs = kWaitForever;
};

}  // namespace ClockGate
