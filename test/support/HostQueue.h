/**
 * @file HostQueue.h
 * @brief std::thread implementations of Queue and Completion for host tests
 *
 * Same contract as the FreeRTOS port: fixed depth, byte copies, blocking
 * send and receive with a millisecond timeout.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <mutex>
#include <stddef.h>
#include <stdint.h>
#include <vector>

#include "ClockGate/Queue.h"
#include "ClockGate/Status.h"

namespace sim {

class HostQueue : public ClockGate::Queue {
 public:
  HostQueue(size_t depth, size_t itemSize) : _depth(depth), _itemSize(itemSize) {}

  ClockGate::Status send(const void* item, uint32_t timeoutMs) override {
    std::unique_lock<std::mutex> lock(_mutex);
    if (_items.size() >= _depth) {
      _sendsThatWaited++;
    }
    if (!waitUntil(lock, _notFull, timeoutMs, [this] { return _items.size() < _depth; })) {
      return ClockGate::Status::Error(ClockGate::Err::QUEUE_FULL, "host queue full");
    }
    const uint8_t* bytes = static_cast<const uint8_t*>(item);
    _items.push_back(std::vector<uint8_t>(bytes, bytes + _itemSize));
    _notEmpty.notify_one();
    return ClockGate::Status::Ok();
  }

  bool receive(void* item, uint32_t timeoutMs) override {
    std::unique_lock<std::mutex> lock(_mutex);
    if (!waitUntil(lock, _notEmpty, timeoutMs, [this] { return !_items.empty(); })) {
      return false;
    }
    std::memcpy(item, _items.front().data(), _itemSize);
    _items.pop_front();
    _notFull.notify_one();
    return true;
  }

  uint32_t pending() const override {
    std::lock_guard<std::mutex> lock(_mutex);
    return static_cast<uint32_t>(_items.size());
  }

  size_t itemSize() const override { return _itemSize; }

  /// Sends that found the queue full on arrival
  uint32_t sendsThatWaited() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _sendsThatWaited;
  }

 private:
  const size_t _depth;
  const size_t _itemSize;
  mutable std::mutex _mutex;
  std::condition_variable _notFull;
  std::condition_variable _notEmpty;
  std::deque<std::vector<uint8_t>> _items;
  uint32_t _sendsThatWaited = 0;

  template <typename Pred>
  static bool waitUntil(std::unique_lock<std::mutex>& lock, std::condition_variable& cv,
                        uint32_t timeoutMs, Pred ready) {
    if (timeoutMs == ClockGate::kWaitForever) {
      cv.wait(lock, ready);
      return true;
    }
    return cv.wait_for(lock, std::chrono::milliseconds(timeoutMs), ready);
  }
};

class HostCompletion : public ClockGate::Completion {
 public:
  void signal() override {
    std::lock_guard<std::mutex> lock(_mutex);
    _signalled = true;
    _cv.notify_one();
  }

  void wait() override {
    std::unique_lock<std::mutex> lock(_mutex);
    _cv.wait(lock, [this] { return _signalled; });
    _signalled = false;
  }

 private:
  std::mutex _mutex;
  std::condition_variable _cv;
  bool _signalled = false;
};

}  // namespace sim
