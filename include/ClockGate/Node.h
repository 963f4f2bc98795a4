/**
 * @file Node.h
 * @brief The access-control node: components, channels and worker tasks
 *
 * Workers (all perpetual, no shutdown path):
 * - RTC poller: reads the clock through RtcService every rtcPollMs, sends TickEvent
 * - Button: classifies gestures (blocking poll, or edges queued by the pin
 *   interrupt), sends GestureEvent
 * - Sensor sampler: runs a sampling cycle every sampler.intervalMs, sends SensorSample
 * - Aggregator: every aggregatorPeriodMs drains ticks, then gestures, then
 *   samples, updates the AccessController and drives indicators and display
 *
 * The aggregator is the only consumer of the three channels. A producer that
 * finds its channel full waits for the aggregator to make room, so nothing is
 * dropped. The clock is reached only through RtcService.
 */

#pragma once

#include <stdint.h>

#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

#include "AccessController.h"
#include "Aggregator.h"
#include "ButtonClassifier.h"
#include "Channel.h"
#include "Config.h"
#include "Events.h"
#include "FreeRtosPort.h"
#include "Queue.h"
#include "RtcClock.h"
#include "RtcService.h"
#include "SensorSampler.h"
#include "Status.h"

namespace ClockGate {

/**
 * @enum ButtonStrategy
 * @brief How the button task detects presses
 */
enum class ButtonStrategy : uint8_t {
  Polling = 0,       ///< ButtonClassifier: sample pin, busy-wait through presses
  EdgeInterrupt = 1  ///< EdgeButtonReader: edges queued by onButtonEdgeFromIsr()
};

/// @brief Called once when a worker hits an unrecoverable error. The worker then stops.
using FatalFn = void (*)(const char* worker, const Status& status, void* user);

/**
 * @struct RuntimeConfig
 * @brief Cadences, queue depths, tasks and outputs
 */
struct RuntimeConfig {
  /// @brief RTC poll period (default: 1000ms)
  uint32_t rtcPollMs = 1000;

  /// @brief Aggregator cycle period (default: 1000ms)
  uint32_t aggregatorPeriodMs = 1000;

  /// @brief Channel buffer sizes. A full channel makes its producer wait.
  UBaseType_t tickDepth = 8;
  UBaseType_t gestureDepth = 8;
  UBaseType_t sampleDepth = 32;

  /// @brief Longest a producer waits for channel space. A timeout is fatal to that worker.
  uint32_t channelSendWaitMs = kWaitForever;

  /// @brief Button edges buffered between the interrupt and the button task
  UBaseType_t edgeDepth = 16;

  /// @brief Worker task stack size in words
  uint32_t stackWords = 4096;

  /// @brief Worker task priority (RTC service runs above this)
  UBaseType_t workerPriority = 2;

  RtcServiceConfig rtcService;

  ButtonStrategy buttonStrategy = ButtonStrategy::Polling;

  /// @brief Indicator output callbacks (required). Indicators are active high.
  PinWriteFn pinWrite = nullptr;
  PinModeFn pinMode = nullptr;
  void* gpioUser = nullptr;

  int accessLedPin = -1;    ///< Lit in FullAccess
  int eligibleLedPin = -1;  ///< Lit while Locked and eligible
  int lockedLedPin = -1;    ///< Lit while Locked

  /// @brief Display output (optional)
  DisplayFn display = nullptr;
  void* displayUser = nullptr;

  /// @brief Fatal error handler (optional; the worker stops either way)
  FatalFn onFatal = nullptr;
  void* fatalUser = nullptr;

  /// @brief Write bootTime to the RTC before the workers start
  bool setTimeOnBoot = false;
  ClockFields bootTime;
};

/**
 * @struct NodeConfig
 * @brief Everything the node needs
 *
 * In EdgeInterrupt mode button.nowMs must use the same time base as the
 * timestamps passed to onButtonEdgeFromIsr().
 */
struct NodeConfig {
  Config rtc;
  ButtonConfig button;
  SamplerConfig sampler;
  RuntimeConfig runtime;
};

/**
 * @class Node
 * @brief Owns every component and runs the workers
 *
 * @par Memory
 * All allocation (queues, tasks) happens in begin(). Must outlive the workers,
 * i.e. live for the program lifetime.
 */
class Node {
 public:
  Node() = default;
  Node(const Node&) = delete;
  Node& operator=(const Node&) = delete;

  /**
   * @brief Start the clock, components, channels and all worker tasks
   */
  Status begin(const NodeConfig& config);

  /**
   * @brief Queue a button level change for the button task (EdgeInterrupt strategy)
   *
   * @param pressed Level read in the interrupt (true = pressed)
   * @param atMs Time of the change
   * @note ISR-safe. Call from the button pin's CHANGE interrupt.
   */
  void onButtonEdgeFromIsr(bool pressed, uint32_t atMs);

  /// @brief Edges lost because the edge queue was full (interrupts cannot wait)
  uint32_t lostButtonEdges() const { return _lostEdges; }

 private:
  NodeConfig _config;
  bool _started = false;

  RtcClock _clock;
  RtcService _rtc;
  ButtonClassifier _button;
  EdgeButtonReader _edgeReader;
  SensorSampler _sampler;
  AccessController _access;
  Aggregator _aggregator;

  FreeRtosQueue _tickQueue;
  FreeRtosQueue _gestureQueue;
  FreeRtosQueue _sampleQueue;
  FreeRtosQueue _edgeQueue;
  Channel<TickEvent> _ticks;
  Channel<GestureEvent> _gestures;
  Channel<SensorSample> _samples;

  volatile uint32_t _lostEdges = 0;

  Status validate(const NodeConfig& config) const;
  Status startChannels();
  Status startTask(TaskFunction_t entry, const char* name);

  // Workers
  static void rtcPollerEntry(void* arg);
  static void buttonEntry(void* arg);
  static void samplerEntry(void* arg);
  static void aggregatorEntry(void* arg);
  void runRtcPoller();
  void runButton();
  void runSampler();
  void runAggregator();

  void fatal(const char* worker, const Status& status);
};

}  // namespace ClockGate
