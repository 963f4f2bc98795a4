/**
 * @file Aggregator.h
 * @brief Single consumer of the tick, gesture and sample channels
 *
 * One cycle drains ticks first, then gestures, then samples, and finally
 * rewrites the indicators and display where they changed. Draining ticks
 * first means a gesture is judged against the newest eligibility even when
 * the gesture was queued before the tick.
 */

#pragma once

#include <stdint.h>

#include "AccessController.h"
#include "Channel.h"
#include "Config.h"
#include "Events.h"
#include "Status.h"

namespace ClockGate {

/// @brief Show one line of text on the display.
using DisplayFn = void (*)(const char* text, void* user);

/// @brief Eligibility changed after the tick at `at`.
using EligibilityFn = void (*)(bool eligible, const ClockFields& at, void* user);

/// @brief A gesture was applied. access reflects the state after it.
using OutcomeFn = void (*)(const GestureEvent& gesture, Outcome outcome,
                           const AccessController& access, void* user);

/// @brief A gesture was abandoned because its clock increment failed (not a bus fault).
using GestureErrorFn = void (*)(const GestureEvent& gesture, const Status& status, void* user);

/**
 * @struct AggregatorConfig
 * @brief Outputs and report hooks
 */
struct AggregatorConfig {
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

  /// @brief Report hooks (optional)
  EligibilityFn onEligibility = nullptr;
  OutcomeFn onOutcome = nullptr;
  GestureErrorFn onGestureError = nullptr;
  void* reportUser = nullptr;
};

/**
 * @class Aggregator
 * @brief Applies queued events to the AccessController and publishes outputs
 *
 * Not thread-safe. Call runCycle() from one context only.
 */
class Aggregator {
 public:
  Aggregator() = default;
  Aggregator(const Aggregator&) = delete;
  Aggregator& operator=(const Aggregator&) = delete;

  /**
   * @brief Bind inputs, configure the indicator pins and publish the initial state
   *
   * @param access Started controller; the aggregator becomes its only user
   */
  Status begin(AccessController& access, Channel<TickEvent>& ticks,
               Channel<GestureEvent>& gestures, Channel<SensorSample>& samples,
               const AggregatorConfig& config);

  bool isInitialized() const { return _initialized; }

  /**
   * @brief Drain all three channels and refresh outputs
   *
   * @return OK, or a fatal error: a bus fault from a clock increment or an
   *         indicator pin failure
   */
  Status runCycle();

 private:
  AggregatorConfig _config;
  bool _initialized = false;

  AccessController* _access = nullptr;
  Channel<TickEvent>* _ticks = nullptr;
  Channel<GestureEvent>* _gestures = nullptr;
  Channel<SensorSample>* _samples = nullptr;

  IndicatorState _shownLeds;
  bool _ledsValid = false;
  char _shownText[kDisplayTextSize] = {0};

  void drainTicks();
  Status drainGestures();
  void drainSamples();
  Status publishOutputs();
};

}  // namespace ClockGate
