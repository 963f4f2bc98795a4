/**
 * @file ButtonClassifier.h
 * @brief Button gesture classification (short, long and double press)
 *
 * Two strategies share one configuration and the same thresholds:
 * - ButtonClassifier: blocking. Polls the pin, busy-waits through the press and
 *   returns once a gesture is complete. Meant to own a task.
 * - GestureTracker: non-blocking. Fed pin edges with timestamps (for example
 *   from an interrupt) and polled for expired windows.
 * - EdgeButtonReader: blocking front end of GestureTracker that consumes
 *   ButtonEdge records queued by the pin interrupt.
 *
 * Timeline:
 * @code
 * Short:  ▔▔╲____╱▔▔▔▔▔▔▔▔▔▔▔▔▔  (< 2000 ms, nothing within 300 ms after release)
 * Double: ▔▔╲____╱▔╲____╱▔▔▔▔▔  (second press starts within 300 ms of release)
 * Long:   ▔▔╲___________╱▔▔▔▔▔  (>= 2000 ms, reported on release)
 * @endcode
 * Every gesture is followed by a 300 ms cooldown in which the pin is ignored.
 */

#pragma once

#include <stdint.h>

#include "Config.h"
#include "Events.h"
#include "Queue.h"
#include "Status.h"

namespace ClockGate {

/**
 * @struct ButtonConfig
 * @brief Button input and timing configuration
 */
struct ButtonConfig {
  /// @brief Input pin callback (required for ButtonClassifier).
  PinReadFn pinRead = nullptr;

  /// @brief Optional pin mode callback; when set, begin() enables the pull-up.
  PinModeFn pinMode = nullptr;

  /// @brief User context passed to the GPIO callbacks.
  void* gpioUser = nullptr;

  /// @brief Button pin. Active low, pulled up when idle.
  int pin = -1;

  /// @brief Millisecond clock (required for ButtonClassifier).
  MillisFn nowMs = nullptr;

  /// @brief Millisecond sleep (required for ButtonClassifier).
  DelayMsFn delayMs = nullptr;

  /// @brief User context passed to the time callbacks.
  void* timeUser = nullptr;

  /// @brief Pin sampling period while the button is idle (default: 100ms)
  uint32_t idlePollMs = 100;

  /// @brief Pin sampling period while measuring a press (default: 1ms)
  uint32_t pressPollMs = 1;

  /// @brief Presses at least this long are LongPress (default: 2000ms)
  uint32_t longPressMs = 2000;

  /// @brief Window after a short release in which a second press makes a DoublePress (default: 300ms)
  uint32_t doublePressWindowMs = 300;

  /// @brief Dead time after every gesture (default: 300ms)
  uint32_t cooldownMs = 300;
};

/**
 * @brief Validate the timing fields shared by both strategies
 */
Status validateButtonTiming(const ButtonConfig& config);

/**
 * @brief Classify a completed press
 *
 * @param durationMs Duration of the first press
 * @param secondPress true if a second press started inside the double-press window
 * @param longPressMs Long-press threshold
 * @note A zero duration (unreachable with a real pin) classifies as ShortPress.
 */
Gesture classifyPress(uint32_t durationMs, bool secondPress, uint32_t longPressMs);

/**
 * @class ButtonClassifier
 * @brief Blocking gesture reader
 *
 * @par Timing
 * waitForGesture() does not return until a gesture completes. It suspends only
 * through the delayMs callback.
 */
class ButtonClassifier {
 public:
  Status begin(const ButtonConfig& config);

  bool isInitialized() const { return _initialized; }

  /**
   * @brief Block until the next gesture completes, then apply the cooldown
   *
   * @param[out] out Completed gesture
   * @return OK, or the pin read error
   */
  Status waitForGesture(GestureEvent& out);

 private:
  ButtonConfig _config;
  bool _initialized = false;

  Status isPressed(bool& pressed);
  Status measurePress(uint32_t& durationMs);
  Status watchForSecondPress(bool& seen);
  uint32_t now();
  void sleep(uint32_t ms);
};

/**
 * @class GestureTracker
 * @brief Edge-driven, non-blocking gesture state machine
 *
 * Call onEdge() whenever the pin level changes and poll() periodically (at
 * least once per window). Both may complete a gesture.
 */
class GestureTracker {
 public:
  enum class State : uint8_t {
    Idle,
    FirstPress,   ///< First press held
    AwaitSecond,  ///< Released, double-press window open
    SecondPress,  ///< Second press held
    Cooldown      ///< Gesture emitted, pin ignored
  };

  /**
   * @brief Take the thresholds from config (pin and time callbacks are not used)
   */
  Status begin(const ButtonConfig& config);

  /**
   * @brief Feed a pin level change
   *
   * @param pressed New logical level (true = pressed)
   * @param nowMs Timestamp of the edge
   * @param[out] out Gesture completed by this edge
   * @return true if out was written
   */
  bool onEdge(bool pressed, uint32_t nowMs, GestureEvent& out);

  /**
   * @brief Advance timers (double-press window, cooldown)
   *
   * @return true if a gesture completed and out was written
   */
  bool poll(uint32_t nowMs, GestureEvent& out);

  State state() const { return _state; }

  /**
   * @brief Milliseconds until poll() has something to do, or UINT32_MAX when idle
   */
  uint32_t msUntilDeadline(uint32_t nowMs) const;

 private:
  ButtonConfig _config;
  State _state = State::Idle;
  bool _level = false;
  uint32_t _pressStartMs = 0;
  uint32_t _firstDurationMs = 0;
  uint32_t _deadlineMs = 0;

  void emit(Gesture gesture, uint32_t nowMs, GestureEvent& out);
};

/**
 * @struct ButtonEdge
 * @brief Pin level and time captured in the interrupt handler
 */
struct ButtonEdge {
  bool pressed = false;
  uint32_t atMs = 0;
};

/**
 * @class EdgeButtonReader
 * @brief Feeds queued ButtonEdge records to a GestureTracker in order
 *
 * Each edge carries the level and timestamp seen by the interrupt, so a press
 * and release that both happen before the task wakes are still two edges.
 * Before an edge is applied, every window that closed earlier is expired at
 * its own deadline.
 */
class EdgeButtonReader {
 public:
  /**
   * @brief Start the tracker and bind the edge queue
   *
   * @param config Thresholds and nowMs (required)
   * @param edges Queue with itemSize() == sizeof(ButtonEdge)
   */
  Status begin(const ButtonConfig& config, Queue& edges);

  bool isInitialized() const { return _initialized; }

  /**
   * @brief Block until the next gesture completes
   *
   * @param[out] out Completed gesture
   */
  Status waitForGesture(GestureEvent& out);

  GestureTracker::State state() const { return _tracker.state(); }

 private:
  ButtonConfig _config;
  Queue* _edges = nullptr;
  GestureTracker _tracker;
  bool _initialized = false;

  // Edge taken from the queue but not yet applied
  ButtonEdge _pending;
  bool _hasPending = false;

  // Time the tracker has been advanced to
  uint32_t _lastMs = 0;

  bool advanceTo(uint32_t nowMs, GestureEvent& out);
};

}  // namespace ClockGate
