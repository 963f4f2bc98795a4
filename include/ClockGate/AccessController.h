/**
 * @file AccessController.h
 * @brief Setup-mode and access-mode state machine driven by ticks, gestures and samples
 *
 * Transition table (gesture rules, applied in arrival order):
 *
 * | State                          | Gesture     | Next                       | Side effect            |
 * |--------------------------------|-------------|----------------------------|------------------------|
 * | Setup Idle                     | LongPress   | Hours                      | enter setup            |
 * | Setup Hours/Minutes/Seconds    | LongPress   | Minutes/Seconds/Idle       | advance or exit setup  |
 * | Setup not Idle                 | ShortPress  | unchanged                  | increment that field   |
 * | Setup Idle                     | ShortPress  | unchanged                  | sensor cursor + 1 mod 4|
 * | Locked, eligible               | DoublePress | FullAccess                 |                        |
 * | FullAccess                     | DoublePress | Locked                     |                        |
 * | Locked, not eligible           | DoublePress | unchanged                  | reported as denied     |
 *
 * Eligibility is true while the latest ticked minute is odd.
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#include "Ds1302.h"
#include "Events.h"
#include "Status.h"

namespace ClockGate {

/**
 * @enum SetupMode
 * @brief Clock-setting mode. Cycles Idle -> Hours -> Minutes -> Seconds -> Idle.
 */
enum class SetupMode : uint8_t {
  Idle = 0,
  Hours = 1,
  Minutes = 2,
  Seconds = 3
};

/**
 * @enum AccessMode
 * @brief Access-control state
 */
enum class AccessMode : uint8_t {
  Locked = 0,
  FullAccess = 1
};

/**
 * @enum Outcome
 * @brief What a gesture did. AccessDenied is a normal outcome, not an error.
 */
enum class Outcome : uint8_t {
  SetupEntered,
  SetupAdvanced,
  SetupExited,
  FieldIncremented,
  CursorAdvanced,
  AccessGranted,
  AccessRevoked,
  AccessDenied
};

/**
 * @struct IndicatorState
 * @brief Indicator LEDs, active high
 *
 * FullAccess lights only `access`; Locked lights `locked`, plus `eligible`
 * while the eligibility predicate holds.
 */
struct IndicatorState {
  bool access = false;
  bool eligible = false;
  bool locked = false;

  uint8_t litCount() const {
    return static_cast<uint8_t>((access ? 1 : 0) + (eligible ? 1 : 0) + (locked ? 1 : 0));
  }
};

/**
 * @enum DisplayKind
 * @brief What the display is showing
 */
enum class DisplayKind : uint8_t {
  SetupField,   ///< Field selected for setting
  Sample,       ///< A cached sensor sample
  Unavailable   ///< Sample kind selected but nothing cached yet
};

/**
 * @struct DisplayContent
 * @brief Display selection. field is valid for SetupField, sampleKind otherwise.
 */
struct DisplayContent {
  DisplayKind kind = DisplayKind::Unavailable;
  ClockField field = ClockField::Hours;
  SampleKind sampleKind = SampleKind::Temperature;
  SensorSample sample;
};

/// @brief Advance one clock field on the RTC and return the new time.
using IncrementFieldFn = Status (*)(ClockField field, ClockFields& out, void* user);

/**
 * @struct AccessConfig
 * @brief Link back to the clock resource
 */
struct AccessConfig {
  /// @brief Clock increment callback (required).
  IncrementFieldFn incrementField = nullptr;

  /// @brief User context passed to incrementField (e.g., RtcService*).
  void* clockUser = nullptr;
};

/// @brief Buffer size that fits every formatDisplay() result
static constexpr size_t kDisplayTextSize = 24;

/**
 * @class AccessController
 * @brief Single-consumer state machine. Not thread-safe; owned by the aggregator.
 */
class AccessController {
 public:
  Status begin(const AccessConfig& config);

  bool isInitialized() const { return _initialized; }

  // ===== Inputs =====

  /**
   * @brief Record a time snapshot and recompute eligibility (odd minute)
   */
  void onTick(const TickEvent& tick);

  /**
   * @brief Apply one gesture
   *
   * @param gesture Gesture to apply
   * @param[out] outcome What happened (valid when OK is returned)
   * @return OK, or the error from the clock increment (state unchanged)
   */
  Status onGesture(const GestureEvent& gesture, Outcome& outcome);

  /**
   * @brief Store a sample in its kind's slot (latest wins)
   */
  void onSample(const SensorSample& sample);

  // ===== State =====

  SetupMode setupMode() const { return _setup; }
  AccessMode accessMode() const { return _access; }
  bool isEligible() const { return _eligible; }
  SampleKind cursor() const { return static_cast<SampleKind>(_cursor); }

  /// @brief true once a tick or an increment has reported the time
  bool hasTime() const { return _hasTime; }

  /// @brief Latest known clock time. Eligibility only follows ticks.
  const ClockFields& lastTime() const { return _lastTime; }

  /**
   * @brief Fetch the cached sample of a kind
   * @return false if none received yet
   */
  bool cachedSample(SampleKind kind, SensorSample& out) const;

  // ===== Outputs =====

  IndicatorState indicators() const;

  /**
   * @brief Current display selection
   *
   * Setup mode shows the selected field; FullAccess shows the sample under the
   * cursor; Locked always shows temperature.
   */
  DisplayContent display() const;

  /**
   * @brief Render a display selection as text
   *
   * @return Characters written, excluding the terminator
   */
  static size_t formatDisplay(const DisplayContent& content, char* buf, size_t len);

  // ===== Static Helpers =====

  static SetupMode nextSetupMode(SetupMode mode);

  /// @brief Field edited in a setup mode (Idle maps to Hours, never used)
  static ClockField fieldForSetup(SetupMode mode);

 private:
  AccessConfig _config;
  bool _initialized = false;

  SetupMode _setup = SetupMode::Idle;
  AccessMode _access = AccessMode::Locked;
  bool _eligible = false;
  uint8_t _cursor = 0;

  bool _hasTime = false;
  ClockFields _lastTime;

  SensorSample _samples[kSampleKindCount];
  bool _hasSample[kSampleKindCount] = {false, false, false, false};

  Outcome onLongPress();
  Status onShortPress(Outcome& outcome);
  Outcome onDoublePress();
};

inline const char* setupModeToStr(SetupMode mode) {
  switch (mode) {
    case SetupMode::Idle:    return "IDLE";
    case SetupMode::Hours:   return "HOURS";
    case SetupMode::Minutes: return "MINUTES";
    case SetupMode::Seconds: return "SECONDS";
  }
  return "UNKNOWN";
}

inline const char* accessModeToStr(AccessMode mode) {
  switch (mode) {
    case AccessMode::Locked:     return "LOCKED";
    case AccessMode::FullAccess: return "FULL_ACCESS";
  }
  return "UNKNOWN";
}

inline const char* outcomeToStr(Outcome outcome) {
  switch (outcome) {
    case Outcome::SetupEntered:     return "setup entered";
    case Outcome::SetupAdvanced:    return "setup advanced";
    case Outcome::SetupExited:      return "setup exited";
    case Outcome::FieldIncremented: return "field incremented";
    case Outcome::CursorAdvanced:   return "cursor advanced";
    case Outcome::AccessGranted:    return "access granted";
    case Outcome::AccessRevoked:    return "access revoked";
    case Outcome::AccessDenied:     return "access denied (even minute)";
  }
  return "unknown";
}

}  // namespace ClockGate
