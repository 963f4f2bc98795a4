#include <stdint.h>
#include <unity.h>

#include "ClockGate/ButtonClassifier.h"
#include "support/FakeTime.h"
#include "support/HostQueue.h"

using ClockGate::ButtonClassifier;
using ClockGate::ButtonEdge;
using ClockGate::EdgeButtonReader;
using ClockGate::ButtonConfig;
using ClockGate::Err;
using ClockGate::Gesture;
using ClockGate::GestureEvent;
using ClockGate::GestureTracker;
using ClockGate::Status;

namespace {

sim::FakeTime g_time;

void beginClassifier(ButtonClassifier& button) {
  Status st = button.begin(g_time.makeButtonConfig());
  TEST_ASSERT_TRUE_MESSAGE(st.ok(), st.msg);
}

void beginTracker(GestureTracker& tracker) {
  Status st = tracker.begin(g_time.makeButtonConfig());
  TEST_ASSERT_TRUE_MESSAGE(st.ok(), st.msg);
}

// Records what the pin interrupt would queue
void queueEdge(sim::HostQueue& edges, bool pressed, uint32_t atMs) {
  ButtonEdge edge;
  edge.pressed = pressed;
  edge.atMs = atMs;
  TEST_ASSERT_TRUE(edges.send(&edge, 0).ok());
}

void beginReader(EdgeButtonReader& reader, sim::HostQueue& edges) {
  Status st = reader.begin(g_time.makeButtonConfig(), edges);
  TEST_ASSERT_TRUE_MESSAGE(st.ok(), st.msg);
}

}  // namespace

void setUp() {
  g_time = sim::FakeTime();
}

void tearDown() {}

// ===== Classification rule =====

void test_classify_press_rule() {
  TEST_ASSERT_EQUAL(Gesture::LongPress, ClockGate::classifyPress(2000, false, 2000));
  TEST_ASSERT_EQUAL(Gesture::LongPress, ClockGate::classifyPress(2500, true, 2000));
  TEST_ASSERT_EQUAL(Gesture::DoublePress, ClockGate::classifyPress(150, true, 2000));
  TEST_ASSERT_EQUAL(Gesture::ShortPress, ClockGate::classifyPress(150, false, 2000));
  TEST_ASSERT_EQUAL(Gesture::ShortPress, ClockGate::classifyPress(1999, false, 2000));
  TEST_ASSERT_EQUAL(Gesture::ShortPress, ClockGate::classifyPress(0, true, 2000));
}

void test_timing_validation() {
  ButtonConfig cfg = g_time.makeButtonConfig();
  TEST_ASSERT_TRUE(ClockGate::validateButtonTiming(cfg).ok());
  TEST_ASSERT_EQUAL_UINT32(2000, cfg.longPressMs);
  TEST_ASSERT_EQUAL_UINT32(300, cfg.doublePressWindowMs);
  TEST_ASSERT_EQUAL_UINT32(300, cfg.cooldownMs);

  cfg.doublePressWindowMs = cfg.longPressMs;
  TEST_ASSERT_EQUAL(Err::INVALID_CONFIG, ClockGate::validateButtonTiming(cfg).code);

  cfg = g_time.makeButtonConfig();
  cfg.nowMs = nullptr;
  ButtonClassifier button;
  TEST_ASSERT_EQUAL(Err::INVALID_CONFIG, button.begin(cfg).code);
  TEST_ASSERT_FALSE(button.isInitialized());

  GestureEvent ev;
  TEST_ASSERT_EQUAL(Err::NOT_INITIALIZED, button.waitForGesture(ev).code);
}

// ===== Blocking classifier =====

void test_begin_enables_pullup() {
  ButtonClassifier button;
  beginClassifier(button);
  TEST_ASSERT_TRUE(g_time.pullupEnabled);
}

void test_long_press() {
  g_time.press(0, 2500);
  ButtonClassifier button;
  beginClassifier(button);

  GestureEvent ev;
  TEST_ASSERT_TRUE(button.waitForGesture(ev).ok());
  TEST_ASSERT_EQUAL(Gesture::LongPress, ev.gesture);
  TEST_ASSERT_EQUAL_UINT32(2500, ev.durationMs);
  // Long press skips the double-press window, then cools down
  TEST_ASSERT_EQUAL_UINT32(2500 + 300, g_time.nowMs);
}

void test_short_press_without_second() {
  g_time.press(0, 150);
  ButtonClassifier button;
  beginClassifier(button);

  GestureEvent ev;
  TEST_ASSERT_TRUE(button.waitForGesture(ev).ok());
  TEST_ASSERT_EQUAL(Gesture::ShortPress, ev.gesture);
  TEST_ASSERT_EQUAL_UINT32(150, ev.durationMs);
  TEST_ASSERT_EQUAL_UINT32(150 + 300 + 300, g_time.nowMs);
}

void test_double_press() {
  g_time.press(0, 150);
  g_time.press(250, 100);
  ButtonClassifier button;
  beginClassifier(button);

  GestureEvent ev;
  TEST_ASSERT_TRUE(button.waitForGesture(ev).ok());
  TEST_ASSERT_EQUAL(Gesture::DoublePress, ev.gesture);
  TEST_ASSERT_EQUAL_UINT32(150, ev.durationMs);
  // Returns after the second release plus cooldown
  TEST_ASSERT_EQUAL_UINT32(350 + 300, g_time.nowMs);
}

void test_press_during_cooldown_is_ignored() {
  g_time.press(0, 150);
  g_time.press(500, 100);   // after the window, inside the cooldown
  g_time.press(1000, 2200);
  ButtonClassifier button;
  beginClassifier(button);

  GestureEvent ev;
  TEST_ASSERT_TRUE(button.waitForGesture(ev).ok());
  TEST_ASSERT_EQUAL(Gesture::ShortPress, ev.gesture);

  TEST_ASSERT_TRUE(button.waitForGesture(ev).ok());
  TEST_ASSERT_EQUAL(Gesture::LongPress, ev.gesture);
  TEST_ASSERT_TRUE(ev.durationMs >= 2000);
}

void test_idle_polling_period() {
  g_time.press(1000, 150);
  ButtonClassifier button;
  beginClassifier(button);

  GestureEvent ev;
  TEST_ASSERT_TRUE(button.waitForGesture(ev).ok());
  TEST_ASSERT_EQUAL(Gesture::ShortPress, ev.gesture);
  // 10 idle samples before the press, then 1 ms sampling
  TEST_ASSERT_TRUE(g_time.pinReads < 11 + 151 + 301 + 5);
}

// ===== Edge-driven tracker =====

void test_tracker_long_press() {
  GestureTracker tracker;
  beginTracker(tracker);

  GestureEvent ev;
  TEST_ASSERT_FALSE(tracker.onEdge(true, 1000, ev));
  TEST_ASSERT_EQUAL(GestureTracker::State::FirstPress, tracker.state());
  TEST_ASSERT_EQUAL_UINT32(UINT32_MAX, tracker.msUntilDeadline(1500));
  TEST_ASSERT_TRUE(tracker.onEdge(false, 3500, ev));
  TEST_ASSERT_EQUAL(Gesture::LongPress, ev.gesture);
  TEST_ASSERT_EQUAL_UINT32(2500, ev.durationMs);
  TEST_ASSERT_EQUAL(GestureTracker::State::Cooldown, tracker.state());

  TEST_ASSERT_FALSE(tracker.poll(3800, ev));
  TEST_ASSERT_EQUAL(GestureTracker::State::Idle, tracker.state());
}

void test_tracker_short_press_after_window() {
  GestureTracker tracker;
  beginTracker(tracker);

  GestureEvent ev;
  tracker.onEdge(true, 0, ev);
  TEST_ASSERT_FALSE(tracker.onEdge(false, 150, ev));
  TEST_ASSERT_EQUAL(GestureTracker::State::AwaitSecond, tracker.state());
  TEST_ASSERT_EQUAL_UINT32(300, tracker.msUntilDeadline(150));

  TEST_ASSERT_FALSE(tracker.poll(449, ev));
  TEST_ASSERT_TRUE(tracker.poll(450, ev));
  TEST_ASSERT_EQUAL(Gesture::ShortPress, ev.gesture);
  TEST_ASSERT_EQUAL_UINT32(150, ev.durationMs);
}

void test_tracker_double_press() {
  GestureTracker tracker;
  beginTracker(tracker);

  GestureEvent ev;
  tracker.onEdge(true, 0, ev);
  tracker.onEdge(false, 150, ev);
  TEST_ASSERT_FALSE(tracker.onEdge(true, 300, ev));
  TEST_ASSERT_EQUAL(GestureTracker::State::SecondPress, tracker.state());
  TEST_ASSERT_FALSE(tracker.poll(460, ev));  // window no longer matters
  TEST_ASSERT_TRUE(tracker.onEdge(false, 480, ev));
  TEST_ASSERT_EQUAL(Gesture::DoublePress, ev.gesture);
}

void test_tracker_late_press_closes_window() {
  GestureTracker tracker;
  beginTracker(tracker);

  GestureEvent ev;
  tracker.onEdge(true, 0, ev);
  tracker.onEdge(false, 150, ev);
  // No poll in time: the late press reports the pending short press
  TEST_ASSERT_TRUE(tracker.onEdge(true, 500, ev));
  TEST_ASSERT_EQUAL(Gesture::ShortPress, ev.gesture);

  // Still held when the cooldown ends: counted as a fresh press from there
  TEST_ASSERT_FALSE(tracker.poll(800, ev));
  TEST_ASSERT_EQUAL(GestureTracker::State::FirstPress, tracker.state());
  TEST_ASSERT_FALSE(tracker.onEdge(false, 900, ev));
  TEST_ASSERT_TRUE(tracker.poll(1200, ev));
  TEST_ASSERT_EQUAL(Gesture::ShortPress, ev.gesture);
  TEST_ASSERT_EQUAL_UINT32(100, ev.durationMs);
}

void test_tracker_ignores_bounce_and_cooldown() {
  GestureTracker tracker;
  beginTracker(tracker);

  GestureEvent ev;
  tracker.onEdge(true, 0, ev);
  TEST_ASSERT_FALSE(tracker.onEdge(true, 5, ev));  // repeated level
  TEST_ASSERT_TRUE(tracker.onEdge(false, 2100, ev));
  TEST_ASSERT_EQUAL(Gesture::LongPress, ev.gesture);

  TEST_ASSERT_FALSE(tracker.onEdge(true, 2200, ev));
  TEST_ASSERT_FALSE(tracker.onEdge(false, 2250, ev));
  TEST_ASSERT_EQUAL(GestureTracker::State::Cooldown, tracker.state());
  TEST_ASSERT_EQUAL_UINT32(150, tracker.msUntilDeadline(2250));

  TEST_ASSERT_FALSE(tracker.poll(2400, ev));
  TEST_ASSERT_EQUAL(GestureTracker::State::Idle, tracker.state());
}

// ===== Edge queue reader =====

void test_reader_rejects_mismatched_queue() {
  EdgeButtonReader reader;
  sim::HostQueue wrong(4, sizeof(uint8_t));
  TEST_ASSERT_EQUAL(Err::INVALID_CONFIG, reader.begin(g_time.makeButtonConfig(), wrong).code);

  ButtonConfig noClock = g_time.makeButtonConfig();
  noClock.nowMs = nullptr;
  sim::HostQueue edges(4, sizeof(ButtonEdge));
  TEST_ASSERT_EQUAL(Err::INVALID_CONFIG, reader.begin(noClock, edges).code);

  GestureEvent ev;
  TEST_ASSERT_EQUAL(Err::NOT_INITIALIZED, reader.waitForGesture(ev).code);
}

void test_reader_keeps_press_released_before_wake() {
  sim::HostQueue edges(8, sizeof(ButtonEdge));
  EdgeButtonReader reader;
  beginReader(reader, edges);

  // Press and release both land before the task runs; the pin reads idle by then
  queueEdge(edges, true, 0);
  queueEdge(edges, false, 150);
  g_time.nowMs = 1000;

  GestureEvent ev;
  TEST_ASSERT_TRUE(reader.waitForGesture(ev).ok());
  TEST_ASSERT_EQUAL(Gesture::ShortPress, ev.gesture);
  TEST_ASSERT_EQUAL_UINT32(150, ev.durationMs);
  TEST_ASSERT_EQUAL_UINT32(0, edges.pending());
}

void test_reader_double_press_from_queued_edges() {
  sim::HostQueue edges(8, sizeof(ButtonEdge));
  EdgeButtonReader reader;
  beginReader(reader, edges);

  queueEdge(edges, true, 0);
  queueEdge(edges, false, 150);
  queueEdge(edges, true, 300);
  queueEdge(edges, false, 400);
  g_time.nowMs = 2000;

  GestureEvent ev;
  TEST_ASSERT_TRUE(reader.waitForGesture(ev).ok());
  TEST_ASSERT_EQUAL(Gesture::DoublePress, ev.gesture);
  TEST_ASSERT_EQUAL_UINT32(150, ev.durationMs);
}

void test_reader_expires_window_at_its_deadline() {
  sim::HostQueue edges(8, sizeof(ButtonEdge));
  EdgeButtonReader reader;
  beginReader(reader, edges);

  // Second press starts after the 450 ms window closed
  queueEdge(edges, true, 0);
  queueEdge(edges, false, 150);
  queueEdge(edges, true, 500);
  queueEdge(edges, false, 900);
  g_time.nowMs = 3000;

  GestureEvent ev;
  TEST_ASSERT_TRUE(reader.waitForGesture(ev).ok());
  TEST_ASSERT_EQUAL(Gesture::ShortPress, ev.gesture);
  TEST_ASSERT_EQUAL_UINT32(150, ev.durationMs);
  TEST_ASSERT_EQUAL(GestureTracker::State::Cooldown, reader.state());

  // Cooldown ran 450..750 with the button held, so the press counts from 750
  TEST_ASSERT_TRUE(reader.waitForGesture(ev).ok());
  TEST_ASSERT_EQUAL(Gesture::ShortPress, ev.gesture);
  TEST_ASSERT_EQUAL_UINT32(150, ev.durationMs);
  TEST_ASSERT_EQUAL_UINT32(0, edges.pending());
}

void test_reader_long_press_and_bounce() {
  sim::HostQueue edges(8, sizeof(ButtonEdge));
  EdgeButtonReader reader;
  beginReader(reader, edges);

  queueEdge(edges, true, 100);
  queueEdge(edges, true, 102);  // bounce reported as a repeated level
  queueEdge(edges, false, 2600);
  g_time.nowMs = 2600;

  GestureEvent ev;
  TEST_ASSERT_TRUE(reader.waitForGesture(ev).ok());
  TEST_ASSERT_EQUAL(Gesture::LongPress, ev.gesture);
  TEST_ASSERT_EQUAL_UINT32(2500, ev.durationMs);
}

int main(int, char**) {
  UNITY_BEGIN();
  RUN_TEST(test_classify_press_rule);
  RUN_TEST(test_timing_validation);
  RUN_TEST(test_begin_enables_pullup);
  RUN_TEST(test_long_press);
  RUN_TEST(test_short_press_without_second);
  RUN_TEST(test_double_press);
  RUN_TEST(test_press_during_cooldown_is_ignored);
  RUN_TEST(test_idle_polling_period);
  RUN_TEST(test_tracker_long_press);
  RUN_TEST(test_tracker_short_press_after_window);
  RUN_TEST(test_tracker_double_press);
  RUN_TEST(test_tracker_late_press_closes_window);
  RUN_TEST(test_tracker_ignores_bounce_and_cooldown);
  RUN_TEST(test_reader_rejects_mismatched_queue);
  RUN_TEST(test_reader_keeps_press_released_before_wake);
  RUN_TEST(test_reader_double_press_from_queued_edges);
  RUN_TEST(test_reader_expires_window_at_its_deadline);
  RUN_TEST(test_reader_long_press_and_bounce);
  return UNITY_END();
}
