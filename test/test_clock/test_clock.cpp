#include <stddef.h>
#include <stdint.h>
#include <unity.h>

#include "ClockGate/CommandTable.h"
#include "ClockGate/RtcClock.h"
#include "support/SimulatedDs1302.h"

using ClockGate::ClockField;
using ClockGate::ClockFields;
using ClockGate::Err;
using ClockGate::RtcClock;
using ClockGate::RtcOp;
using ClockGate::RtcRequest;
using ClockGate::Status;

namespace {

sim::SimulatedDs1302 g_chip;

void beginClock(RtcClock& clock) {
  Status st = clock.begin(g_chip.makeConfig());
  TEST_ASSERT_TRUE_MESSAGE(st.ok(), st.msg);
  g_chip.transactions.clear();
}

}  // namespace

void setUp() {
  g_chip.reset();
}

void tearDown() {}

void test_next_value_wraps() {
  TEST_ASSERT_EQUAL_UINT8(0, RtcClock::nextValue(ClockField::Seconds, 59));
  TEST_ASSERT_EQUAL_UINT8(0, RtcClock::nextValue(ClockField::Minutes, 59));
  TEST_ASSERT_EQUAL_UINT8(0, RtcClock::nextValue(ClockField::Hours, 23));
  TEST_ASSERT_EQUAL_UINT8(24, RtcClock::nextValue(ClockField::Minutes, 23));
  TEST_ASSERT_EQUAL_UINT8(12, RtcClock::nextValue(ClockField::Hours, 11));
}

void test_read_refreshes_cache() {
  RtcClock clock;
  beginClock(clock);
  g_chip.setClock(10, 13, 0);

  ClockFields t;
  TEST_ASSERT_TRUE(clock.read(t).ok());
  TEST_ASSERT_EQUAL_UINT8(10, clock.cached().hour);
  TEST_ASSERT_EQUAL_UINT8(13, clock.cached().minute);
  TEST_ASSERT_EQUAL_UINT8(0, clock.cached().second);
}

void test_increment_is_read_then_write() {
  RtcClock clock;
  beginClock(clock);
  g_chip.setClock(8, 20, 30);

  ClockFields t;
  TEST_ASSERT_TRUE(clock.incrementField(ClockField::Minutes, t).ok());
  TEST_ASSERT_EQUAL_UINT8(8, t.hour);
  TEST_ASSERT_EQUAL_UINT8(21, t.minute);
  TEST_ASSERT_EQUAL_UINT8(30, t.second);
  TEST_ASSERT_EQUAL_UINT8(21, g_chip.minute());
  TEST_ASSERT_EQUAL_UINT8(21, clock.cached().minute);

  TEST_ASSERT_EQUAL_UINT32(2, g_chip.transactions.size());
  TEST_ASSERT_EQUAL_HEX8(ClockGate::cmd::BURST_READ, g_chip.transactions[0].command);
  TEST_ASSERT_EQUAL_HEX8(ClockGate::cmd::WRITE_MINUTES, g_chip.transactions[1].command);
}

void test_increment_wraps_every_field() {
  RtcClock clock;
  beginClock(clock);
  g_chip.setClock(23, 59, 59);

  ClockFields t;
  TEST_ASSERT_TRUE(clock.incrementField(ClockField::Seconds, t).ok());
  TEST_ASSERT_EQUAL_UINT8(0, g_chip.second());
  TEST_ASSERT_TRUE(clock.incrementField(ClockField::Minutes, t).ok());
  TEST_ASSERT_EQUAL_UINT8(0, g_chip.minute());
  TEST_ASSERT_TRUE(clock.incrementField(ClockField::Hours, t).ok());
  TEST_ASSERT_EQUAL_UINT8(0, g_chip.hour());

  // No carry into neighbouring fields
  TEST_ASSERT_EQUAL_UINT8(0, t.hour);
  TEST_ASSERT_EQUAL_UINT8(0, t.minute);
  TEST_ASSERT_EQUAL_UINT8(0, t.second);
}

void test_increment_abandoned_on_corrupt_read() {
  RtcClock clock;
  beginClock(clock);
  g_chip.regs[sim::SimulatedDs1302::REG_MINUTES] = 0x6F;

  ClockFields t;
  TEST_ASSERT_EQUAL(Err::INVALID_TIME, clock.incrementField(ClockField::Minutes, t).code);
  TEST_ASSERT_EQUAL_UINT32(1, g_chip.transactions.size());  // no write issued
}

void test_execute_dispatches_requests() {
  RtcClock clock;
  beginClock(clock);

  RtcRequest set;
  set.op = RtcOp::SetTime;
  set.time.hour = 12;
  set.time.minute = 34;
  set.time.second = 56;
  ClockFields out;
  TEST_ASSERT_TRUE(clock.execute(set, out).ok());
  TEST_ASSERT_EQUAL_UINT8(34, out.minute);

  RtcRequest inc;
  inc.op = RtcOp::Increment;
  inc.field = ClockField::Hours;
  TEST_ASSERT_TRUE(clock.execute(inc, out).ok());
  TEST_ASSERT_EQUAL_UINT8(13, out.hour);

  RtcRequest read;
  TEST_ASSERT_TRUE(clock.execute(read, out).ok());
  TEST_ASSERT_EQUAL_UINT8(13, out.hour);
  TEST_ASSERT_EQUAL_UINT8(34, out.minute);
  TEST_ASSERT_EQUAL_UINT8(56, out.second);
}

void test_calls_before_begin_fail() {
  RtcClock clock;
  ClockFields t;
  TEST_ASSERT_EQUAL(Err::NOT_INITIALIZED, clock.read(t).code);
  TEST_ASSERT_EQUAL(Err::NOT_INITIALIZED, clock.incrementField(ClockField::Hours, t).code);
}

int main(int, char**) {
  UNITY_BEGIN();
  RUN_TEST(test_next_value_wraps);
  RUN_TEST(test_read_refreshes_cache);
  RUN_TEST(test_increment_is_read_then_write);
  RUN_TEST(test_increment_wraps_every_field);
  RUN_TEST(test_increment_abandoned_on_corrupt_read);
  RUN_TEST(test_execute_dispatches_requests);
  RUN_TEST(test_calls_before_begin_fail);
  return UNITY_END();
}
