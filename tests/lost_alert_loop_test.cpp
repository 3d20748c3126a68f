#include <gtest/gtest.h>

#include "fakes.h"
#include "lost_alert_loop.h"

namespace esphome {
namespace umbrella_guard {
namespace {

using testing::FakeAlertSink;
using testing::FakeTimerService;

TEST(LostAlertLoopTest, ArmEmitsImmediatelyThenEveryInterval) {
  FakeTimerService timers;
  FakeAlertSink sink;
  LostAlertLoop loop(timers, sink);

  loop.arm();
  ASSERT_EQ(sink.shown.size(), 1u);
  EXPECT_EQ(sink.shown[0].title, "SmartShield Alert");
  EXPECT_EQ(sink.shown[0].body, "Umbrella disconnected! You left it behind.");
  EXPECT_EQ(sink.shown[0].urgency, AlertUrgency::HIGH);

  timers.advance(2999);
  EXPECT_EQ(sink.shown.size(), 1u);
  timers.advance(1);
  ASSERT_EQ(sink.shown.size(), 2u);
  EXPECT_EQ(sink.shown[1].body, "Umbrella still missing");

  timers.advance(9000);
  EXPECT_EQ(sink.shown.size(), 5u);
  EXPECT_EQ(loop.get_alerts_emitted(), 5u);
}

TEST(LostAlertLoopTest, ArmTwiceIsSingleInstance) {
  FakeTimerService timers;
  FakeAlertSink sink;
  LostAlertLoop loop(timers, sink);

  loop.arm();
  timers.advance(1500);
  loop.arm();
  EXPECT_EQ(sink.shown.size(), 1u);
  EXPECT_EQ(timers.pending_count(), 1u);

  // Still on the original cadence
  timers.advance(1500);
  EXPECT_EQ(sink.shown.size(), 2u);
}

TEST(LostAlertLoopTest, DisarmCancelsTimerAndWithdrawsAlerts) {
  FakeTimerService timers;
  FakeAlertSink sink;
  LostAlertLoop loop(timers, sink);

  loop.arm();
  loop.disarm();
  EXPECT_FALSE(loop.is_armed());
  EXPECT_FALSE(timers.is_pending(LostAlertLoop::TASK_NAME));
  EXPECT_EQ(sink.cancel_calls, 1);

  timers.advance(10000);
  EXPECT_EQ(sink.shown.size(), 1u);

  loop.disarm();
  EXPECT_EQ(sink.cancel_calls, 1);
}

TEST(LostAlertLoopTest, RearmStartsAFreshCycle) {
  FakeTimerService timers;
  FakeAlertSink sink;
  LostAlertLoop loop(timers, sink);
  loop.set_interval_ms(1000);
  loop.set_title("Umbrella");

  loop.arm();
  timers.advance(2000);
  loop.disarm();
  loop.arm();

  ASSERT_EQ(sink.shown.size(), 4u);
  EXPECT_EQ(sink.shown[3].body, "Umbrella disconnected! You left it behind.");
  EXPECT_EQ(sink.shown[3].title, "Umbrella");
  EXPECT_EQ(loop.get_alerts_emitted(), 1u);
}

}  // namespace
}  // namespace umbrella_guard
}  // namespace esphome
