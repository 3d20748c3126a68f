#include <gtest/gtest.h>

#include "fakes.h"
#include "reconnect_loop.h"

namespace esphome {
namespace umbrella_guard {
namespace {

using testing::FakeTimerService;

TEST(ReconnectLoopTest, TicksAtFixedIntervalUntilDisarmed) {
  FakeTimerService timers;
  int ticks = 0;
  ReconnectLoop loop(timers, [&ticks]() { ticks++; });

  loop.arm();
  EXPECT_EQ(ticks, 0);
  timers.advance(3000);
  EXPECT_EQ(ticks, 1);
  timers.advance(6000);
  EXPECT_EQ(ticks, 3);

  loop.disarm();
  EXPECT_FALSE(timers.is_pending(ReconnectLoop::TASK_NAME));
  timers.advance(9000);
  EXPECT_EQ(ticks, 3);
}

TEST(ReconnectLoopTest, ArmAndDisarmAreIdempotent) {
  FakeTimerService timers;
  int ticks = 0;
  ReconnectLoop loop(timers, [&ticks]() { ticks++; });
  loop.set_interval_ms(1000);

  loop.arm();
  timers.advance(500);
  loop.arm();
  timers.advance(500);
  EXPECT_EQ(ticks, 1);

  loop.disarm();
  loop.disarm();
  EXPECT_FALSE(loop.is_armed());
  EXPECT_EQ(timers.pending_count(), 0u);
}

TEST(ReconnectLoopTest, TickAfterDisarmInsideCallbackIsSkipped) {
  FakeTimerService timers;
  int ticks = 0;
  ReconnectLoop* self = nullptr;
  ReconnectLoop loop(timers, [&]() {
    ticks++;
    self->disarm();
  });
  self = &loop;

  loop.arm();
  timers.advance(10000);
  EXPECT_EQ(ticks, 1);
  EXPECT_FALSE(loop.is_armed());
  EXPECT_EQ(timers.pending_count(), 0u);
}

}  // namespace
}  // namespace umbrella_guard
}  // namespace esphome
