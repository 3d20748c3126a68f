#include "reconnect_loop.h"

namespace esphome {
namespace umbrella_guard {

void ReconnectLoop::arm() {
  if (armed_) return;
  armed_ = true;
  timers_.schedule_interval(TASK_NAME, interval_ms_, [this]() {
    if (!armed_) return;
    on_tick_();
  });
}

void ReconnectLoop::disarm() {
  if (!armed_) return;
  armed_ = false;
  timers_.cancel_task(TASK_NAME);
}

}  // namespace umbrella_guard
}  // namespace esphome
