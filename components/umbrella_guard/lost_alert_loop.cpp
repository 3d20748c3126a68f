#include "lost_alert_loop.h"

namespace esphome {
namespace umbrella_guard {

static constexpr char FIRST_ALERT_BODY[] = "Umbrella disconnected! You left it behind.";
static constexpr char REPEAT_ALERT_BODY[] = "Umbrella still missing";

void LostAlertLoop::emit_(const char* body) {
  Alert alert;
  alert.title = title_;
  alert.body = body;
  alert.urgency = AlertUrgency::HIGH;
  sink_.show_alert(alert);
  alerts_emitted_++;
}

void LostAlertLoop::arm() {
  if (armed_) return;
  armed_ = true;
  alerts_emitted_ = 0;

  emit_(FIRST_ALERT_BODY);
  timers_.schedule_interval(TASK_NAME, interval_ms_, [this]() {
    // A tick that slipped past cancel_task() must not re-raise the alert
    if (!armed_) return;
    emit_(REPEAT_ALERT_BODY);
  });
}

void LostAlertLoop::disarm() {
  if (!armed_) return;
  armed_ = false;
  timers_.cancel_task(TASK_NAME);
  sink_.cancel_all_alerts();
}

}  // namespace umbrella_guard
}  // namespace esphome
