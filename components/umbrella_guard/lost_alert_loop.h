#pragma once

#include <string>

#include "presence_types.h"

namespace esphome {
namespace umbrella_guard {

// Repeating "umbrella missing" alert while the controller is LOST.
// Single instance: arm() while armed and disarm() while disarmed are no-ops.
class LostAlertLoop {
 public:
  static constexpr const char* TASK_NAME = "lost_alert";

  LostAlertLoop(TimerService& timers, AlertSink& sink) : timers_(timers), sink_(sink) {}

  void set_interval_ms(uint32_t interval_ms) {
    interval_ms_ = interval_ms;
  }
  void set_title(const std::string& title) {
    title_ = title;
  }

  void arm();
  void disarm();
  bool is_armed() const {
    return armed_;
  }
  uint32_t get_alerts_emitted() const {
    return alerts_emitted_;
  }

 protected:
  void emit_(const char* body);

  TimerService& timers_;
  AlertSink& sink_;
  std::string title_ { "SmartShield Alert" };
  uint32_t interval_ms_ { 3000 };
  bool armed_ { false };
  uint32_t alerts_emitted_ { 0 };  // since the last arm()
};

}  // namespace umbrella_guard
}  // namespace esphome
