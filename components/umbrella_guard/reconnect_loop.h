#pragma once

#include <functional>
#include <utility>

#include "presence_types.h"

namespace esphome {
namespace umbrella_guard {

// Periodic silent reconnect attempt while the controller is LOST. The loop
// only owns the timer; each tick calls back into the controller, which decides
// whether a scan session is launched.
class ReconnectLoop {
 public:
  static constexpr const char* TASK_NAME = "reconnect";

  ReconnectLoop(TimerService& timers, std::function<void()>&& on_tick)
      : timers_(timers), on_tick_(std::move(on_tick)) {}

  void set_interval_ms(uint32_t interval_ms) {
    interval_ms_ = interval_ms;
  }

  void arm();
  void disarm();
  bool is_armed() const {
    return armed_;
  }

 protected:
  TimerService& timers_;
  std::function<void()> on_tick_;
  uint32_t interval_ms_ { 3000 };
  bool armed_ { false };
};

}  // namespace umbrella_guard
}  // namespace esphome
