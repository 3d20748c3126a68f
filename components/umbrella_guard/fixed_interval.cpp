#include "fixed_interval.h"

#include <memory>
#include <utility>

namespace esphome {
namespace umbrella_guard {

namespace {

void arm_next(TimerService& timers, const std::string& name, uint32_t interval_ms,
              const std::shared_ptr<std::function<void()>>& task) {
  timers.schedule_timeout(name, interval_ms, [&timers, name, interval_ms, task]() {
    // Re-armed before the run so that the task can cancel itself
    arm_next(timers, name, interval_ms, task);
    (*task)();
  });
}

}  // namespace

void schedule_fixed_interval(TimerService& timers, const std::string& name, uint32_t interval_ms,
                             std::function<void()>&& f) {
  arm_next(timers, name, interval_ms, std::make_shared<std::function<void()>>(std::move(f)));
}

}  // namespace umbrella_guard
}  // namespace esphome
