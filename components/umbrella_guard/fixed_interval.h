#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include "presence_types.h"

namespace esphome {
namespace umbrella_guard {

// Runs `f` every `interval_ms` as a chain of one-shot timeouts under `name`.
// The first run is one full interval from now. `timers.cancel_task(name)`
// stops the chain, including from inside `f`. Re-scheduling `name` restarts it.
void schedule_fixed_interval(TimerService& timers, const std::string& name, uint32_t interval_ms,
                             std::function<void()>&& f);

}  // namespace umbrella_guard
}  // namespace esphome
