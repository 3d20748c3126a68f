#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "presence_types.h"

namespace esphome {
namespace umbrella_guard {
namespace testing {

// Virtual-clock scheduler. Tasks due at the same instant run in the order they
// were scheduled.
class FakeTimerService : public TimerService {
 public:
  void schedule_interval(const std::string& name, uint32_t interval_ms,
                         std::function<void()>&& f) override {
    tasks_[name] = Task { now_ + interval_ms, interval_ms, std::move(f), ++serial_ };
  }
  void schedule_timeout(const std::string& name, uint32_t delay_ms,
                        std::function<void()>&& f) override {
    tasks_[name] = Task { now_ + delay_ms, 0, std::move(f), ++serial_ };
  }
  bool cancel_task(const std::string& name) override {
    return tasks_.erase(name) > 0;
  }

  bool is_pending(const std::string& name) const {
    return tasks_.count(name) > 0;
  }
  size_t pending_count() const {
    return tasks_.size();
  }
  uint64_t now() const {
    return now_;
  }

  void advance(uint32_t ms) {
    const uint64_t target = now_ + ms;
    while (true) {
      auto next = tasks_.end();
      for (auto it = tasks_.begin(); it != tasks_.end(); ++it) {
        if (it->second.due > target) continue;
        if (next == tasks_.end() || it->second.due < next->second.due ||
            (it->second.due == next->second.due && it->second.serial < next->second.serial)) {
          next = it;
        }
      }
      if (next == tasks_.end()) break;

      now_ = next->second.due;
      std::function<void()> fn = next->second.fn;
      if (next->second.interval_ms == 0) {
        tasks_.erase(next);
      } else {
        next->second.due += next->second.interval_ms;
      }
      fn();
    }
    now_ = target;
  }

 private:
  struct Task {
    uint64_t due;
    uint32_t interval_ms;
    std::function<void()> fn;
    uint64_t serial;
  };

  std::map<std::string, Task> tasks_;
  uint64_t now_ { 0 };
  uint64_t serial_ { 0 };
};

class FakeRadio : public Radio {
 public:
  void set_listener(RadioListener* listener) override {
    listener_ = listener;
  }
  bool start_scan(uint32_t duration_ms) override {
    scan_durations.push_back(duration_ms);
    if (!scan_ok) return false;
    scanning = true;
    return true;
  }
  void stop_scan() override {
    stop_scan_calls++;
    scanning = false;
  }
  bool connect(const std::string& id, uint32_t timeout_ms) override {
    connect_requests.push_back(id);
    last_connect_timeout_ms = timeout_ms;
    return connect_ok;
  }
  void cancel_connect() override {
    cancel_connect_calls++;
  }
  void disconnect(const std::string& id) override {
    disconnects.push_back(id);
  }

  void advertise(const std::string& id, const std::string& name, int8_t rssi) {
    Sighting s;
    s.id = id;
    s.advertised_name = name;
    s.rssi = rssi;
    if (listener_ != nullptr) listener_->on_sighting(s);
  }
  void complete_connect(const std::string& id, bool success, int status = 0) {
    if (listener_ != nullptr) listener_->on_connect_result(id, success, status);
  }
  void drop_link(const std::string& id) {
    if (listener_ != nullptr) listener_->on_link_state(id, LinkState::DISCONNECTED);
  }

  bool scan_ok { true };
  bool connect_ok { true };
  bool scanning { false };
  int stop_scan_calls { 0 };
  int cancel_connect_calls { 0 };
  uint32_t last_connect_timeout_ms { 0 };
  std::vector<uint32_t> scan_durations;
  std::vector<std::string> connect_requests;
  std::vector<std::string> disconnects;

 private:
  RadioListener* listener_ { nullptr };
};

class FakeBondStore : public BondStore {
 public:
  bool load(std::string& id_out) override {
    if (!has_value) return false;
    id_out = value;
    return true;
  }
  bool save(const std::string& id) override {
    value = id;
    has_value = true;
    saves++;
    return true;
  }
  bool erase() override {
    value.clear();
    has_value = false;
    return true;
  }

  bool has_value { false };
  std::string value;
  int saves { 0 };
};

class FakeAlertSink : public AlertSink {
 public:
  void show_alert(const Alert& alert) override {
    shown.push_back(alert);
  }
  void cancel_all_alerts() override {
    cancel_calls++;
  }

  std::vector<Alert> shown;
  int cancel_calls { 0 };
};

class FakeCapabilityGate : public CapabilityGate {
 public:
  FakeCapabilityGate() {
    report.scan_granted = true;
    report.connect_granted = true;
    report.location_granted = true;
    report.notify_granted = true;
    report.radio_on = true;
  }

  void request(const CapabilitySet&,
               std::function<void(const CapabilityReport&)>&& done) override {
    requests++;
    if (defer) {
      pending.push_back(std::move(done));
      return;
    }
    done(report);
  }

  void release_all() {
    auto callbacks = std::move(pending);
    pending.clear();
    for (auto& cb : callbacks) cb(report);
  }

  CapabilityReport report;
  bool defer { false };
  int requests { 0 };
  std::vector<std::function<void(const CapabilityReport&)>> pending;
};

}  // namespace testing
}  // namespace umbrella_guard
}  // namespace esphome
