#pragma once

#include <string>

#include "esphome/core/automation.h"
#include "umbrella_guard.h"

namespace esphome {
namespace umbrella_guard {

// on_alert: fires for every lost-mode alert with (title, body)
class AlertTrigger : public Trigger<std::string, std::string> {
 public:
  explicit AlertTrigger(UmbrellaGuardComponent* parent) {
    parent->add_on_alert_callback(
        [this](const std::string& title, const std::string& body) { this->trigger(title, body); });
  }
};

// on_alert_cleared: lost mode ended, outstanding alerts withdrawn
class AlertClearedTrigger : public Trigger<> {
 public:
  explicit AlertClearedTrigger(UmbrellaGuardComponent* parent) {
    parent->add_on_alert_cleared_callback([this]() { this->trigger(); });
  }
};

template<typename... Ts> class ScanAction : public Action<Ts...>, public Parented<UmbrellaGuardComponent> {
 public:
  void play(Ts... x) override {
    this->parent_->start_manual_scan();
  }
};

template<typename... Ts>
class DisconnectAction : public Action<Ts...>, public Parented<UmbrellaGuardComponent> {
 public:
  void play(Ts... x) override {
    this->parent_->disconnect();
  }
};

template<typename... Ts> class ForgetAction : public Action<Ts...>, public Parented<UmbrellaGuardComponent> {
 public:
  void play(Ts... x) override {
    this->parent_->forget();
  }
};

template<typename... Ts> class ConnectAction : public Action<Ts...>, public Parented<UmbrellaGuardComponent> {
 public:
  TEMPLATABLE_VALUE(std::string, device_id)

  void play(Ts... x) override {
    this->parent_->connect_to(this->device_id_.value(x...));
  }
};

}  // namespace umbrella_guard
}  // namespace esphome
