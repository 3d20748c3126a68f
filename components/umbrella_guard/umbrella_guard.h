#pragma once

#include <memory>
#include <string>
#include <vector>

#include "esphome/components/binary_sensor/binary_sensor.h"
#include "esphome/components/button/button.h"
#include "esphome/components/output/binary_output.h"
#include "esphome/components/select/select.h"
#include "esphome/components/text_sensor/text_sensor.h"
#include "esphome/core/component.h"
#include "esphome/core/helpers.h"

#include "fixed_interval.h"
#include "nimble_radio.h"
#include "nvs_bond_store.h"
#include "presence_controller.h"
#include "presence_types.h"

namespace esphome {
namespace umbrella_guard {

class UmbrellaGuardComponent;

// Scan / disconnect / forget buttons
class UmbrellaGuardButton : public button::Button, public Component {
 public:
  enum class Action : uint8_t {
    SCAN,
    DISCONNECT,
    FORGET,
  };

  void set_parent(UmbrellaGuardComponent* parent) {
    parent_ = parent;
  }
  void set_action(Action action) {
    action_ = action;
  }
  void press_action() override;
  void dump_config() override;

 protected:
  UmbrellaGuardComponent* parent_ { nullptr };
  Action action_ { Action::SCAN };
};

// Discovered umbrellas, strongest first, as "<name> [<id>]". Choosing an entry
// connects to it.
class UmbrellaGuardSelect : public select::Select, public Component {
 public:
  static constexpr const char* NONE_OPTION = "None";

  void set_parent(UmbrellaGuardComponent* parent) {
    parent_ = parent;
  }
  void setup() override;
  void control(const std::string& value) override;
  void dump_config() override;

  void update_devices(const std::vector<DiscoveredDevice>& devices);

 protected:
  UmbrellaGuardComponent* parent_ { nullptr };
  std::vector<std::string> ids_;  // ids_[i] belongs to option i + 1
};

class UmbrellaGuardComponent : public Component,
                               public AlertSink,
                               public CapabilityGate,
                               public TimerService {
 public:
  // Component API
  void setup() override;
  void loop() override;
  void dump_config() override;
  void on_shutdown() override;
  float get_setup_priority() const override {
    return -200.0f;
  }

  friend class UmbrellaGuardButton;
  friend class UmbrellaGuardSelect;

  // Configuration setters
  void set_ble_name(const std::string& name) {
    ble_name_ = name;
  }
  void set_name_prefix(const std::string& prefix) {
    config_.name_prefix = prefix;
  }
  void set_alert_title(const std::string& title) {
    config_.alert_title = title;
  }
  void set_manual_scan_duration(uint32_t ms) {
    config_.manual_scan_duration_ms = ms;
  }
  void set_auto_reconnect_scan_duration(uint32_t ms) {
    config_.auto_reconnect_scan_duration_ms = ms;
  }
  void set_reconnect_scan_duration(uint32_t ms) {
    config_.reconnect_scan_duration_ms = ms;
  }
  void set_reconnect_interval(uint32_t ms) {
    config_.reconnect_interval_ms = ms;
  }
  void set_alert_interval(uint32_t ms) {
    config_.alert_interval_ms = ms;
  }
  void set_connect_timeout(uint32_t ms) {
    config_.connect_timeout_ms = ms;
  }
  void set_alert_pulse_duration(uint32_t ms) {
    alert_pulse_ms_ = ms;
  }

  void set_status_sensor(text_sensor::TextSensor* sensor) {
    status_sensor_ = sensor;
  }
  void set_alert_sensor(text_sensor::TextSensor* sensor) {
    alert_sensor_ = sensor;
  }
  void set_saved_umbrella_sensor(text_sensor::TextSensor* sensor) {
    saved_sensor_ = sensor;
  }
  void set_lost_binary_sensor(binary_sensor::BinarySensor* sensor) {
    lost_sensor_ = sensor;
  }
  void set_connected_binary_sensor(binary_sensor::BinarySensor* sensor) {
    connected_sensor_ = sensor;
  }
  void set_devices_select(UmbrellaGuardSelect* sel) {
    devices_select_ = sel;
    if (sel) sel->set_parent(this);
  }
  void set_scan_button(UmbrellaGuardButton* btn) {
    register_button_(btn, UmbrellaGuardButton::Action::SCAN);
  }
  void set_disconnect_button(UmbrellaGuardButton* btn) {
    register_button_(btn, UmbrellaGuardButton::Action::DISCONNECT);
  }
  void set_forget_button(UmbrellaGuardButton* btn) {
    register_button_(btn, UmbrellaGuardButton::Action::FORGET);
  }
  void set_alert_output(output::BinaryOutput* out) {
    alert_output_ = out;
  }

  void add_on_alert_callback(std::function<void(std::string, std::string)>&& callback) {
    alert_listeners_++;
    alert_callback_.add(std::move(callback));
  }
  void add_on_alert_cleared_callback(std::function<void()>&& callback) {
    alert_cleared_callback_.add(std::move(callback));
  }

  // Public actions (buttons, select, automations)
  void start_manual_scan();
  void connect_to(const std::string& id);
  void disconnect();
  void forget();

  PresencePhase get_phase() const;
  std::string get_status() const;

  // AlertSink
  void show_alert(const Alert& alert) override;
  void cancel_all_alerts() override;

  // CapabilityGate
  void request(const CapabilitySet& wanted,
               std::function<void(const CapabilityReport&)>&& done) override;

  // TimerService, backed by the ESPHome scheduler
  void schedule_interval(const std::string& name, uint32_t interval_ms,
                         std::function<void()>&& f) override;
  void schedule_timeout(const std::string& name, uint32_t delay_ms,
                        std::function<void()>&& f) override;
  bool cancel_task(const std::string& name) override;

 protected:
  void register_button_(UmbrellaGuardButton* btn, UmbrellaGuardButton::Action action) {
    if (!btn) return;
    btn->set_parent(this);
    btn->set_action(action);
  }

  void on_status_(const std::string& status, PresenceError error);
  void on_phase_(PresencePhase from, PresencePhase to);
  void publish_saved_umbrella_();

  std::string ble_name_ { "Umbrella Guard" };
  PresenceConfig config_ {};
  uint32_t alert_pulse_ms_ { 1000 };

  NimbleRadio radio_;
  NvsBondStore store_;
  uint32_t syncs_seen_ { 0 };
  uint32_t setup_ms_ { 0 };
  bool synced_once_ { false };
  bool started_ { false };
  uint32_t alert_listeners_ { 0 };

  // UI entities
  text_sensor::TextSensor* status_sensor_ { nullptr };
  text_sensor::TextSensor* alert_sensor_ { nullptr };
  text_sensor::TextSensor* saved_sensor_ { nullptr };
  binary_sensor::BinarySensor* lost_sensor_ { nullptr };
  binary_sensor::BinarySensor* connected_sensor_ { nullptr };
  UmbrellaGuardSelect* devices_select_ { nullptr };
  output::BinaryOutput* alert_output_ { nullptr };

  CallbackManager<void(std::string, std::string)> alert_callback_;
  CallbackManager<void()> alert_cleared_callback_;

  // Last member: its teardown still reaches the entities and callbacks above
  std::unique_ptr<PresenceController> controller_;
};

}  // namespace umbrella_guard
}  // namespace esphome
