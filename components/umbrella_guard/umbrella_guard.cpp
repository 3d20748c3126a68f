#include "umbrella_guard.h"

// ESP32-only implementation - requires Bluetooth hardware
#ifdef USE_ESP32

#include "esphome/core/hal.h"
#include "esphome/core/log.h"

namespace esphome {
namespace umbrella_guard {

static const char* const TAG = "umbrella_guard";
static constexpr char VERSION[] = "1.0.0";
static constexpr const char* ALERT_PULSE_TASK = "alert_pulse";
static constexpr uint32_t HOST_SYNC_GRACE_MS = 5000;

//======================== THREADING MODEL ========================
/*
1. NimBLE task: GAP callbacks in NimbleRadio. They only enqueue events.
2. ESPHome main task: setup(), loop(), entity callbacks, scheduler tasks and
   every PresenceController call.

loop() drains the radio queue into the controller, so the controller and every
entity publish run on the main task. No state in this file is shared with the
NimBLE task.
*/

//======================== Entity actions ========================

void UmbrellaGuardButton::press_action() {
  if (!parent_) return;
  switch (action_) {
    case Action::SCAN:
      parent_->start_manual_scan();
      break;
    case Action::DISCONNECT:
      parent_->disconnect();
      break;
    case Action::FORGET:
      parent_->forget();
      break;
  }
}

void UmbrellaGuardSelect::setup() {
  this->traits.set_options({ NONE_OPTION });
  this->publish_state(NONE_OPTION);
}

void UmbrellaGuardSelect::control(const std::string& value) {
  auto index = this->index_of(value);
  if (!index.has_value() || *index == 0 || *index > ids_.size()) {
    this->publish_state(value);
    return;
  }
  const std::string id = ids_[*index - 1];
  this->publish_state(value);
  if (parent_) parent_->connect_to(id);
}

void UmbrellaGuardSelect::update_devices(const std::vector<DiscoveredDevice>& devices) {
  std::vector<std::string> options;
  options.reserve(devices.size() + 1);
  options.emplace_back(NONE_OPTION);
  ids_.clear();
  ids_.reserve(devices.size());
  for (const auto& dev : devices) {
    options.push_back(dev.display_name + " [" + dev.id + "]");
    ids_.push_back(dev.id);
  }
  this->traits.set_options(options);
  this->publish_state(NONE_OPTION);
}

//======================== Entity dump_config ========================

void UmbrellaGuardButton::dump_config() {
  static const char* const NAMES[] = { "Scan", "Disconnect", "Forget" };
  ESP_LOGCONFIG(TAG, "Umbrella Guard %s Button", NAMES[static_cast<uint8_t>(action_)]);
}

void UmbrellaGuardSelect::dump_config() {
  ESP_LOGCONFIG(TAG, "Umbrella Guard Devices Select");
  ESP_LOGCONFIG(TAG, "  Listed: %u", (unsigned) ids_.size());
}

//======================== Public actions ========================

void UmbrellaGuardComponent::start_manual_scan() {
  if (!controller_) return;
  ESP_LOGI(TAG, "Manual scan requested");
  controller_->start_manual_scan();
}

void UmbrellaGuardComponent::connect_to(const std::string& id) {
  if (!controller_) return;
  if (!controller_->connect_to(id)) {
    ESP_LOGW(TAG, "Connect to %s ignored (phase=%s, in flight=%s)", id.c_str(),
             phase_to_string(controller_->get_phase()),
             YESNO(controller_->is_connect_in_flight()));
  }
}

void UmbrellaGuardComponent::disconnect() {
  if (!controller_) return;
  ESP_LOGI(TAG, "Disconnect requested");
  controller_->disconnect();
}

void UmbrellaGuardComponent::forget() {
  if (!controller_) return;
  if (!controller_->forget()) {
    ESP_LOGE(TAG, "Could not clear saved umbrella");
  }
  this->publish_saved_umbrella_();
}

PresencePhase UmbrellaGuardComponent::get_phase() const {
  return controller_ ? controller_->get_phase() : PresencePhase::IDLE;
}

std::string UmbrellaGuardComponent::get_status() const {
  return controller_ ? controller_->get_status() : std::string("Not Connected");
}

//======================== AlertSink ========================

void UmbrellaGuardComponent::show_alert(const Alert& alert) {
  ESP_LOGW(TAG, "%s: %s", alert.title.c_str(), alert.body.c_str());

  if (alert_sensor_) {
    alert_sensor_->publish_state(alert.body);
  }
  if (alert_output_ && alert.urgency == AlertUrgency::HIGH) {
    alert_output_->turn_on();
    this->set_timeout(ALERT_PULSE_TASK, alert_pulse_ms_, [this]() { alert_output_->turn_off(); });
  }
  alert_callback_.call(alert.title, alert.body);
}

void UmbrellaGuardComponent::cancel_all_alerts() {
  ESP_LOGI(TAG, "Alerts cleared");
  this->cancel_timeout(ALERT_PULSE_TASK);
  if (alert_output_) {
    alert_output_->turn_off();
  }
  if (alert_sensor_) {
    alert_sensor_->publish_state("");
  }
  alert_cleared_callback_.call();
}

//======================== CapabilityGate ========================
/*
The device grants its own capabilities:
- scan / connect: NimBLE built with the observer / central role
- location: no equivalent on the device, always granted
- notify: at least one alert path configured (output, sensor or on_alert)
- radio on: NimBLE host synced with the controller
*/
void UmbrellaGuardComponent::request(const CapabilitySet& wanted,
                                     std::function<void(const CapabilityReport&)>&& done) {
  CapabilityReport report;
#ifdef CONFIG_BT_NIMBLE_ROLE_OBSERVER
  report.scan_granted = true;
#else
  report.scan_granted = !wanted.scan;
#endif
#ifdef CONFIG_BT_NIMBLE_ROLE_CENTRAL
  report.connect_granted = true;
#else
  report.connect_granted = !wanted.connect;
#endif
  report.location_granted = true;
  report.notify_granted =
      !wanted.notify || alert_output_ != nullptr || alert_sensor_ != nullptr || alert_listeners_ > 0;
  report.radio_on = radio_.is_host_synced();

  ESP_LOGD(TAG, "Capabilities: scan=%s connect=%s notify=%s radio=%s",
           YESNO(report.scan_granted), YESNO(report.connect_granted),
           YESNO(report.notify_granted), ONOFF(report.radio_on));
  done(report);
}

//======================== TimerService ========================

// Component::set_interval starts at a random offset; the loops need their
// first tick one full interval after arming
void UmbrellaGuardComponent::schedule_interval(const std::string& name, uint32_t interval_ms,
                                               std::function<void()>&& f) {
  schedule_fixed_interval(*this, name, interval_ms, std::move(f));
}

void UmbrellaGuardComponent::schedule_timeout(const std::string& name, uint32_t delay_ms,
                                              std::function<void()>&& f) {
  this->set_timeout(name, delay_ms, std::move(f));
}

bool UmbrellaGuardComponent::cancel_task(const std::string& name) {
  return this->cancel_timeout(name);
}

//======================== Controller callbacks ========================

void UmbrellaGuardComponent::on_status_(const std::string& status, PresenceError error) {
  switch (error) {
    case PresenceError::PERMISSION_DENIED:
    case PresenceError::RADIO_OFF:
    case PresenceError::CONNECT_FAILURE:
      ESP_LOGW(TAG, "Status: %s (%s)", status.c_str(), error_to_string(error));
      break;
    case PresenceError::LOST:
      ESP_LOGW(TAG, "Status: %s", status.c_str());
      break;
    default:
      ESP_LOGI(TAG, "Status: %s", status.c_str());
      break;
  }
  if (status_sensor_) {
    status_sensor_->publish_state(status);
  }
}

void UmbrellaGuardComponent::on_phase_(PresencePhase from, PresencePhase to) {
  ESP_LOGD(TAG, "Phase %s -> %s", phase_to_string(from), phase_to_string(to));
  if (lost_sensor_) {
    lost_sensor_->publish_state(to == PresencePhase::LOST);
  }
  if (connected_sensor_) {
    connected_sensor_->publish_state(to == PresencePhase::CONNECTED);
  }
  if (to == PresencePhase::CONNECTED) {
    this->publish_saved_umbrella_();
  }
}

void UmbrellaGuardComponent::publish_saved_umbrella_() {
  if (!saved_sensor_) return;
  std::string id;
  saved_sensor_->publish_state(store_.load(id) ? id : std::string(""));
}

//======================== Component lifecycle ========================

void UmbrellaGuardComponent::setup() {
  ESP_LOGI(TAG, "Umbrella Guard v%s starting", VERSION);
  setup_ms_ = millis();

  if (!store_.init()) {
    ESP_LOGW(TAG, "Continuing without persistent storage");
  }
  if (!radio_.init(ble_name_)) {
    ESP_LOGE(TAG, "NimBLE host could not be started");
    this->mark_failed();
    return;
  }

  controller_ = std::make_unique<PresenceController>(config_, radio_, store_, *this, *this, *this);
  controller_->add_on_status_callback(
      [this](const std::string& status, PresenceError error) { this->on_status_(status, error); });
  controller_->add_on_phase_callback(
      [this](PresencePhase from, PresencePhase to) { this->on_phase_(from, to); });
  controller_->add_on_devices_callback([this](const std::vector<DiscoveredDevice>& devices) {
    ESP_LOGD(TAG, "%u umbrella(s) in range", (unsigned) devices.size());
    if (devices_select_) devices_select_->update_devices(devices);
  });

  if (status_sensor_) {
    status_sensor_->publish_state(controller_->get_status());
  }
  if (lost_sensor_) {
    lost_sensor_->publish_state(false);
  }
  if (connected_sensor_) {
    connected_sensor_->publish_state(false);
  }
  this->publish_saved_umbrella_();
}

void UmbrellaGuardComponent::loop() {
  if (!controller_) return;

  // Host (re)sync stands in for app start / resume
  const uint32_t syncs = radio_.get_sync_count();
  if (syncs != syncs_seen_) {
    syncs_seen_ = syncs;
    if (!synced_once_ || controller_->is_halted()) {
      synced_once_ = true;
      started_ = true;
      ESP_LOGI(TAG, "Radio ready, starting presence monitoring");
      controller_->start();
    } else {
      ESP_LOGI(TAG, "Radio re-synced, resuming");
      controller_->resume();
    }
  } else if (!started_ && millis() - setup_ms_ > HOST_SYNC_GRACE_MS) {
    // Start anyway so the radio-off state is reported; the first sync restarts
    started_ = true;
    ESP_LOGW(TAG, "NimBLE host not synced after %u ms", (unsigned) HOST_SYNC_GRACE_MS);
    controller_->start();
  }

  radio_.process_events();
}

void UmbrellaGuardComponent::on_shutdown() {
  ESP_LOGI(TAG, "Shutting down");
  if (controller_) {
    controller_->teardown();
  }
  radio_.shutdown();
}

void UmbrellaGuardComponent::dump_config() {
  ESP_LOGCONFIG(TAG, "Umbrella Guard:");
  ESP_LOGCONFIG(TAG, "  BLE Name: %s", ble_name_.c_str());
  ESP_LOGCONFIG(TAG, "  Name Prefix: '%s'", config_.name_prefix.c_str());
  ESP_LOGCONFIG(TAG, "  Alert Title: '%s'", config_.alert_title.c_str());
  ESP_LOGCONFIG(TAG, "  Manual Scan: %u ms", (unsigned) config_.manual_scan_duration_ms);
  ESP_LOGCONFIG(TAG, "  Auto Reconnect Scan: %u ms",
                (unsigned) config_.auto_reconnect_scan_duration_ms);
  ESP_LOGCONFIG(TAG, "  Reconnect Scan: %u ms every %u ms",
                (unsigned) config_.reconnect_scan_duration_ms,
                (unsigned) config_.reconnect_interval_ms);
  ESP_LOGCONFIG(TAG, "  Alert Interval: %u ms", (unsigned) config_.alert_interval_ms);
  ESP_LOGCONFIG(TAG, "  Connect Timeout: %u ms", (unsigned) config_.connect_timeout_ms);
  ESP_LOGCONFIG(TAG, "  Persistent Storage: %s", YESNO(store_.is_ready()));
  ESP_LOGCONFIG(TAG, "  Alert Output: %s", YESNO(alert_output_ != nullptr));
  if (controller_) {
    ESP_LOGCONFIG(TAG, "  Phase: %s", phase_to_string(controller_->get_phase()));
  }
  LOG_TEXT_SENSOR("  ", "Status", status_sensor_);
  LOG_TEXT_SENSOR("  ", "Last Alert", alert_sensor_);
  LOG_TEXT_SENSOR("  ", "Saved Umbrella", saved_sensor_);
  LOG_BINARY_SENSOR("  ", "Lost", lost_sensor_);
  LOG_BINARY_SENSOR("  ", "Connected", connected_sensor_);
}

}  // namespace umbrella_guard
}  // namespace esphome

#endif  // USE_ESP32
