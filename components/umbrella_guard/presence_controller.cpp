#include "presence_controller.h"

#include <utility>

namespace esphome {
namespace umbrella_guard {

static constexpr char STATUS_NOT_CONNECTED[] = "Not Connected";
static constexpr char STATUS_SCANNING[] = "Scanning...";
static constexpr char STATUS_AUTO_SCANNING[] = "Auto reconnect scanning...";
static constexpr char STATUS_NONE_FOUND[] = "No umbrellas found";
static constexpr char STATUS_SELECT[] = "Select umbrella to connect";
static constexpr char STATUS_CONNECTING[] = "Connecting...";
static constexpr char STATUS_CONNECT_FAILED[] = "Connect failed";
static constexpr char STATUS_LOST[] = "Umbrella Lost";
static constexpr char STATUS_FORGOTTEN[] = "Saved umbrella cleared";
static constexpr char STATUS_RADIO_OFF[] = "Bluetooth OFF. Turn it ON.";

const char* phase_to_string(PresencePhase phase) {
  switch (phase) {
    case PresencePhase::IDLE:
      return "IDLE";
    case PresencePhase::SCANNING:
      return "SCANNING";
    case PresencePhase::CONNECTING:
      return "CONNECTING";
    case PresencePhase::CONNECTED:
      return "CONNECTED";
    case PresencePhase::LOST:
      return "LOST";
  }
  return "UNKNOWN";
}

const char* error_to_string(PresenceError error) {
  switch (error) {
    case PresenceError::NONE:
      return "none";
    case PresenceError::PERMISSION_DENIED:
      return "permission denied";
    case PresenceError::RADIO_OFF:
      return "radio off";
    case PresenceError::SCAN_FINISHED:
      return "scan finished";
    case PresenceError::CONNECT_FAILURE:
      return "connect failure";
    case PresenceError::LOST:
      return "lost";
  }
  return "unknown";
}

PresenceController::PresenceController(const PresenceConfig& config, Radio& radio,
                                       BondStore& store, AlertSink& alerts,
                                       CapabilityGate& gate, TimerService& timers)
    : config_(config),
      radio_(radio),
      store_(store),
      gate_(gate),
      timers_(timers),
      registry_(config.name_prefix),
      alert_loop_(timers, alerts),
      reconnect_loop_(timers, [this]() { this->reconnect_tick_(); }) {
  alert_loop_.set_interval_ms(config_.alert_interval_ms);
  alert_loop_.set_title(config_.alert_title);
  reconnect_loop_.set_interval_ms(config_.reconnect_interval_ms);
  radio_.set_listener(this);
}

PresenceController::~PresenceController() {
  this->teardown();
  radio_.set_listener(nullptr);
}

bool PresenceController::is_transition_allowed(PresencePhase from, PresencePhase to) {
  switch (from) {
    case PresencePhase::IDLE:
      return to == PresencePhase::SCANNING || to == PresencePhase::CONNECTING;
    case PresencePhase::SCANNING:
      return to == PresencePhase::CONNECTING || to == PresencePhase::IDLE;
    case PresencePhase::CONNECTING:
      return to == PresencePhase::CONNECTED || to == PresencePhase::IDLE;
    case PresencePhase::CONNECTED:
      return to == PresencePhase::LOST || to == PresencePhase::IDLE;
    case PresencePhase::LOST:
      return to == PresencePhase::CONNECTED || to == PresencePhase::IDLE;
  }
  return false;
}

//======================== Transitions ========================

bool PresenceController::transition_(PresencePhase to, const std::string& device_id) {
  const PresencePhase from = state_.phase;
  if (!is_transition_allowed(from, to)) return false;

  state_.phase = to;
  if (to == PresencePhase::CONNECTING || to == PresencePhase::CONNECTED) {
    state_.active_device_id = device_id;
  } else {
    state_.active_device_id.clear();
  }
  state_.lost_mode_active = (to == PresencePhase::LOST);

  // Loops follow the phase on every edge
  if (to == PresencePhase::LOST) {
    alert_loop_.arm();
    std::string bonded;
    if (store_.load(bonded)) reconnect_loop_.arm();
  } else {
    alert_loop_.disarm();
    reconnect_loop_.disarm();
  }

  for (auto& cb : phase_callbacks_) cb(from, to);
  return true;
}

void PresenceController::set_status_(const std::string& status, PresenceError error) {
  status_ = status;
  last_error_ = error;
  for (auto& cb : status_callbacks_) cb(status_, error);
}

void PresenceController::notify_devices_() {
  if (devices_callbacks_.empty()) return;
  const auto devices = registry_.snapshot();

  // RSSI refreshes that keep the order are not reported
  std::vector<std::string> listed;
  listed.reserve(devices.size());
  for (const auto& device : devices) listed.push_back(device.id + '\n' + device.display_name);
  if (listed == listed_) return;
  listed_ = std::move(listed);

  for (auto& cb : devices_callbacks_) cb(devices);
}

//======================== Capabilities ========================

void PresenceController::request_capabilities_(std::function<void()>&& on_granted) {
  gate_.request(CapabilitySet {}, [this, on_granted = std::move(on_granted)](
                                      const CapabilityReport& report) {
    if (torn_down_) return;

    const char* denied = nullptr;
    if (!report.scan_granted) {
      denied = "BLUETOOTH_SCAN";
    } else if (!report.connect_granted) {
      denied = "BLUETOOTH_CONNECT";
    } else if (!report.location_granted) {
      denied = "LOCATION";
    } else if (!report.notify_granted) {
      denied = "NOTIFICATION";
    }

    if (denied != nullptr) {
      halted_ = true;
      set_status_(std::string("Permission denied: ") + denied, PresenceError::PERMISSION_DENIED);
      return;
    }
    if (!report.radio_on) {
      halted_ = true;
      set_status_(STATUS_RADIO_OFF, PresenceError::RADIO_OFF);
      return;
    }

    halted_ = false;
    on_granted();
  });
}

//======================== User / lifecycle operations ========================

void PresenceController::start() {
  torn_down_ = false;
  request_capabilities_([this]() { this->try_bonded_reconnect_(); });
}

void PresenceController::resume() {
  if (halted_ || torn_down_) return;
  switch (state_.phase) {
    case PresencePhase::IDLE:
      try_bonded_reconnect_();
      break;
    case PresencePhase::LOST:
      reconnect_tick_();
      break;
    default:
      break;
  }
}

void PresenceController::try_bonded_reconnect_() {
  if (state_.phase != PresencePhase::IDLE || pending_.in_flight) return;

  std::string bonded;
  if (!store_.load(bonded)) return;

  if (begin_scan_session_(ScanMode::BONDED, config_.auto_reconnect_scan_duration_ms, bonded)) {
    set_status_(STATUS_AUTO_SCANNING);
  }
}

void PresenceController::start_manual_scan() {
  if (torn_down_) return;
  if (state_.phase != PresencePhase::IDLE && state_.phase != PresencePhase::SCANNING) return;

  request_capabilities_([this]() {
    // An abandoned attempt still owns the radio; scan once it resolves
    if (pending_.in_flight) {
      scan_deferred_ = true;
      return;
    }
    run_manual_scan_();
  });
}

void PresenceController::run_manual_scan_() {
  // The phase may have moved while the request was outstanding
  if (state_.phase != PresencePhase::IDLE && state_.phase != PresencePhase::SCANNING) return;

  registry_.clear();
  notify_devices_();
  if (begin_scan_session_(ScanMode::MANUAL, config_.manual_scan_duration_ms, "")) {
    set_status_(STATUS_SCANNING);
  }
}

bool PresenceController::connect_to(const std::string& id) {
  if (torn_down_ || pending_.in_flight) return false;
  if (state_.phase != PresencePhase::IDLE && state_.phase != PresencePhase::SCANNING) return false;
  if (registry_.find(id) == nullptr) return false;
  return begin_connect_(id, ConnectOrigin::USER);
}

void PresenceController::disconnect() {
  switch (state_.phase) {
    case PresencePhase::CONNECTED: {
      const std::string id = state_.active_device_id;
      // Unsubscribe first so our own teardown is not seen as a lost umbrella
      subscribed_id_.clear();
      radio_.disconnect(id);
      transition_(PresencePhase::IDLE);
      break;
    }
    case PresencePhase::CONNECTING:
    case PresencePhase::LOST:
      if (pending_.in_flight) {
        pending_.abandoned = true;
        radio_.cancel_connect();
      }
      subscribed_id_.clear();
      transition_(PresencePhase::IDLE);
      break;
    case PresencePhase::SCANNING:
      // Nothing to tear down; the running session keeps its own status
      return;
    case PresencePhase::IDLE:
      break;
  }
  set_status_(STATUS_NOT_CONNECTED);
}

bool PresenceController::forget() {
  // Does not touch a live link; only the next reconnect cycle changes
  if (!store_.erase()) return false;
  set_status_(STATUS_FORGOTTEN);
  return true;
}

void PresenceController::teardown() {
  torn_down_ = true;
  alert_loop_.disarm();
  reconnect_loop_.disarm();
  cancel_scan_session_();
  timers_.cancel_task(CONNECT_GUARD_TASK);
  if (pending_.in_flight) radio_.cancel_connect();
  pending_ = PendingConnect {};
  scan_deferred_ = false;
  subscribed_id_.clear();
  state_ = PresenceState {};
}

//======================== Scan sessions ========================

bool PresenceController::begin_scan_session_(ScanMode mode, uint32_t duration_ms,
                                             const std::string& target_id) {
  // A newer session replaces the old one; the old one never reports an end
  cancel_scan_session_();

  if (!radio_.start_scan(duration_ms)) {
    if (mode != ScanMode::RECONNECT) {
      if (state_.phase == PresencePhase::SCANNING) transition_(PresencePhase::IDLE);
      set_status_(STATUS_RADIO_OFF, PresenceError::RADIO_OFF);
    }
    return false;
  }

  session_.active = true;
  session_.mode = mode;
  session_.target_id = target_id;
  session_.generation = ++session_generation_;

  const uint32_t generation = session_.generation;
  timers_.schedule_timeout(SCAN_TASK, duration_ms,
                           [this, generation]() { this->end_scan_session_(generation); });

  if (mode != ScanMode::RECONNECT && state_.phase == PresencePhase::IDLE) {
    transition_(PresencePhase::SCANNING);
  }
  return true;
}

void PresenceController::end_scan_session_(uint32_t generation) {
  if (!session_.active || session_.generation != generation) return;
  session_.active = false;
  radio_.stop_scan();

  if (session_.mode == ScanMode::RECONNECT) return;
  if (state_.phase != PresencePhase::SCANNING) return;

  transition_(PresencePhase::IDLE);
  set_status_(registry_.empty() ? STATUS_NONE_FOUND : STATUS_SELECT, PresenceError::SCAN_FINISHED);
}

void PresenceController::cancel_scan_session_() {
  if (!session_.active) return;
  session_.active = false;
  timers_.cancel_task(SCAN_TASK);
  radio_.stop_scan();
}

void PresenceController::on_sighting(const Sighting& sighting) {
  if (!session_.active) return;
  if (!registry_.upsert(sighting)) return;
  notify_devices_();

  if (session_.target_id.empty() || sighting.id != session_.target_id) return;

  // Target found: truncate the session, later sightings are not processed
  const ScanMode mode = session_.mode;
  cancel_scan_session_();

  if (mode == ScanMode::RECONNECT) {
    // Result of a session that outlived lost mode is discarded
    if (state_.phase != PresencePhase::LOST) return;
    begin_connect_(sighting.id, ConnectOrigin::RECONNECT);
  } else if (state_.phase == PresencePhase::SCANNING) {
    begin_connect_(sighting.id, ConnectOrigin::AUTO);
  }
}

//======================== Connect attempts ========================

bool PresenceController::begin_connect_(const std::string& id, ConnectOrigin origin) {
  if (pending_.in_flight) return false;

  cancel_scan_session_();

  pending_.in_flight = true;
  pending_.abandoned = false;
  pending_.origin = origin;
  pending_.id = id;

  if (origin != ConnectOrigin::RECONNECT) {
    transition_(PresencePhase::CONNECTING, id);
    set_status_(STATUS_CONNECTING);
  }

  last_connect_status_ = 0;
  if (!radio_.connect(id, config_.connect_timeout_ms)) {
    finish_connect_(false, CONNECT_STATUS_REJECTED);
    return false;
  }

  timers_.schedule_timeout(CONNECT_GUARD_TASK,
                           config_.connect_timeout_ms + config_.connect_guard_margin_ms,
                           [this]() { this->on_connect_guard_expired_(); });
  return true;
}

void PresenceController::on_connect_guard_expired_() {
  if (!pending_.in_flight) return;
  radio_.cancel_connect();
  finish_connect_(false, CONNECT_STATUS_TIMEOUT);
}

void PresenceController::on_connect_result(const std::string& id, bool success, int status) {
  if (!pending_.in_flight || id != pending_.id) {
    // Nobody asked for this link (late result of a cancelled attempt)
    if (success) radio_.disconnect(id);
    return;
  }
  finish_connect_(success, status);
}

void PresenceController::finish_connect_(bool success, int status) {
  last_connect_status_ = status;
  const PendingConnect attempt = pending_;
  pending_ = PendingConnect {};
  timers_.cancel_task(CONNECT_GUARD_TASK);

  const bool stale = attempt.abandoned ||
                     (attempt.origin == ConnectOrigin::RECONNECT &&
                      state_.phase != PresencePhase::LOST);
  if (stale) {
    if (success) radio_.disconnect(attempt.id);
    if (scan_deferred_) {
      scan_deferred_ = false;
      run_manual_scan_();
    }
    return;
  }

  if (success) {
    // Persist failure is not fatal: the live link is still usable
    store_.save(attempt.id);
    subscribed_id_ = attempt.id;
    transition_(PresencePhase::CONNECTED, attempt.id);
    set_status_("Connected (" + describe_device_(attempt.id) + ")");
    return;
  }

  // Reconnect-loop attempts stay in LOST; the next tick retries
  if (attempt.origin == ConnectOrigin::RECONNECT) return;

  transition_(PresencePhase::IDLE);
  set_status_(STATUS_CONNECT_FAILED, PresenceError::CONNECT_FAILURE);
}

//======================== Link feed / lost mode ========================

void PresenceController::on_link_state(const std::string& id, LinkState state) {
  if (subscribed_id_.empty() || id != subscribed_id_) return;
  if (state != LinkState::DISCONNECTED) return;
  if (state_.phase != PresencePhase::CONNECTED) return;

  subscribed_id_.clear();
  transition_(PresencePhase::LOST);
  set_status_(STATUS_LOST, PresenceError::LOST);
}

void PresenceController::reconnect_tick_() {
  if (halted_ || torn_down_) return;
  // A disconnect already moved us to LOST; anything else means the tick is stale
  if (state_.phase != PresencePhase::LOST) return;
  if (pending_.in_flight) return;

  // Re-read on every attempt: forget() while lost stops further scans
  std::string bonded;
  if (!store_.load(bonded)) return;

  begin_scan_session_(ScanMode::RECONNECT, config_.reconnect_scan_duration_ms, bonded);
}

std::string PresenceController::describe_device_(const std::string& id) const {
  const DiscoveredDevice* dev = registry_.find(id);
  return dev != nullptr ? dev->display_name : id;
}

}  // namespace umbrella_guard
}  // namespace esphome
