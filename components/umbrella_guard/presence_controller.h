#pragma once

#include <functional>
#include <string>
#include <vector>

#include "device_registry.h"
#include "lost_alert_loop.h"
#include "presence_types.h"
#include "reconnect_loop.h"

namespace esphome {
namespace umbrella_guard {

//======================== STATE MACHINE OVERVIEW ========================
/*
IDLE        --start/resume, bonded id saved-->  SCANNING (6s session, target = bonded id)
IDLE        --manual scan-->                    SCANNING (10s session, registry cleared)
IDLE        --tap listed device-->              CONNECTING
SCANNING    --target sighted / tap-->           CONNECTING (session stopped)
SCANNING    --session elapsed-->                IDLE ("No umbrellas found" / "Select ...")
CONNECTING  --connect ok-->                     CONNECTED (bonded id persisted)
CONNECTING  --connect failed / timeout-->       IDLE ("Connect failed")
CONNECTED   --link dropped-->                   LOST (alert loop + reconnect loop armed)
CONNECTED   --user disconnect-->                IDLE
LOST        --reconnect loop connects-->        CONNECTED (both loops disarmed)
LOST        --user disconnect-->                IDLE (both loops disarmed)

While LOST the reconnect loop runs 4s sessions every 3s. Those sessions and the
connect attempts they start do not leave LOST until a connect succeeds.

Every method must be called from one thread. Radio events are delivered
through the RadioListener interface on that same thread.
*/

enum class ScanMode : uint8_t {
  MANUAL,     // user requested, unfiltered
  BONDED,     // start/resume, targets the bonded id
  RECONNECT,  // lost mode, targets the bonded id
};

enum class ConnectOrigin : uint8_t {
  USER,
  AUTO,
  RECONNECT,
};

class PresenceController : public RadioListener {
 public:
  static constexpr const char* SCAN_TASK = "scan_session";
  static constexpr const char* CONNECT_GUARD_TASK = "connect_guard";
  static constexpr int CONNECT_STATUS_TIMEOUT = -1;
  static constexpr int CONNECT_STATUS_REJECTED = -2;

  using StatusCallback = std::function<void(const std::string&, PresenceError)>;
  using PhaseCallback = std::function<void(PresencePhase, PresencePhase)>;
  using DevicesCallback = std::function<void(const std::vector<DiscoveredDevice>&)>;

  PresenceController(const PresenceConfig& config, Radio& radio, BondStore& store,
                     AlertSink& alerts, CapabilityGate& gate, TimerService& timers);
  ~PresenceController() override;

  PresenceController(const PresenceController&) = delete;
  PresenceController& operator=(const PresenceController&) = delete;

  void add_on_status_callback(StatusCallback&& callback) {
    status_callbacks_.push_back(std::move(callback));
  }
  void add_on_phase_callback(PhaseCallback&& callback) {
    phase_callbacks_.push_back(std::move(callback));
  }
  void add_on_devices_callback(DevicesCallback&& callback) {
    devices_callbacks_.push_back(std::move(callback));
  }

  // App start: capability check, then one bonded-reconnect attempt
  void start();
  // App resume: bonded-reconnect attempt from IDLE, immediate reconnect tick from LOST
  void resume();
  void start_manual_scan();
  // User tap on a discovered device. Ignored while another connect is in flight.
  bool connect_to(const std::string& id);
  void disconnect();
  bool forget();
  // Cancels every timer, session and subscription. Safe to call twice.
  void teardown();

  // RadioListener
  void on_sighting(const Sighting& sighting) override;
  void on_connect_result(const std::string& id, bool success, int status) override;
  void on_link_state(const std::string& id, LinkState state) override;

  const PresenceState& get_state() const {
    return state_;
  }
  PresencePhase get_phase() const {
    return state_.phase;
  }
  const std::string& get_status() const {
    return status_;
  }
  PresenceError get_last_error() const {
    return last_error_;
  }
  std::vector<DiscoveredDevice> get_devices() const {
    return registry_.snapshot();
  }
  const DeviceRegistry& get_registry() const {
    return registry_;
  }
  const PresenceConfig& get_config() const {
    return config_;
  }
  bool is_scanning() const {
    return session_.active;
  }
  bool is_connect_in_flight() const {
    return pending_.in_flight;
  }
  // Radio status of the last finished connect attempt (0 on success)
  int get_last_connect_status() const {
    return last_connect_status_;
  }
  bool is_halted() const {
    return halted_;
  }
  const LostAlertLoop& get_alert_loop() const {
    return alert_loop_;
  }
  const ReconnectLoop& get_reconnect_loop() const {
    return reconnect_loop_;
  }

  static bool is_transition_allowed(PresencePhase from, PresencePhase to);

 protected:
  struct ScanSession {
    bool active { false };
    ScanMode mode { ScanMode::MANUAL };
    std::string target_id;  // empty: no auto-connect target
    uint32_t generation { 0 };
  };

  struct PendingConnect {
    bool in_flight { false };
    bool abandoned { false };  // user left the phase; a late success is torn down
    ConnectOrigin origin { ConnectOrigin::USER };
    std::string id;
  };

  bool transition_(PresencePhase to, const std::string& device_id = "");
  void set_status_(const std::string& status, PresenceError error = PresenceError::NONE);
  void notify_devices_();

  void request_capabilities_(std::function<void()>&& on_granted);
  void run_manual_scan_();
  void try_bonded_reconnect_();
  void reconnect_tick_();

  bool begin_scan_session_(ScanMode mode, uint32_t duration_ms, const std::string& target_id);
  void end_scan_session_(uint32_t generation);
  void cancel_scan_session_();

  bool begin_connect_(const std::string& id, ConnectOrigin origin);
  void finish_connect_(bool success, int status);
  void on_connect_guard_expired_();

  std::string describe_device_(const std::string& id) const;

  PresenceConfig config_;
  Radio& radio_;
  BondStore& store_;
  CapabilityGate& gate_;
  TimerService& timers_;

  DeviceRegistry registry_;
  LostAlertLoop alert_loop_;
  ReconnectLoop reconnect_loop_;

  PresenceState state_ {};
  ScanSession session_ {};
  PendingConnect pending_ {};
  std::string subscribed_id_;  // link-state feed subscription, empty when none
  uint32_t session_generation_ { 0 };
  int last_connect_status_ { 0 };
  bool scan_deferred_ { false };  // manual scan waiting for an abandoned attempt
  std::vector<std::string> listed_;  // id + name per entry, as last reported

  std::string status_ { "Not Connected" };
  PresenceError last_error_ { PresenceError::NONE };
  bool halted_ { false };
  bool torn_down_ { false };

  std::vector<StatusCallback> status_callbacks_;
  std::vector<PhaseCallback> phase_callbacks_;
  std::vector<DevicesCallback> devices_callbacks_;
};

}  // namespace umbrella_guard
}  // namespace esphome
