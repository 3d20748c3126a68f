#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace esphome {
namespace umbrella_guard {

//======================== Core data types ========================

// Raw advertisement as reported by the radio during a scan session
struct Sighting {
  std::string id;               // "AA:BB:CC:DD:EE:FF", stable per peripheral
  std::string advertised_name;  // name carried in this advertisement (may be empty)
  std::string platform_name;    // name the host last learned for this address (may be empty)
  int8_t rssi { 0 };
};

struct DiscoveredDevice {
  std::string id;
  std::string display_name;
  int8_t rssi { 0 };
  uint32_t seq { 0 };  // insertion order, tie-breaker for equal RSSI
};

enum class PresencePhase : uint8_t {
  IDLE,
  SCANNING,
  CONNECTING,
  CONNECTED,
  LOST,
};

struct PresenceState {
  PresencePhase phase { PresencePhase::IDLE };
  std::string active_device_id;
  bool lost_mode_active { false };
};

enum class PresenceError : uint8_t {
  NONE,
  PERMISSION_DENIED,
  RADIO_OFF,
  SCAN_FINISHED,  // informational, not a failure
  CONNECT_FAILURE,
  LOST,           // informational, drives the loops
};

enum class LinkState : uint8_t {
  CONNECTED,
  DISCONNECTED,
};

enum class AlertUrgency : uint8_t {
  NORMAL,
  HIGH,  // sound + vibration class
};

struct Alert {
  std::string title;
  std::string body;
  AlertUrgency urgency { AlertUrgency::HIGH };
};

struct CapabilitySet {
  bool scan { true };
  bool connect { true };
  bool location { true };
  bool notify { true };
};

struct CapabilityReport {
  bool scan_granted { false };
  bool connect_granted { false };
  bool location_granted { false };
  bool notify_granted { false };
  bool radio_on { false };
};

// Timings default to the reference behaviour; YAML may override every value
struct PresenceConfig {
  std::string name_prefix { "Smart Umbrella" };
  std::string alert_title { "SmartShield Alert" };
  uint32_t manual_scan_duration_ms { 10000 };
  uint32_t auto_reconnect_scan_duration_ms { 6000 };
  uint32_t reconnect_scan_duration_ms { 4000 };
  uint32_t reconnect_interval_ms { 3000 };
  uint32_t alert_interval_ms { 3000 };
  uint32_t connect_timeout_ms { 10000 };
  uint32_t connect_guard_margin_ms { 1000 };
};

const char* phase_to_string(PresencePhase phase);
const char* error_to_string(PresenceError error);

//======================== Collaborator interfaces ========================

// Receives radio events. Implementations of Radio must deliver these on the
// controller's thread only.
class RadioListener {
 public:
  virtual ~RadioListener() = default;
  virtual void on_sighting(const Sighting& sighting) = 0;
  virtual void on_connect_result(const std::string& id, bool success, int status) = 0;
  virtual void on_link_state(const std::string& id, LinkState state) = 0;
};

class Radio {
 public:
  virtual ~Radio() = default;
  virtual void set_listener(RadioListener* listener) = 0;
  // Returns false if the scan could not be started
  virtual bool start_scan(uint32_t duration_ms) = 0;
  virtual void stop_scan() = 0;
  // Returns false if the request was rejected immediately; otherwise the result
  // arrives later through RadioListener::on_connect_result
  virtual bool connect(const std::string& id, uint32_t timeout_ms) = 0;
  virtual void cancel_connect() = 0;
  virtual void disconnect(const std::string& id) = 0;
};

class BondStore {
 public:
  virtual ~BondStore() = default;
  virtual bool load(std::string& id_out) = 0;
  virtual bool save(const std::string& id) = 0;
  virtual bool erase() = 0;
};

class AlertSink {
 public:
  virtual ~AlertSink() = default;
  virtual void show_alert(const Alert& alert) = 0;
  virtual void cancel_all_alerts() = 0;
};

class CapabilityGate {
 public:
  virtual ~CapabilityGate() = default;
  virtual void request(const CapabilitySet& wanted,
                       std::function<void(const CapabilityReport&)>&& done) = 0;
};

// Named, cancellable tasks. Scheduling a name that is already pending replaces it.
class TimerService {
 public:
  virtual ~TimerService() = default;
  virtual void schedule_interval(const std::string& name, uint32_t interval_ms,
                                 std::function<void()>&& f) = 0;
  virtual void schedule_timeout(const std::string& name, uint32_t delay_ms,
                                std::function<void()>&& f) = 0;
  virtual bool cancel_task(const std::string& name) = 0;
};

}  // namespace umbrella_guard
}  // namespace esphome
