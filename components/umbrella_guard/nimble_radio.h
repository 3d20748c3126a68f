#pragma once

#include <atomic>
#include <deque>
#include <map>
#include <string>

#include "presence_types.h"

// ESP32-only - requires the NimBLE host in the central/observer role
#ifdef USE_ESP32
#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>
#include <host/ble_gap.h>
#include <host/ble_hs.h>
#include <nimble/nimble_port.h>
#include <nimble/nimble_port_freertos.h>
#include <services/gap/ble_svc_gap.h>
#else
#error "Umbrella Guard requires ESP32 platform with Bluetooth support"
#endif

namespace esphome {
namespace umbrella_guard {

class NimbleRadio;

// Free-function helpers (external linkage). Definitions live in the .cpp.
int handle_gap_disc(NimbleRadio* self, struct ble_gap_event* ev);
int handle_gap_connect(NimbleRadio* self, struct ble_gap_event* ev);
int handle_gap_disconnect(NimbleRadio* self, struct ble_gap_event* ev);

/**
 * Radio layer on top of the NimBLE host.
 *
 * GAP callbacks run on the NimBLE host task and only enqueue events.
 * process_events() hands them to the listener on the ESPHome main task, so the
 * presence controller never sees a second thread.
 */
class NimbleRadio : public Radio {
 public:
  NimbleRadio() = default;
  ~NimbleRadio() override;

  NimbleRadio(const NimbleRadio&) = delete;
  NimbleRadio& operator=(const NimbleRadio&) = delete;

  friend int handle_gap_disc(NimbleRadio* self, struct ble_gap_event* ev);
  friend int handle_gap_connect(NimbleRadio* self, struct ble_gap_event* ev);
  friend int handle_gap_disconnect(NimbleRadio* self, struct ble_gap_event* ev);

  // Brings up the NimBLE host and its FreeRTOS task
  bool init(const std::string& device_name);
  void shutdown();

  // Radio
  void set_listener(RadioListener* listener) override {
    listener_ = listener;
  }
  bool start_scan(uint32_t duration_ms) override;
  void stop_scan() override;
  bool connect(const std::string& id, uint32_t timeout_ms) override;
  void cancel_connect() override;
  void disconnect(const std::string& id) override;

  // Main task only
  void process_events();

  bool is_host_synced() const {
    return host_synced_.load();
  }
  uint32_t get_sync_count() const {
    return sync_count_.load();
  }
  bool is_scanning();
  uint32_t get_dropped_events() const {
    return dropped_events_;
  }

  static int gap_event_handler(struct ble_gap_event* event, void* arg);

 protected:
  enum class EventType : uint8_t {
    SIGHTING,
    CONNECT_RESULT,
    LINK_DOWN,
  };

  struct RadioEvent {
    EventType type { EventType::SIGHTING };
    Sighting sighting;
    std::string id;
    int status { 0 };
  };

  // Caller holds mutex_
  void push_event_locked_(RadioEvent&& event);
  bool own_addr_type_(uint8_t* out);

  // Host state, written from NimBLE callbacks
  static std::atomic<bool> host_synced_;
  static std::atomic<uint32_t> sync_count_;

  RadioListener* listener_ { nullptr };
  bool host_started_ { false };

  // Protected by mutex_: queue_, known_addrs_, names_, pending_id_, conn_handle_,
  // conn_id_, scanning_, dropped_events_
  SemaphoreHandle_t mutex_ { nullptr };
  std::deque<RadioEvent> queue_;
  std::map<std::string, ble_addr_t> known_addrs_;
  std::map<std::string, std::string> names_;  // last non-empty name per address
  std::string pending_id_;
  uint16_t conn_handle_ { BLE_HS_CONN_HANDLE_NONE };
  std::string conn_id_;
  bool scanning_ { false };
  uint32_t dropped_events_ { 0 };
};

}  // namespace umbrella_guard
}  // namespace esphome
