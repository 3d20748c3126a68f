#include "nimble_radio.h"

#ifdef USE_ESP32

#include <cstdio>
#include <cstring>

#include <host/util/util.h>

#include "esphome/core/log.h"

namespace esphome {
namespace umbrella_guard {

static const char* const TAG = "umbrella_guard.radio";

// Sightings beyond this are dropped until the main loop catches up. Connect and
// link events are always queued.
static constexpr size_t MAX_QUEUED_EVENTS = 48;
// Address and name caches are cleared wholesale past this size
static constexpr size_t MAX_KNOWN_PEERS = 64;

std::atomic<bool> NimbleRadio::host_synced_ { false };
std::atomic<uint32_t> NimbleRadio::sync_count_ { 0 };

//======================== Helpers ========================

static std::string addr_to_str(const ble_addr_t& a) {
  char buf[18];
  snprintf(buf, sizeof(buf), "%02X:%02X:%02X:%02X:%02X:%02X", a.val[5], a.val[4], a.val[3],
           a.val[2], a.val[1], a.val[0]);
  return std::string(buf);
}

// Parses "AA:BB:CC:DD:EE:FF" into a public address. Used only for ids that were
// persisted before this boot and have not been sighted yet.
static bool str_to_addr(const std::string& s, ble_addr_t& out) {
  unsigned int b[6];
  if (s.size() != 17 ||
      sscanf(s.c_str(), "%02X:%02X:%02X:%02X:%02X:%02X", &b[5], &b[4], &b[3], &b[2], &b[1],
             &b[0]) != 6) {
    return false;
  }
  out.type = BLE_ADDR_PUBLIC;
  for (int i = 0; i < 6; i++) out.val[i] = (uint8_t) b[i];
  return true;
}

//======================== Thread Safety: RAII Mutex Guard ========================
/*
Guards the event queue and the connection bookkeeping shared between the NimBLE
host task (GAP callbacks) and the ESPHome main task (Radio calls, process_events).
Copy data out under the lock, log after it is released.
*/
class MutexGuard {
 public:
  explicit MutexGuard(SemaphoreHandle_t mutex) : mutex_(mutex) {
    if (mutex_) {
      xSemaphoreTake(mutex_, portMAX_DELAY);
    }
  }

  ~MutexGuard() {
    if (mutex_) {
      xSemaphoreGive(mutex_);
    }
  }

  MutexGuard(const MutexGuard&) = delete;
  MutexGuard& operator=(const MutexGuard&) = delete;

 private:
  SemaphoreHandle_t mutex_;
};

//======================== Host lifecycle ========================

NimbleRadio::~NimbleRadio() {
  if (mutex_) {
    vSemaphoreDelete(mutex_);
    mutex_ = nullptr;
  }
}

bool NimbleRadio::init(const std::string& device_name) {
  if (host_started_) return true;

  mutex_ = xSemaphoreCreateMutex();
  if (!mutex_) {
    ESP_LOGE(TAG, "Failed to create radio mutex");
    return false;
  }

  esp_err_t err = nimble_port_init();
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "nimble_port_init failed (err=%d)", err);
    return false;
  }

  ble_hs_cfg.reset_cb = [](int reason) {
    host_synced_.store(false);
    ESP_LOGW(TAG, "NimBLE reset reason=%d", reason);
  };
  ble_hs_cfg.sync_cb = []() {
    int rc = ble_hs_util_ensure_addr(0);
    if (rc != 0) {
      ESP_LOGE(TAG, "No usable identity address (rc=%d)", rc);
      return;
    }
    host_synced_.store(true);
    sync_count_.fetch_add(1);
    ESP_LOGI(TAG, "NimBLE host synced");
  };

  ble_svc_gap_init();
  ble_svc_gap_device_name_set(device_name.c_str());

  nimble_port_freertos_init([](void*) {
    nimble_port_run();
    nimble_port_freertos_deinit();
    vTaskDelete(NULL);
  });

  host_started_ = true;
  return true;
}

void NimbleRadio::shutdown() {
  if (!host_started_) return;
  this->stop_scan();
  this->cancel_connect();

  uint16_t handle;
  {
    MutexGuard lock(mutex_);
    handle = conn_handle_;
    queue_.clear();
  }
  if (handle != BLE_HS_CONN_HANDLE_NONE) {
    int rc = ble_gap_terminate(handle, BLE_ERR_REM_USER_CONN_TERM);
    ESP_LOGD(TAG, "Terminate on shutdown rc=%d", rc);
  }
}

bool NimbleRadio::own_addr_type_(uint8_t* out) {
  if (!host_synced_.load()) {
    ESP_LOGW(TAG, "NimBLE host not synced");
    return false;
  }
  int rc = ble_hs_id_infer_auto(0, out);
  if (rc != 0) {
    ESP_LOGE(TAG, "ble_hs_id_infer_auto failed rc=%d", rc);
    return false;
  }
  return true;
}

//======================== Discovery ========================

bool NimbleRadio::start_scan(uint32_t duration_ms) {
  uint8_t own_addr_type;
  if (!this->own_addr_type_(&own_addr_type)) return false;

  if (ble_gap_disc_active()) {
    ble_gap_disc_cancel();
  }

  struct ble_gap_disc_params params {};
  params.passive = 0;            // scan responses usually carry the name
  params.filter_duplicates = 0;  // every report refreshes RSSI
  params.itvl = 0;               // stack defaults
  params.window = 0;

  {
    MutexGuard lock(mutex_);
    scanning_ = true;
  }
  int rc = ble_gap_disc(own_addr_type, (int32_t) duration_ms, &params,
                        NimbleRadio::gap_event_handler, this);
  if (rc != 0) {
    {
      MutexGuard lock(mutex_);
      scanning_ = false;
    }
    ESP_LOGE(TAG, "ble_gap_disc failed rc=%d", rc);
    return false;
  }
  ESP_LOGD(TAG, "Discovery started for %u ms", (unsigned) duration_ms);
  return true;
}

void NimbleRadio::stop_scan() {
  bool was_scanning;
  {
    MutexGuard lock(mutex_);
    was_scanning = scanning_;
    scanning_ = false;
  }
  if (!ble_gap_disc_active()) return;

  int rc = ble_gap_disc_cancel();
  if (rc != 0 && rc != BLE_HS_EALREADY) {
    ESP_LOGW(TAG, "ble_gap_disc_cancel rc=%d", rc);
  } else if (was_scanning) {
    ESP_LOGD(TAG, "Discovery stopped");
  }
}

bool NimbleRadio::is_scanning() {
  MutexGuard lock(mutex_);
  return scanning_;
}

//======================== Connections ========================

bool NimbleRadio::connect(const std::string& id, uint32_t timeout_ms) {
  ble_addr_t addr {};
  bool known;
  {
    MutexGuard lock(mutex_);
    auto it = known_addrs_.find(id);
    known = it != known_addrs_.end();
    if (known) addr = it->second;
  }
  if (!known && !str_to_addr(id, addr)) {
    ESP_LOGW(TAG, "Cannot connect: malformed address '%s'", id.c_str());
    return false;
  }

  uint8_t own_addr_type;
  if (!this->own_addr_type_(&own_addr_type)) return false;

  // Controllers reject connection creation while discovery is running
  if (ble_gap_disc_active()) {
    ble_gap_disc_cancel();
  }

  {
    MutexGuard lock(mutex_);
    pending_id_ = id;
  }

  int rc = ble_gap_connect(own_addr_type, &addr, (int32_t) timeout_ms, nullptr,
                           NimbleRadio::gap_event_handler, this);
  if (rc != 0) {
    {
      MutexGuard lock(mutex_);
      pending_id_.clear();
    }
    ESP_LOGW(TAG, "ble_gap_connect to %s failed rc=%d", id.c_str(), rc);
    return false;
  }

  ESP_LOGI(TAG, "Connecting to %s (type=%u)", id.c_str(), addr.type);
  return true;
}

void NimbleRadio::cancel_connect() {
  if (!ble_gap_conn_active()) return;
  int rc = ble_gap_conn_cancel();
  if (rc != 0 && rc != BLE_HS_EALREADY) {
    ESP_LOGW(TAG, "ble_gap_conn_cancel rc=%d", rc);
  }
}

void NimbleRadio::disconnect(const std::string& id) {
  uint16_t handle = BLE_HS_CONN_HANDLE_NONE;
  {
    MutexGuard lock(mutex_);
    if (conn_id_ == id) handle = conn_handle_;
  }
  if (handle == BLE_HS_CONN_HANDLE_NONE) {
    ESP_LOGD(TAG, "No open link to %s", id.c_str());
    return;
  }

  int rc = ble_gap_terminate(handle, BLE_ERR_REM_USER_CONN_TERM);
  if (rc != 0 && rc != BLE_HS_ENOTCONN) {
    ESP_LOGW(TAG, "ble_gap_terminate(%u) rc=%d", handle, rc);
  }
}

//======================== Event hand-off ========================

void NimbleRadio::push_event_locked_(RadioEvent&& event) {
  if (event.type == EventType::SIGHTING && queue_.size() >= MAX_QUEUED_EVENTS) {
    dropped_events_++;
    return;
  }
  queue_.push_back(std::move(event));
}

void NimbleRadio::process_events() {
  std::deque<RadioEvent> batch;
  uint32_t dropped;
  {
    MutexGuard lock(mutex_);
    batch.swap(queue_);
    dropped = dropped_events_;
    dropped_events_ = 0;
  }
  if (dropped > 0) {
    ESP_LOGV(TAG, "Dropped %u sightings (queue full)", (unsigned) dropped);
  }
  if (listener_ == nullptr) return;

  for (auto& event : batch) {
    switch (event.type) {
      case EventType::SIGHTING:
        listener_->on_sighting(event.sighting);
        break;
      case EventType::CONNECT_RESULT:
        listener_->on_connect_result(event.id, event.status == 0, event.status);
        break;
      case EventType::LINK_DOWN:
        listener_->on_link_state(event.id, LinkState::DISCONNECTED);
        break;
    }
  }
}

//======================== GAP event handlers ========================

/**
 * @brief Handles BLE_GAP_EVENT_DISC - one advertising or scan-response report
 *
 * Runs on the NimBLE task. Names from scan responses are cached so that a
 * later nameless advertisement from the same address still reports one.
 */
int handle_gap_disc(NimbleRadio* self, struct ble_gap_event* ev) {
  const struct ble_gap_disc_desc& disc = ev->disc;

  std::string adv_name;
  struct ble_hs_adv_fields fields {};
  if (ble_hs_adv_parse_fields(&fields, disc.data, disc.length_data) == 0 &&
      fields.name != nullptr && fields.name_len > 0) {
    adv_name.assign(reinterpret_cast<const char*>(fields.name), fields.name_len);
  }

  NimbleRadio::RadioEvent out;
  out.type = NimbleRadio::EventType::SIGHTING;
  out.sighting.id = addr_to_str(disc.addr);
  out.sighting.advertised_name = adv_name;
  out.sighting.rssi = disc.rssi;

  MutexGuard lock(self->mutex_);
  if (!self->scanning_) return 0;

  if (self->known_addrs_.size() >= MAX_KNOWN_PEERS &&
      self->known_addrs_.find(out.sighting.id) == self->known_addrs_.end()) {
    self->known_addrs_.clear();
    self->names_.clear();
  }
  self->known_addrs_[out.sighting.id] = disc.addr;
  if (!adv_name.empty()) {
    self->names_[out.sighting.id] = adv_name;
  } else {
    auto it = self->names_.find(out.sighting.id);
    if (it != self->names_.end()) out.sighting.platform_name = it->second;
  }
  self->push_event_locked_(std::move(out));
  return 0;
}

/**
 * @brief Handles BLE_GAP_EVENT_CONNECT - outcome of ble_gap_connect()
 *
 * A cancelled or timed-out attempt arrives here with a non-zero status.
 */
int handle_gap_connect(NimbleRadio* self, struct ble_gap_event* ev) {
  const int status = ev->connect.status;
  std::string peer;
  if (status == 0) {
    struct ble_gap_conn_desc d {};
    if (ble_gap_conn_find(ev->connect.conn_handle, &d) == 0) {
      peer = addr_to_str(d.peer_ota_addr);
    }
  }

  NimbleRadio::RadioEvent out;
  out.type = NimbleRadio::EventType::CONNECT_RESULT;
  out.status = status;
  {
    MutexGuard lock(self->mutex_);
    out.id = self->pending_id_.empty() ? peer : self->pending_id_;
    self->pending_id_.clear();
    if (status == 0) {
      self->conn_handle_ = ev->connect.conn_handle;
      self->conn_id_ = out.id;
    }
    self->push_event_locked_(NimbleRadio::RadioEvent(out));
  }

  if (status == 0) {
    ESP_LOGI(TAG, "Connection established with %s (handle=%u)", out.id.c_str(),
             ev->connect.conn_handle);
  } else {
    ESP_LOGW(TAG, "Connection to %s failed: status=%d (0x%02X)", out.id.c_str(), status, status);
  }
  return 0;
}

/**
 * @brief Handles BLE_GAP_EVENT_DISCONNECT - link to the umbrella went away
 */
int handle_gap_disconnect(NimbleRadio* self, struct ble_gap_event* ev) {
  NimbleRadio::RadioEvent out;
  out.type = NimbleRadio::EventType::LINK_DOWN;
  out.status = ev->disconnect.reason;
  {
    MutexGuard lock(self->mutex_);
    if (ev->disconnect.conn.conn_handle == self->conn_handle_) {
      out.id = self->conn_id_;
      self->conn_handle_ = BLE_HS_CONN_HANDLE_NONE;
      self->conn_id_.clear();
    }
  }
  if (out.id.empty()) out.id = addr_to_str(ev->disconnect.conn.peer_ota_addr);

  ESP_LOGI(TAG, "Disconnect from %s reason=%d (0x%02x)", out.id.c_str(), ev->disconnect.reason,
           ev->disconnect.reason);

  MutexGuard lock(self->mutex_);
  self->push_event_locked_(std::move(out));
  return 0;
}

int NimbleRadio::gap_event_handler(struct ble_gap_event* event, void* arg) {
  auto* self = static_cast<NimbleRadio*>(arg);
  switch (event->type) {
    case BLE_GAP_EVENT_DISC:
      return handle_gap_disc(self, event);
    case BLE_GAP_EVENT_DISC_COMPLETE: {
      {
        MutexGuard lock(self->mutex_);
        self->scanning_ = false;
      }
      ESP_LOGD(TAG, "Discovery complete reason=%d", event->disc_complete.reason);
      return 0;
    }
    case BLE_GAP_EVENT_CONNECT:
      return handle_gap_connect(self, event);
    case BLE_GAP_EVENT_DISCONNECT:
      return handle_gap_disconnect(self, event);
    default:
      ESP_LOGV(TAG, "Unhandled GAP event type=%d", event->type);
      return 0;
  }
}

}  // namespace umbrella_guard
}  // namespace esphome

#endif  // USE_ESP32
