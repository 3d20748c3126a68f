#include "nvs_bond_store.h"

#ifdef USE_ESP32

#include <nvs.h>
#include <nvs_flash.h>

#include "esphome/core/log.h"

namespace esphome {
namespace umbrella_guard {

static const char* const TAG = "umbrella_guard.store";

bool NvsBondStore::init() {
  esp_err_t err = nvs_flash_init();
  if (err == ESP_ERR_NVS_NO_FREE_PAGES || err == ESP_ERR_NVS_NEW_VERSION_FOUND) {
    ESP_LOGW(TAG, "NVS full or version mismatch - erasing");
    nvs_flash_erase();
    err = nvs_flash_init();
  }
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "nvs_flash_init failed (err=%d) - saved umbrella will not persist", err);
    ready_ = false;
    return false;
  }
  ready_ = true;
  return true;
}

bool NvsBondStore::load(std::string& id_out) {
  if (cache_valid_) {
    if (cache_.empty()) return false;
    id_out = cache_;
    return true;
  }
  if (!ready_) return false;

  nvs_handle_t handle;
  esp_err_t err = nvs_open(NAMESPACE, NVS_READONLY, &handle);
  if (err == ESP_ERR_NVS_NOT_FOUND) {
    // Namespace is created on first write
    cache_.clear();
    cache_valid_ = true;
    return false;
  }
  if (err != ESP_OK) {
    ESP_LOGW(TAG, "nvs_open failed (err=%d)", err);
    return false;
  }

  size_t len = 0;
  err = nvs_get_str(handle, KEY, nullptr, &len);
  if (err == ESP_ERR_NVS_NOT_FOUND) {
    nvs_close(handle);
    cache_.clear();
    cache_valid_ = true;
    return false;
  }
  if (err != ESP_OK || len <= 1 || len > MAX_ID_LEN + 1) {
    ESP_LOGW(TAG, "Ignoring stored id (err=%d len=%u)", err, (unsigned) len);
    nvs_close(handle);
    return false;
  }

  std::string buf(len, '\0');
  err = nvs_get_str(handle, KEY, &buf[0], &len);
  nvs_close(handle);
  if (err != ESP_OK) {
    ESP_LOGW(TAG, "nvs_get_str failed (err=%d)", err);
    return false;
  }
  buf.resize(len - 1);

  cache_ = buf;
  cache_valid_ = true;
  id_out = cache_;
  ESP_LOGD(TAG, "Loaded saved umbrella %s", cache_.c_str());
  return true;
}

bool NvsBondStore::save(const std::string& id) {
  if (id.empty() || id.size() > MAX_ID_LEN) {
    ESP_LOGW(TAG, "Refusing to save id of length %u", (unsigned) id.size());
    return false;
  }
  if (cache_valid_ && cache_ == id) return true;
  if (!ready_) return false;

  nvs_handle_t handle;
  esp_err_t err = nvs_open(NAMESPACE, NVS_READWRITE, &handle);
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "nvs_open for write failed (err=%d)", err);
    return false;
  }
  err = nvs_set_str(handle, KEY, id.c_str());
  if (err == ESP_OK) {
    err = nvs_commit(handle);
  }
  nvs_close(handle);
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "Saving umbrella id failed (err=%d)", err);
    cache_valid_ = false;
    return false;
  }

  cache_ = id;
  cache_valid_ = true;
  ESP_LOGI(TAG, "Saved umbrella %s", id.c_str());
  return true;
}

bool NvsBondStore::erase() {
  cache_.clear();
  cache_valid_ = true;
  if (!ready_) return false;

  nvs_handle_t handle;
  esp_err_t err = nvs_open(NAMESPACE, NVS_READWRITE, &handle);
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "nvs_open for erase failed (err=%d)", err);
    cache_valid_ = false;
    return false;
  }
  err = nvs_erase_key(handle, KEY);
  if (err == ESP_ERR_NVS_NOT_FOUND) {
    err = ESP_OK;
  } else if (err == ESP_OK) {
    err = nvs_commit(handle);
  }
  nvs_close(handle);
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "Clearing saved umbrella failed (err=%d)", err);
    cache_valid_ = false;
    return false;
  }
  ESP_LOGI(TAG, "Saved umbrella cleared");
  return true;
}

}  // namespace umbrella_guard
}  // namespace esphome

#endif  // USE_ESP32
