#pragma once

#include <string>
#include <utility>
#include <vector>

#include "presence_types.h"

namespace esphome {
namespace umbrella_guard {

// Devices seen during scan sessions whose name matches the configured prefix.
// Never persisted.
class DeviceRegistry {
 public:
  explicit DeviceRegistry(std::string name_prefix) : name_prefix_(std::move(name_prefix)) {}

  void set_name_prefix(const std::string& prefix) {
    name_prefix_ = prefix;
  }
  const std::string& get_name_prefix() const {
    return name_prefix_;
  }

  void clear();

  /**
   * @brief Records one advertisement
   * @return true if the sighting passed the name filter and was stored
   *
   * An already-known id keeps its original insertion position; only its name
   * and RSSI are refreshed.
   */
  bool upsert(const Sighting& sighting);

  // Strongest signal first; equal RSSI keeps insertion order
  std::vector<DiscoveredDevice> snapshot() const;

  const DiscoveredDevice* find(const std::string& id) const;
  size_t size() const {
    return devices_.size();
  }
  bool empty() const {
    return devices_.empty();
  }

  static std::string resolve_display_name(const Sighting& sighting);

 protected:
  std::string name_prefix_;
  std::vector<DiscoveredDevice> devices_;
  uint32_t next_seq_ { 0 };
};

}  // namespace umbrella_guard
}  // namespace esphome
