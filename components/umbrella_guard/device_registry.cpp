#include "device_registry.h"

#include <algorithm>

namespace esphome {
namespace umbrella_guard {

static constexpr char FALLBACK_NAME[] = "Unknown";

std::string DeviceRegistry::resolve_display_name(const Sighting& sighting) {
  if (!sighting.advertised_name.empty()) return sighting.advertised_name;
  if (!sighting.platform_name.empty()) return sighting.platform_name;
  return FALLBACK_NAME;
}

void DeviceRegistry::clear() {
  devices_.clear();
  next_seq_ = 0;
}

bool DeviceRegistry::upsert(const Sighting& sighting) {
  std::string name = resolve_display_name(sighting);
  if (name.compare(0, name_prefix_.size(), name_prefix_) != 0) return false;

  for (auto& dev : devices_) {
    if (dev.id == sighting.id) {
      dev.display_name = std::move(name);
      dev.rssi = sighting.rssi;
      return true;
    }
  }

  DiscoveredDevice dev;
  dev.id = sighting.id;
  dev.display_name = std::move(name);
  dev.rssi = sighting.rssi;
  dev.seq = next_seq_++;
  devices_.push_back(std::move(dev));
  return true;
}

std::vector<DiscoveredDevice> DeviceRegistry::snapshot() const {
  // devices_ is kept in insertion order, so a stable sort preserves it for ties
  std::vector<DiscoveredDevice> out(devices_);
  std::stable_sort(out.begin(), out.end(), [](const DiscoveredDevice& a, const DiscoveredDevice& b) {
    return a.rssi > b.rssi;
  });
  return out;
}

const DiscoveredDevice* DeviceRegistry::find(const std::string& id) const {
  for (const auto& dev : devices_) {
    if (dev.id == id) return &dev;
  }
  return nullptr;
}

}  // namespace umbrella_guard
}  // namespace esphome
