#pragma once

#include <string>

#include "presence_types.h"

namespace esphome {
namespace umbrella_guard {

/**
 * Saved-umbrella id in NVS flash.
 *
 * Reads go through an in-memory copy after the first successful load, so the
 * reconnect loop does not hit flash every tick. Writes of an unchanged id are
 * skipped.
 */
class NvsBondStore : public BondStore {
 public:
  static constexpr const char* NAMESPACE = "umbrella_guard";
  static constexpr const char* KEY = "saved_umbrella";
  static constexpr size_t MAX_ID_LEN = 64;

  // Initializes the NVS partition, erasing it on layout or version mismatch
  bool init();

  bool load(std::string& id_out) override;
  bool save(const std::string& id) override;
  bool erase() override;

  bool is_ready() const {
    return ready_;
  }

 protected:
  bool ready_ { false };
  bool cache_valid_ { false };
  std::string cache_;  // empty when nothing is saved
};

}  // namespace umbrella_guard
}  // namespace esphome
