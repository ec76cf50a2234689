#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/model/device.hpp"

namespace blueshare::registry {

/*
  Turns the device list reported by the radio transport (here: the session
  section of the runtime config) into Device records for a new session.
*/
class DeviceRegistry {
 public:
  static constexpr std::size_t kMaxDevices = 50;

  static std::vector<blueshare::model::Device> FromConfig(const blueshare::runtime::config::SessionConfig& config);

  static blueshare::model::DeviceRole ParseRole(const std::string& value);
};

} // namespace blueshare::registry
