#pragma once

#include <cstdint>
#include <string_view>

namespace blueshare::model {

enum class DeviceRole : std::uint8_t {
  kHost = 0,      // shares its uplink
  kClient = 1,    // consumes the shared uplink
  kRelay = 2,     // forwards traffic
  kObserver = 3,  // monitoring only
};

constexpr std::string_view ToString(DeviceRole role) {
  switch (role) {
    case DeviceRole::kHost:
      return "host";
    case DeviceRole::kClient:
      return "client";
    case DeviceRole::kRelay:
      return "relay";
    case DeviceRole::kObserver:
    default:
      return "observer";
  }
}

} // namespace blueshare::model
