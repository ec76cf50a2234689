#include "internal/registry/device_registry.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <unordered_set>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace blueshare::registry {

using blueshare::model::Device;
using blueshare::model::DeviceRole;

namespace {

std::string Lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

} // namespace

DeviceRole DeviceRegistry::ParseRole(const std::string& value) {
  const auto role = Lower(value);
  if (role == "host") {
    return DeviceRole::kHost;
  }
  if (role == "client") {
    return DeviceRole::kClient;
  }
  if (role == "relay") {
    return DeviceRole::kRelay;
  }
  if (role == "observer") {
    return DeviceRole::kObserver;
  }
  throw blueshare::util::InvalidArgument("unknown device role '" + value + "'");
}

std::vector<Device> DeviceRegistry::FromConfig(const blueshare::runtime::config::SessionConfig& config) {
  if (static_cast<std::size_t>(config.devices_size()) > kMaxDevices) {
    throw blueshare::util::ResourceExhausted("session lists " + std::to_string(config.devices_size()) + " devices, limit is " +
                                             std::to_string(kMaxDevices));
  }

  const auto                      now = blueshare::util::Now();
  std::unordered_set<std::string> seen;
  std::vector<Device>             devices;
  devices.reserve(config.devices_size());

  for (const auto& entry : config.devices()) {
    if (entry.id().empty()) {
      throw blueshare::util::InvalidArgument("device entry without id");
    }
    if (!seen.insert(entry.id()).second) {
      throw blueshare::util::AlreadyExists("duplicate device id '" + entry.id() + "'");
    }
    if (entry.mtu() > std::numeric_limits<std::uint16_t>::max()) {
      throw blueshare::util::InvalidArgument("device '" + entry.id() + "' mtu out of range");
    }

    Device device(entry.id(), entry.name().empty() ? entry.id() : entry.name(), ParseRole(entry.role()));
    device.rssi_dbm       = entry.rssi_dbm();
    device.mtu            = entry.mtu() == 0 ? 512 : static_cast<std::uint16_t>(entry.mtu());
    device.bytes_sent     = entry.bytes_sent();
    device.bytes_received = entry.bytes_received();
    device.bandwidth_mbps = entry.bandwidth_mbps();
    device.last_seen      = now;

    devices.push_back(std::move(device));
  }

  return devices;
}

} // namespace blueshare::registry
