#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/consent.hpp"
#include "internal/model/device_role.hpp"
#include "internal/model/payment_state.hpp"

namespace blueshare::model {

/*
  A discovered device taking part in one session.

  Identity and role are fixed at construction. The remaining fields are
  written by the pipeline stages, each at most once per stage.
*/
class Device {
 public:
  Device(std::string id, std::string name, DeviceRole role);

  const std::string& id() const {
    return id_;
  }
  const std::string& name() const {
    return name_;
  }
  DeviceRole role() const {
    return role_;
  }

  double MegabytesUsed() const;

  // Radio link, as reported by the transport.
  std::int32_t  rssi_dbm = 0;
  std::uint16_t mtu      = 512;

  std::uint64_t bytes_sent     = 0;
  std::uint64_t bytes_received = 0;

  // Advertised uplink capacity. Only hosts contribute it.
  double bandwidth_mbps = 0.0;

  double       balance_usd    = 0.0;
  PaymentState payment_status = PaymentState::kPending;

  std::optional<ConsentRecord> consent;

  std::chrono::system_clock::time_point last_seen{};

 private:
  std::string id_;
  std::string name_;
  DeviceRole  role_;
};

} // namespace blueshare::model
