#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>

#include "internal/model/payment_state.hpp"

namespace blueshare::model {

/*
  A settled (or settling) micropayment for one client device.

  Everything except status is fixed at creation.
*/
struct PaymentRecord {
  std::string                           device_id;
  std::string                           invoice;
  std::uint64_t                         amount_satoshi = 0;
  double                                amount_usd = 0.0;
  std::string                           payment_hash;
  std::chrono::system_clock::time_point created_at{};
  std::chrono::system_clock::time_point expiry{};
  PaymentState                          status = PaymentState::kPending;
};

// Keyed by device id.
using PaymentMap = std::map<std::string, PaymentRecord>;

} // namespace blueshare::model
