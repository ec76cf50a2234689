#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "internal/model/payment.hpp"
#include "internal/model/session.hpp"

namespace blueshare::payment {

/*
  Settles every client's balance into a payment record.

  Only clients with a strictly positive balance are paid. Settlement is
  instantaneous: a record is created authorized, moves through processing
  and ends settled; the device's payment status mirrors it.
*/
class PaymentSettler {
 public:
  static constexpr double        kUsdPerBtc            = 40000.0;
  static constexpr std::uint64_t kSatoshiPerBtc        = 100000000ULL;
  static constexpr std::size_t   kInvoiceHashPrefixLen = 10;
  static constexpr std::chrono::minutes kInvoiceExpiry{10};

  blueshare::model::PaymentMap Settle(blueshare::model::Session& session) const;

  // floor(usd / kUsdPerBtc * kSatoshiPerBtc)
  static std::uint64_t UsdToSatoshi(double usd);
  static double        SatoshiToUsd(std::uint64_t satoshi);

  static std::string MakeInvoice(std::uint64_t amount_satoshi, const std::string& payment_hash);

  blueshare::model::PaymentRecord CreateRecord(const std::string& device_id, double amount_usd) const;
};

} // namespace blueshare::payment
