#include "internal/payment/payment_settler.hpp"

#include <atomic>
#include <cmath>
#include <iomanip>
#include <sstream>

#include "internal/crypto/sha256.hpp"
#include "internal/model/device_role.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace blueshare::payment {

using blueshare::model::PaymentRecord;
using blueshare::model::PaymentState;

namespace {

// Distinguishes equal amounts created within the same clock tick.
std::atomic<std::uint64_t> g_payment_sequence{0};

std::string HashInput(double amount_usd, std::uint64_t created_ns, std::uint64_t sequence) {
  std::ostringstream out;
  out << std::setprecision(17) << amount_usd << ':' << created_ns << ':' << sequence;
  return out.str();
}

} // namespace

std::uint64_t PaymentSettler::UsdToSatoshi(double usd) {
  if (!(usd >= 0.0) || !std::isfinite(usd)) {
    throw blueshare::util::InvalidArgument("payment amount must be a finite non-negative USD value");
  }
  return static_cast<std::uint64_t>(std::floor(usd / kUsdPerBtc * static_cast<double>(kSatoshiPerBtc)));
}

double PaymentSettler::SatoshiToUsd(std::uint64_t satoshi) {
  return static_cast<double>(satoshi) / static_cast<double>(kSatoshiPerBtc) * kUsdPerBtc;
}

std::string PaymentSettler::MakeInvoice(std::uint64_t amount_satoshi, const std::string& payment_hash) {
  return "lnbc" + std::to_string(amount_satoshi) + "u1p" + payment_hash.substr(0, kInvoiceHashPrefixLen);
}

PaymentRecord PaymentSettler::CreateRecord(const std::string& device_id, double amount_usd) const {
  PaymentRecord record;
  record.device_id      = device_id;
  record.amount_usd     = amount_usd;
  record.amount_satoshi = UsdToSatoshi(amount_usd);
  record.created_at     = blueshare::util::Now();
  record.payment_hash   = blueshare::crypto::Sha256Hex(
      HashInput(amount_usd, blueshare::util::ToUnixNanos(record.created_at), g_payment_sequence.fetch_add(1)));
  record.invoice = MakeInvoice(record.amount_satoshi, record.payment_hash);
  record.expiry  = record.created_at + kInvoiceExpiry;
  blueshare::model::Transition(record.status, PaymentState::kAuthorized);
  return record;
}

blueshare::model::PaymentMap PaymentSettler::Settle(blueshare::model::Session& session) const {
  blueshare::model::PaymentMap payments;

  for (auto& device : session.devices()) {
    if (device.role() != blueshare::model::DeviceRole::kClient || !(device.balance_usd > 0.0)) {
      continue;
    }

    auto record = CreateRecord(device.id(), device.balance_usd);
    blueshare::model::Transition(record.status, PaymentState::kProcessing);
    blueshare::model::Transition(record.status, PaymentState::kSettled);

    device.payment_status = record.status;
    payments.emplace(device.id(), std::move(record));
  }

  return payments;
}

} // namespace blueshare::payment
