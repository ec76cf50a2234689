#include "internal/payment/payment_settler.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <set>
#include <string>

#include "internal/model/payment_state.hpp"
#include "internal/util/errors.hpp"

namespace {

using blueshare::model::Device;
using blueshare::model::DeviceRole;
using blueshare::model::PaymentState;
using blueshare::model::Session;
using blueshare::payment::PaymentSettler;

Device MakeDevice(const char* id, DeviceRole role, double balance_usd) {
  Device device(id, id, role);
  device.balance_usd = balance_usd;
  return device;
}

bool IsLowerHex(const std::string& value) {
  for (char c : value) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
      return false;
    }
  }
  return true;
}

void TestSatoshiConversionFloors() {
  assert(PaymentSettler::UsdToSatoshi(0.0) == 0);
  assert(PaymentSettler::UsdToSatoshi(40000.0) == 100000000ULL);
  assert(PaymentSettler::UsdToSatoshi(0.001786125) == 4);
  assert(PaymentSettler::UsdToSatoshi(0.0005683125) == 1);
  assert(PaymentSettler::UsdToSatoshi(0.0001) == 0);
  assert(PaymentSettler::SatoshiToUsd(100000000ULL) == 40000.0);
}

void TestRoundTripWithinOneSatoshi() {
  const double one_satoshi_usd = PaymentSettler::SatoshiToUsd(1);
  for (double usd : {0.001786125, 0.0005683125, 0.25, 12.34, 999.99}) {
    const double back = PaymentSettler::SatoshiToUsd(PaymentSettler::UsdToSatoshi(usd));
    assert(std::fabs(usd - back) < one_satoshi_usd);
  }
}

void TestInvalidAmountsRejected() {
  for (double bad : {-0.01, std::numeric_limits<double>::quiet_NaN(), std::numeric_limits<double>::infinity()}) {
    bool threw = false;
    try {
      (void)PaymentSettler::UsdToSatoshi(bad);
    } catch (const blueshare::util::InvalidArgument&) {
      threw = true;
    }
    assert(threw);
  }
}

void TestInvoiceFormat() {
  assert(PaymentSettler::MakeInvoice(4, "0123456789abcdef") == "lnbc4u1p0123456789");
  assert(PaymentSettler::MakeInvoice(0, "abc") == "lnbc0u1pabc");
}

void TestCreateRecord() {
  const auto record = PaymentSettler{}.CreateRecord("bob", 0.001786125);

  assert(record.device_id == "bob");
  assert(record.amount_satoshi == 4);
  assert(record.amount_usd == 0.001786125);
  assert(record.payment_hash.size() == 64);
  assert(IsLowerHex(record.payment_hash));
  assert(record.invoice == "lnbc4u1p" + record.payment_hash.substr(0, 10));
  assert(record.expiry - record.created_at == PaymentSettler::kInvoiceExpiry);
  assert(record.status == PaymentState::kAuthorized);
}

void TestEqualAmountsGetDistinctHashes() {
  PaymentSettler      settler;
  std::set<std::string> hashes;
  for (int i = 0; i < 32; ++i) {
    hashes.insert(settler.CreateRecord("same", 0.5).payment_hash);
  }
  assert(hashes.size() == 32);
}

void TestSettleOnlyPaysClientsWithBalance() {
  Session session("pay-1", {MakeDevice("host", DeviceRole::kHost, 0.001136625),
                            MakeDevice("bob", DeviceRole::kClient, 0.001786125),
                            MakeDevice("carol", DeviceRole::kClient, 0.0005683125),
                            MakeDevice("idle", DeviceRole::kClient, 0.0),
                            MakeDevice("dave", DeviceRole::kRelay, 0.000487125),
                            MakeDevice("eve", DeviceRole::kObserver, 0.2)});

  const auto payments = PaymentSettler{}.Settle(session);

  assert(payments.size() == 2);
  assert(payments.at("bob").amount_satoshi == 4);
  assert(payments.at("carol").amount_satoshi == 1);
  assert(payments.at("bob").status == PaymentState::kSettled);
  assert(payments.at("carol").status == PaymentState::kSettled);
  assert(payments.at("bob").payment_hash != payments.at("carol").payment_hash);

  const auto& devices = session.devices();
  assert(devices[0].payment_status == PaymentState::kPending);
  assert(devices[1].payment_status == PaymentState::kSettled);
  assert(devices[2].payment_status == PaymentState::kSettled);
  assert(devices[3].payment_status == PaymentState::kPending);
  assert(devices[4].payment_status == PaymentState::kPending);
  assert(devices[5].payment_status == PaymentState::kPending);
}

void TestPaymentStateTransitions() {
  using blueshare::model::CanTransition;

  static_assert(CanTransition(PaymentState::kPending, PaymentState::kAuthorized), "pending -> authorized");
  static_assert(!CanTransition(PaymentState::kPending, PaymentState::kSettled), "no skipping");
  static_assert(CanTransition(PaymentState::kProcessing, PaymentState::kFailed), "fail from processing");
  static_assert(!CanTransition(PaymentState::kSettled, PaymentState::kFailed), "settled is terminal");
  static_assert(!CanTransition(PaymentState::kFailed, PaymentState::kPending), "failed is terminal");

  PaymentState state = PaymentState::kPending;
  blueshare::model::Transition(state, PaymentState::kAuthorized);
  blueshare::model::Transition(state, PaymentState::kAuthorized);
  assert(state == PaymentState::kAuthorized);

  bool threw = false;
  try {
    blueshare::model::Transition(state, PaymentState::kSettled);
  } catch (const blueshare::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  assert(state == PaymentState::kAuthorized);

  blueshare::model::Transition(state, PaymentState::kFailed);
  assert(blueshare::model::IsTerminal(state));
}

} // namespace

int main() {
  TestSatoshiConversionFloors();
  TestRoundTripWithinOneSatoshi();
  TestInvalidAmountsRejected();
  TestInvoiceFormat();
  TestCreateRecord();
  TestEqualAmountsGetDistinctHashes();
  TestSettleOnlyPaysClientsWithBalance();
  TestPaymentStateTransitions();

  std::cout << "blueshare_unit_payment_settler: pass\n";
  return 0;
}
