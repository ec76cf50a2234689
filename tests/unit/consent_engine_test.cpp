#include "internal/consensus/consent_engine.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

namespace {

using blueshare::consensus::ConsentEngine;
using blueshare::crypto::EntropySource;
using blueshare::model::ConsentState;
using blueshare::model::Device;
using blueshare::model::DeviceRole;

class CountingEntropySource final : public EntropySource {
 public:
  explicit CountingEntropySource(uint8_t value) : value_(value) {
  }

  Sample DrawSample() override {
    ++draws;
    Sample sample{};
    sample.fill(value_);
    return sample;
  }

  std::atomic<int> draws{0};

 private:
  uint8_t value_;
};

Device MakeDevice(int rssi) {
  Device device("dev", "Device", DeviceRole::kClient);
  device.rssi_dbm = rssi;
  return device;
}

void TestClassifyBoundaries() {
  assert(ConsentEngine::Classify(-30) == ConsentState::kAccept);
  assert(ConsentEngine::Classify(-69) == ConsentState::kAccept);
  assert(ConsentEngine::Classify(-70) == ConsentState::kAmbiguous);
  assert(ConsentEngine::Classify(-80) == ConsentState::kAmbiguous);
  assert(ConsentEngine::Classify(-90) == ConsentState::kAmbiguous);
  assert(ConsentEngine::Classify(-91) == ConsentState::kReject);
  assert(ConsentEngine::Classify(-120) == ConsentState::kReject);
}

void TestClearDecisionsDoNotDrawEntropy() {
  auto          entropy = std::make_shared<CountingEntropySource>(128);
  ConsentEngine engine(entropy);

  auto strong = MakeDevice(-65);
  auto weak   = MakeDevice(-95);

  assert(engine.RequestConsent(strong) == ConsentState::kAccept);
  assert(engine.RequestConsent(weak) == ConsentState::kReject);

  assert(entropy->draws == 0);
  assert(strong.consent.has_value() && !strong.consent->entropy_bits.has_value());
  assert(weak.consent.has_value() && !weak.consent->entropy_bits.has_value());
}

void TestAmbiguousDecisionAttachesOneEntropyDraw() {
  auto          entropy = std::make_shared<CountingEntropySource>(128);
  ConsentEngine engine(entropy);

  auto marginal = MakeDevice(-72);
  assert(engine.RequestConsent(marginal) == ConsentState::kAmbiguous);

  assert(entropy->draws == 1);
  assert(marginal.consent->entropy_bits.has_value());

  EntropySource::Sample expected{};
  expected.fill(128);
  assert(*marginal.consent->entropy_bits == blueshare::crypto::ShannonEntropyBits(expected));
  assert(*marginal.consent->entropy_bits >= 0.0);
}

void TestRepeatedRequestReplacesRecord() {
  auto          entropy = std::make_shared<CountingEntropySource>(200);
  ConsentEngine engine(entropy);

  auto device = MakeDevice(-85);
  assert(engine.RequestConsent(device) == ConsentState::kAmbiguous);

  device.rssi_dbm = -50;
  assert(engine.RequestConsent(device) == ConsentState::kAccept);
  assert(device.consent->state == ConsentState::kAccept);
  assert(!device.consent->entropy_bits.has_value());
}

void TestSecureSourceProducesNonNegativeEntropy() {
  ConsentEngine engine(std::make_shared<blueshare::crypto::SecureEntropySource>());

  for (int rssi = -90; rssi <= -70; ++rssi) {
    auto device = MakeDevice(rssi);
    assert(engine.RequestConsent(device) == ConsentState::kAmbiguous);
    assert(*device.consent->entropy_bits >= 0.0);
  }
}

void TestNullEntropySourceIsRejected() {
  bool threw = false;
  try {
    ConsentEngine engine(nullptr);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestClassifyBoundaries();
  TestClearDecisionsDoNotDrawEntropy();
  TestAmbiguousDecisionAttachesOneEntropyDraw();
  TestRepeatedRequestReplacesRecord();
  TestSecureSourceProducesNonNegativeEntropy();
  TestNullEntropySourceIsRejected();

  std::cout << "blueshare_unit_consent_engine: pass\n";
  return 0;
}
