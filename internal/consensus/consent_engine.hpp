#pragma once

#include <cstdint>
#include <memory>

#include "internal/crypto/entropy_source.hpp"
#include "internal/model/consent.hpp"
#include "internal/model/device.hpp"

namespace blueshare::consensus {

/*
  Per-device trinary admission decision.

  Signal above -70 dBm accepts, below -90 dBm rejects, anything in
  [-90, -70] is ambiguous and gets one entropy draw attached to the record.
  A new request replaces the device's previous record.
*/
class ConsentEngine {
 public:
  static constexpr std::int32_t kAcceptAboveDbm = -70;
  static constexpr std::int32_t kRejectBelowDbm = -90;

  explicit ConsentEngine(std::shared_ptr<blueshare::crypto::EntropySource> entropy);

  blueshare::model::ConsentState RequestConsent(blueshare::model::Device& device);

  static blueshare::model::ConsentState Classify(std::int32_t rssi_dbm);

 private:
  std::shared_ptr<blueshare::crypto::EntropySource> entropy_;
};

} // namespace blueshare::consensus
