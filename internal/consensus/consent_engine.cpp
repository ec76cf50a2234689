#include "internal/consensus/consent_engine.hpp"

#include <stdexcept>

#include "internal/util/time.hpp"

namespace blueshare::consensus {

using blueshare::model::ConsentRecord;
using blueshare::model::ConsentState;

ConsentEngine::ConsentEngine(std::shared_ptr<blueshare::crypto::EntropySource> entropy) : entropy_(std::move(entropy)) {
  if (!entropy_) {
    throw std::invalid_argument("ConsentEngine requires an entropy source");
  }
}

ConsentState ConsentEngine::Classify(std::int32_t rssi_dbm) {
  if (rssi_dbm > kAcceptAboveDbm) {
    return ConsentState::kAccept;
  }
  if (rssi_dbm < kRejectBelowDbm) {
    return ConsentState::kReject;
  }
  return ConsentState::kAmbiguous;
}

ConsentState ConsentEngine::RequestConsent(blueshare::model::Device& device) {
  ConsentRecord record;
  record.state = Classify(device.rssi_dbm);
  if (record.state == ConsentState::kAmbiguous) {
    record.entropy_bits = entropy_->Measure();
  }
  record.captured_at = blueshare::util::Now();

  device.consent = record;
  return record.state;
}

} // namespace blueshare::consensus
