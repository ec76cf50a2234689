#include "internal/consensus/consensus_aggregator.hpp"

#include <cassert>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using blueshare::consensus::ConsensusAggregator;
using blueshare::consensus::Verdict;
using blueshare::model::ConsentRecord;
using blueshare::model::ConsentState;
using blueshare::model::Device;
using blueshare::model::DeviceRole;
using blueshare::model::Session;

Session MakeSession(const std::vector<std::optional<ConsentState>>& states) {
  std::vector<Device> devices;
  for (std::size_t i = 0; i < states.size(); ++i) {
    Device device("dev-" + std::to_string(i), "Device " + std::to_string(i), i == 0 ? DeviceRole::kHost : DeviceRole::kClient);
    if (states[i]) {
      ConsentRecord record;
      record.state = *states[i];
      if (record.state == ConsentState::kAmbiguous) {
        record.entropy_bits = 20.0;
      }
      device.consent = record;
    }
    devices.push_back(std::move(device));
  }
  return Session("session-consensus", std::move(devices));
}

void TestSingleRejectVetoesLargeAcceptMajority() {
  std::vector<std::optional<ConsentState>> states(9, ConsentState::kAccept);
  states.push_back(ConsentState::kReject);
  const auto session = MakeSession(states);

  ConsensusAggregator aggregator;
  const auto          tally = aggregator.Tally(session);
  assert(tally.accept == 9);
  assert(tally.reject == 1);
  assert(tally.verdict == Verdict::kRejected);
  assert(!aggregator.Verify(session));
}

void TestRejectDominatesMixedVotes() {
  const auto session =
      MakeSession({ConsentState::kAccept, ConsentState::kAccept, ConsentState::kReject, ConsentState::kAmbiguous});
  assert(!ConsensusAggregator{}.Verify(session));
}

void TestHalfAcceptWithoutRejectVerifies() {
  const auto session =
      MakeSession({ConsentState::kAccept, ConsentState::kAccept, ConsentState::kAccept, ConsentState::kAmbiguous});

  const auto tally = ConsensusAggregator{}.Tally(session);
  assert(tally.accept == 3);
  assert(tally.ambiguous == 1);
  assert(tally.verdict == Verdict::kVerified);
}

void TestFloorOfHalfIsEnough() {
  // 5 devices: floor(5 / 2) = 2 accepts suffice.
  const auto session = MakeSession({ConsentState::kAccept, ConsentState::kAccept, ConsentState::kAmbiguous,
                                    ConsentState::kAmbiguous, ConsentState::kAmbiguous});
  assert(ConsensusAggregator{}.Verify(session));
}

void TestTooFewAcceptsIsPending() {
  const auto session =
      MakeSession({ConsentState::kAccept, ConsentState::kAmbiguous, ConsentState::kAmbiguous, ConsentState::kAmbiguous});

  const auto tally = ConsensusAggregator{}.Tally(session);
  assert(tally.verdict == Verdict::kPending);
  assert(!ConsensusAggregator{}.Verify(session));
}

void TestDevicesWithoutRecordCountTowardsTotalOnly() {
  const auto session = MakeSession({ConsentState::kAccept, std::nullopt, std::nullopt, std::nullopt, std::nullopt, std::nullopt});

  const auto tally = ConsensusAggregator{}.Tally(session);
  assert(tally.accept == 1);
  assert(tally.reject == 0);
  assert(tally.ambiguous == 0);
  assert(tally.missing == 5);
  assert(tally.total == 6);
  assert(tally.verdict == Verdict::kPending);
}

void TestEmptySessionIsRejectedUpstream() {
  Session session("empty");

  bool threw = false;
  try {
    (void)ConsensusAggregator{}.Verify(session);
  } catch (const blueshare::util::EmptySession&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestSingleRejectVetoesLargeAcceptMajority();
  TestRejectDominatesMixedVotes();
  TestHalfAcceptWithoutRejectVerifies();
  TestFloorOfHalfIsEnough();
  TestTooFewAcceptsIsPending();
  TestDevicesWithoutRecordCountTowardsTotalOnly();
  TestEmptySessionIsRejectedUpstream();

  std::cout << "blueshare_unit_consensus_aggregator: pass\n";
  return 0;
}
