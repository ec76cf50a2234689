#include "internal/consensus/consensus_aggregator.hpp"

#include "internal/util/errors.hpp"

namespace blueshare::consensus {

using blueshare::model::ConsentState;

ConsensusTally ConsensusAggregator::Tally(const blueshare::model::Session& session) const {
  if (session.DeviceCount() == 0) {
    throw blueshare::util::EmptySession("session " + session.id() + ": consensus over zero devices");
  }

  ConsensusTally tally;
  tally.total = session.DeviceCount();

  for (const auto& device : session.devices()) {
    if (!device.consent) {
      ++tally.missing;
      continue;
    }
    switch (device.consent->state) {
      case ConsentState::kAccept:
        ++tally.accept;
        break;
      case ConsentState::kReject:
        ++tally.reject;
        break;
      case ConsentState::kAmbiguous:
        ++tally.ambiguous;
        break;
    }
  }

  if (tally.reject > 0) {
    tally.verdict = Verdict::kRejected;
  } else if (tally.accept >= tally.total / 2) {
    tally.verdict = Verdict::kVerified;
  } else {
    tally.verdict = Verdict::kPending;
  }
  return tally;
}

bool ConsensusAggregator::Verify(const blueshare::model::Session& session) const {
  return Tally(session).verdict == Verdict::kVerified;
}

} // namespace blueshare::consensus
