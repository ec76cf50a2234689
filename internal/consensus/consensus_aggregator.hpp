#pragma once

#include <cstddef>
#include <string_view>

#include "internal/model/session.hpp"

namespace blueshare::consensus {

enum class Verdict {
  kVerified,
  kRejected,
  kPending,
};

constexpr std::string_view ToString(Verdict verdict) {
  switch (verdict) {
    case Verdict::kVerified:
      return "verified";
    case Verdict::kRejected:
      return "rejected";
    case Verdict::kPending:
    default:
      return "pending";
  }
}

struct ConsensusTally {
  std::size_t accept    = 0;
  std::size_t reject    = 0;
  std::size_t ambiguous = 0;
  // Devices with no consent record yet.
  std::size_t missing = 0;
  std::size_t total   = 0;

  Verdict verdict = Verdict::kPending;
};

/*
  Network-wide verdict from per-device consent.

  Any reject vetoes. Otherwise accepts >= floor(total / 2) verifies, where
  total counts every device in the session, recorded or not. Anything else
  is pending.
*/
class ConsensusAggregator {
 public:
  // Throws util::EmptySession for a session without devices.
  ConsensusTally Tally(const blueshare::model::Session& session) const;

  bool Verify(const blueshare::model::Session& session) const;
};

} // namespace blueshare::consensus
