#pragma once

#include <string>
#include <vector>

#include "internal/model/session.hpp"

namespace blueshare::compliance {

struct ComplianceReport {
  bool transparency  = false;
  bool fairness      = false;
  bool privacy       = false;
  bool accessibility = false;

  // Names of the checks that failed, in evaluation order.
  std::vector<std::string> failures;

  bool Passed() const {
    return transparency && fairness && privacy && accessibility;
  }
};

/*
  Final gate before a session may operate.

  All four checks are evaluated every time so the caller gets a full report:
    transparency   cost allocation has run
    fairness       bandwidth allocation has run
    privacy        always passes; identity privacy is provided outside this core
    accessibility  always passes
  A skipped allocation stage shows up as a failed check, never an exception.
*/
class ComplianceGate {
 public:
  ComplianceReport Evaluate(blueshare::model::Session& session) const;

  bool Verify(blueshare::model::Session& session) const;
};

} // namespace blueshare::compliance
