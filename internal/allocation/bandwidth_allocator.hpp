#pragma once

#include "internal/model/session.hpp"

namespace blueshare::allocation {

/*
  Fair bandwidth planning.

  total = sum of host capacities, fair share = total * 2 / devices
  ("double space, half time": each device is planned twice its even share
  for half the slots). Marks the session's fairness flag once a pass has run.
*/
class BandwidthAllocator {
 public:
  static constexpr double kSpaceFactor = 2.0;

  // Throws util::EmptySession for a session without devices.
  void Allocate(blueshare::model::Session& session) const;
};

} // namespace blueshare::allocation
