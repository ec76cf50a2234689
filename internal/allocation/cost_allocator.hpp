#pragma once

#include "internal/model/session.hpp"

namespace blueshare::allocation {

/*
  Usage cost from a fixed work model: W = F * d * cos(theta) per megabyte,
  priced per unit of work. Closed form, no external price lookup.
*/
class CostAllocator {
 public:
  static constexpr double kForceNewtons  = 1.25;
  static constexpr double kDistanceMeters = 15.0;
  static constexpr double kCosTheta      = 0.866;  // cos(30 deg)
  static constexpr double kWorkPerMb     = kForceNewtons * kDistanceMeters * kCosTheta;
  static constexpr double kUsdPerJoule   = 0.00001;

  static double CostUsd(double megabytes);

  // Writes every device balance and the session totals, then marks
  // transparency. Throws util::EmptySession for a session without devices.
  void AllocateCosts(blueshare::model::Session& session) const;
};

} // namespace blueshare::allocation
