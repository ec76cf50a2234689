#pragma once

#include <cstddef>

#include "internal/model/session.hpp"
#include "internal/model/topology.hpp"

namespace blueshare::topology {

/*
  Picks a topology from the session's composition.

  Rules are checked in this order, first match wins:
    hosts == 0                 -> util::InvalidTopologyInput
    devices <= 3, hosts == 1   -> star
    devices <= 5, hosts <= 2   -> bus
    hosts >= 2                 -> mesh
    otherwise                  -> hybrid
*/
class TopologySelector {
 public:
  blueshare::model::Topology Select(const blueshare::model::Session& session) const;

  static blueshare::model::Topology Decide(std::size_t device_count, std::size_t host_count);
};

} // namespace blueshare::topology
