#include "internal/topology/topology_selector.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace blueshare::topology {

using blueshare::model::Topology;

Topology TopologySelector::Decide(std::size_t device_count, std::size_t host_count) {
  if (host_count == 0) {
    throw blueshare::util::InvalidTopologyInput("no host among " + std::to_string(device_count) + " devices");
  }

  // Star must be checked before bus: (3, 1) satisfies both.
  if (device_count <= 3 && host_count == 1) {
    return Topology::kStar;
  }
  if (device_count <= 5 && host_count <= 2) {
    return Topology::kBus;
  }
  if (host_count >= 2) {
    return Topology::kMesh;
  }
  return Topology::kHybrid;
}

Topology TopologySelector::Select(const blueshare::model::Session& session) const {
  return Decide(session.DeviceCount(), session.CountRole(blueshare::model::DeviceRole::kHost));
}

} // namespace blueshare::topology
