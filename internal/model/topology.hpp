#pragma once

#include <cstdint>
#include <string_view>

namespace blueshare::model {

enum class Topology : std::uint8_t {
  kStar = 0,    // single host, clients attached to it
  kBus = 1,     // chain with failover
  kMesh = 2,    // several hosts sharing load
  kHybrid = 3,  // host plus relay backbone
};

constexpr std::string_view ToString(Topology topology) {
  switch (topology) {
    case Topology::kStar:
      return "star";
    case Topology::kBus:
      return "bus";
    case Topology::kMesh:
      return "mesh";
    case Topology::kHybrid:
    default:
      return "hybrid";
  }
}

} // namespace blueshare::model
