#include "internal/topology/topology_links.hpp"

#include <algorithm>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace blueshare::topology {

using blueshare::model::DeviceRole;
using blueshare::model::Topology;
using blueshare::model::TopologyLinks;

namespace {

void Link(TopologyLinks& links, const std::string& a, const std::string& b) {
  if (a == b) {
    return;
  }
  auto& from_a = links[a];
  if (std::find(from_a.begin(), from_a.end(), b) != from_a.end()) {
    return;
  }
  from_a.push_back(b);
  links[b].push_back(a);
}

} // namespace

TopologyLinks BuildLinks(const blueshare::model::Session& session, Topology topology) {
  std::vector<std::string> hosts;
  std::vector<std::string> relays;
  for (const auto& device : session.devices()) {
    if (device.role() == DeviceRole::kHost) {
      hosts.push_back(device.id());
    } else if (device.role() == DeviceRole::kRelay) {
      relays.push_back(device.id());
    }
  }
  if (hosts.empty()) {
    throw blueshare::util::InvalidTopologyInput("session " + session.id() + ": cannot link devices without a host");
  }

  TopologyLinks links;
  for (const auto& device : session.devices()) {
    links[device.id()];
  }

  const auto& devices = session.devices();
  switch (topology) {
    case Topology::kStar:
      for (const auto& device : devices) {
        if (device.role() != DeviceRole::kHost) {
          Link(links, device.id(), hosts.front());
        }
      }
      break;

    case Topology::kBus:
      for (std::size_t i = 1; i < devices.size(); ++i) {
        Link(links, devices[i - 1].id(), devices[i].id());
      }
      break;

    case Topology::kMesh: {
      for (std::size_t i = 0; i < hosts.size(); ++i) {
        for (std::size_t j = i + 1; j < hosts.size(); ++j) {
          Link(links, hosts[i], hosts[j]);
        }
      }
      std::size_t next_host = 0;
      for (const auto& device : devices) {
        if (device.role() == DeviceRole::kHost) {
          continue;
        }
        Link(links, device.id(), hosts[next_host]);
        next_host = (next_host + 1) % hosts.size();
      }
      break;
    }

    case Topology::kHybrid:
      for (const auto& device : devices) {
        if (device.role() != DeviceRole::kHost) {
          Link(links, device.id(), hosts.front());
        }
      }
      for (std::size_t i = 0; i < relays.size(); ++i) {
        for (std::size_t j = i + 1; j < relays.size(); ++j) {
          Link(links, relays[i], relays[j]);
        }
      }
      break;
  }

  return links;
}

} // namespace blueshare::topology
