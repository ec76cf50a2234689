#include "internal/model/session.hpp"

#include <algorithm>
#include <utility>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace blueshare::model {

Session::Session(std::string id, std::vector<Device> devices)
    : id_(std::move(id)), devices_(std::move(devices)), start_(blueshare::util::Now()) {
}

std::size_t Session::CountRole(DeviceRole role) const {
  return static_cast<std::size_t>(
      std::count_if(devices_.begin(), devices_.end(), [role](const Device& device) { return device.role() == role; }));
}

const Device* Session::FindDevice(const std::string& device_id) const {
  for (const auto& device : devices_) {
    if (device.id() == device_id) {
      return &device;
    }
  }
  return nullptr;
}

Topology Session::topology() const {
  if (!topology_) {
    throw blueshare::util::StageOrderViolation("session " + id_ + ": topology read before selection");
  }
  return *topology_;
}

void Session::SetTopology(Topology topology, TopologyLinks links) {
  topology_ = topology;
  links_    = std::move(links);
}

const std::vector<std::string>& Session::LinksOf(const std::string& device_id) const {
  static const std::vector<std::string> kNoLinks;
  auto                                  it = links_.find(device_id);
  return it == links_.end() ? kNoLinks : it->second;
}

const BandwidthFigures& Session::bandwidth() const {
  if (!bandwidth_) {
    throw blueshare::util::StageOrderViolation("session " + id_ + ": bandwidth read before allocation");
  }
  return *bandwidth_;
}

void Session::SetBandwidth(BandwidthFigures figures) {
  bandwidth_ = figures;
}

const CostFigures& Session::cost() const {
  if (!cost_) {
    throw blueshare::util::StageOrderViolation("session " + id_ + ": cost read before allocation");
  }
  return *cost_;
}

void Session::SetCost(CostFigures figures) {
  cost_ = figures;
}

void Session::End() {
  if (!active_) {
    return;
  }
  active_ = false;
  end_    = blueshare::util::Now();
}

} // namespace blueshare::model
