#include "internal/allocation/cost_allocator.hpp"

#include "internal/util/errors.hpp"

namespace blueshare::allocation {

double CostAllocator::CostUsd(double megabytes) {
  return megabytes * kWorkPerMb * kUsdPerJoule;
}

void CostAllocator::AllocateCosts(blueshare::model::Session& session) const {
  if (session.DeviceCount() == 0) {
    throw blueshare::util::EmptySession("session " + session.id() + ": cost allocation over zero devices");
  }

  blueshare::model::CostFigures figures;
  for (auto& device : session.devices()) {
    const double cost  = CostUsd(device.MegabytesUsed());
    device.balance_usd = cost;
    figures.total_usd += cost;
  }
  figures.per_device_usd = figures.total_usd / static_cast<double>(session.DeviceCount());

  session.SetCost(figures);
  session.compliance().MarkTransparencyVerified();
}

} // namespace blueshare::allocation
