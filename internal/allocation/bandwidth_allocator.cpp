#include "internal/allocation/bandwidth_allocator.hpp"

#include "internal/util/errors.hpp"

namespace blueshare::allocation {

using blueshare::model::DeviceRole;

void BandwidthAllocator::Allocate(blueshare::model::Session& session) const {
  if (session.DeviceCount() == 0) {
    throw blueshare::util::EmptySession("session " + session.id() + ": bandwidth allocation over zero devices");
  }

  blueshare::model::BandwidthFigures figures;
  for (const auto& device : session.devices()) {
    if (device.role() == DeviceRole::kHost) {
      figures.total_mbps += device.bandwidth_mbps;
    }
  }
  figures.fair_share_mbps = (figures.total_mbps * kSpaceFactor) / static_cast<double>(session.DeviceCount());

  session.SetBandwidth(figures);
  session.compliance().MarkFairnessVerified();
}

} // namespace blueshare::allocation
