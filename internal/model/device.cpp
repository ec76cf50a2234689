#include "internal/model/device.hpp"

#include <utility>

namespace blueshare::model {

Device::Device(std::string id, std::string name, DeviceRole role) : id_(std::move(id)), name_(std::move(name)), role_(role) {
}

double Device::MegabytesUsed() const {
  return static_cast<double>(bytes_sent + bytes_received) / (1024.0 * 1024.0);
}

} // namespace blueshare::model
