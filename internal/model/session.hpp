#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/model/device.hpp"
#include "internal/model/topology.hpp"

namespace blueshare::model {

struct BandwidthFigures {
  double total_mbps      = 0.0;
  double fair_share_mbps = 0.0;
};

struct CostFigures {
  double total_usd      = 0.0;
  double per_device_usd = 0.0;
};

/*
  Compliance flags. Each one starts false and can only be raised.
*/
class ComplianceFlags {
 public:
  bool transparency_verified() const {
    return transparency_;
  }
  bool fairness_verified() const {
    return fairness_;
  }
  bool privacy_verified() const {
    return privacy_;
  }

  void MarkTransparencyVerified() {
    transparency_ = true;
  }
  void MarkFairnessVerified() {
    fairness_ = true;
  }
  void MarkPrivacyVerified() {
    privacy_ = true;
  }

 private:
  bool transparency_ = false;
  bool fairness_     = false;
  bool privacy_      = false;
};

// Undirected adjacency keyed by device id.
using TopologyLinks = std::unordered_map<std::string, std::vector<std::string>>;

/*
  One short-lived sharing session.

  Owns its devices and the topology links between them. Aggregates are
  absent until the stage that computes them has run; reading them earlier
  throws util::StageOrderViolation.
*/
class Session {
 public:
  explicit Session(std::string id, std::vector<Device> devices = {});

  const std::string& id() const {
    return id_;
  }

  std::vector<Device>& devices() {
    return devices_;
  }
  const std::vector<Device>& devices() const {
    return devices_;
  }
  std::size_t DeviceCount() const {
    return devices_.size();
  }
  std::size_t CountRole(DeviceRole role) const;

  const Device* FindDevice(const std::string& device_id) const;

  bool HasTopology() const {
    return topology_.has_value();
  }
  Topology topology() const;
  void     SetTopology(Topology topology, TopologyLinks links);

  const TopologyLinks&            links() const {
    return links_;
  }
  const std::vector<std::string>& LinksOf(const std::string& device_id) const;

  bool                    HasBandwidth() const {
    return bandwidth_.has_value();
  }
  const BandwidthFigures& bandwidth() const;
  void                    SetBandwidth(BandwidthFigures figures);

  bool               HasCost() const {
    return cost_.has_value();
  }
  const CostFigures& cost() const;
  void               SetCost(CostFigures figures);

  ComplianceFlags& compliance() {
    return compliance_;
  }
  const ComplianceFlags& compliance() const {
    return compliance_;
  }

  std::chrono::system_clock::time_point start() const {
    return start_;
  }
  const std::optional<std::chrono::system_clock::time_point>& end() const {
    return end_;
  }
  bool active() const {
    return active_;
  }

  // Marks the session inactive and stamps its end time. Idempotent.
  void End();

 private:
  std::string         id_;
  std::vector<Device> devices_;

  std::optional<Topology> topology_;
  TopologyLinks           links_;

  std::optional<BandwidthFigures> bandwidth_;
  std::optional<CostFigures>      cost_;
  ComplianceFlags                 compliance_;

  std::chrono::system_clock::time_point                start_;
  std::optional<std::chrono::system_clock::time_point> end_;
  bool                                                 active_ = true;
};

} // namespace blueshare::model
