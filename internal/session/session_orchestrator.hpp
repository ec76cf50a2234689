#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "internal/allocation/bandwidth_allocator.hpp"
#include "internal/allocation/cost_allocator.hpp"
#include "internal/compliance/compliance_gate.hpp"
#include "internal/consensus/consensus_aggregator.hpp"
#include "internal/model/payment.hpp"
#include "internal/model/session.hpp"
#include "internal/observability/events.hpp"
#include "internal/payment/payment_settler.hpp"
#include "internal/topology/topology_selector.hpp"

namespace blueshare::consensus {
class ConsentEngine;
}

namespace blueshare::session {

enum class SessionStatus {
  kCompleted,
  kConsensusRejected,
  kConsensusPending,
  kComplianceFailed,
};

constexpr std::string_view ToString(SessionStatus status) {
  switch (status) {
    case SessionStatus::kCompleted:
      return "completed";
    case SessionStatus::kConsensusRejected:
      return "consensus_rejected";
    case SessionStatus::kConsensusPending:
      return "consensus_pending";
    case SessionStatus::kComplianceFailed:
    default:
      return "compliance_failed";
  }
}

struct SessionOutcome {
  SessionStatus                                    status = SessionStatus::kConsensusPending;
  blueshare::consensus::ConsensusTally             tally;
  blueshare::model::PaymentMap                     payments;
  std::optional<blueshare::compliance::ComplianceReport> compliance;

  bool Completed() const {
    return status == SessionStatus::kCompleted;
  }
};

// Starts one consent worker thread.
using WorkerLauncher = std::function<std::thread(std::function<void()>)>;

struct PipelineOptions {
  // One thread per device for the consent round.
  bool        parallel_consent = false;
  std::string request_type     = "participation";
  // Empty means plain std::thread.
  WorkerLauncher launch_worker;
};

/*
  Drives a session through the pipeline:

    consent -> consensus -> topology -> bandwidth -> cost -> payment -> compliance

  A rejected or pending consensus and a failed compliance gate end the
  session and return normally. Stage errors (no host, empty session, RNG
  failure) end the session and propagate. No stage is retried.
*/
class SessionOrchestrator {
 public:
  SessionOrchestrator(std::shared_ptr<blueshare::consensus::ConsentEngine> consent_engine,
                      std::shared_ptr<blueshare::observability::EventSink> events, PipelineOptions options = {});

  SessionOutcome Run(blueshare::model::Session& session);

 private:
  void RequestConsents(blueshare::model::Session& session);
  void RecordConsent(const blueshare::model::Session& session, const blueshare::model::Device& device);
  SessionOutcome RunStages(blueshare::model::Session& session);

  void Emit(const blueshare::model::Session& session, std::string stage, std::string name,
            std::vector<blueshare::observability::LogField> fields = {});

  std::shared_ptr<blueshare::consensus::ConsentEngine> consent_engine_;
  std::shared_ptr<blueshare::observability::EventSink> events_;
  PipelineOptions                                      options_;

  blueshare::consensus::ConsensusAggregator aggregator_;
  blueshare::topology::TopologySelector     selector_;
  blueshare::allocation::BandwidthAllocator bandwidth_;
  blueshare::allocation::CostAllocator      cost_;
  blueshare::payment::PaymentSettler        settler_;
  blueshare::compliance::ComplianceGate     gate_;
};

} // namespace blueshare::session
