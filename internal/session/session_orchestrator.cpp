#include "internal/session/session_orchestrator.hpp"

#include <exception>
#include <functional>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

#include "internal/consensus/consent_engine.hpp"
#include "internal/topology/topology_links.hpp"
#include "internal/util/errors.hpp"

namespace blueshare::session {

using blueshare::observability::BoolField;
using blueshare::observability::DoubleField;
using blueshare::observability::IntField;
using blueshare::observability::StringField;

namespace {

// Joins every started worker when it goes out of scope, including while an
// exception from a later launch is unwinding.
class WorkerGroup {
 public:
  explicit WorkerGroup(std::size_t capacity) {
    threads_.reserve(capacity);
  }

  WorkerGroup(const WorkerGroup&)            = delete;
  WorkerGroup& operator=(const WorkerGroup&) = delete;

  ~WorkerGroup() {
    for (auto& thread : threads_) {
      if (thread.joinable()) {
        thread.join();
      }
    }
  }

  void Add(std::thread thread) {
    threads_.push_back(std::move(thread));
  }

 private:
  std::vector<std::thread> threads_;
};

} // namespace

SessionOrchestrator::SessionOrchestrator(std::shared_ptr<blueshare::consensus::ConsentEngine> consent_engine,
                                         std::shared_ptr<blueshare::observability::EventSink> events, PipelineOptions options)
    : consent_engine_(std::move(consent_engine)), events_(std::move(events)), options_(std::move(options)) {
  if (!consent_engine_) {
    throw std::invalid_argument("SessionOrchestrator requires a consent engine");
  }
  if (!events_) {
    events_ = std::make_shared<blueshare::observability::LoggingEventSink>();
  }
}

void SessionOrchestrator::Emit(const blueshare::model::Session& session, std::string stage, std::string name,
                               std::vector<blueshare::observability::LogField> fields) {
  blueshare::observability::SessionEvent event;
  event.session_id = session.id();
  event.stage      = std::move(stage);
  event.name       = std::move(name);
  event.fields     = std::move(fields);
  events_->Emit(event);
}

void SessionOrchestrator::RecordConsent(const blueshare::model::Session& session, const blueshare::model::Device& device) {
  std::vector<blueshare::observability::LogField> fields = {
      StringField("device", device.id()),
      StringField("request", options_.request_type),
      IntField("rssi_dbm", device.rssi_dbm),
      StringField("state", blueshare::model::ToString(device.consent->state)),
  };
  if (device.consent->entropy_bits) {
    fields.push_back(DoubleField("entropy_bits", *device.consent->entropy_bits));
  }
  Emit(session, "consent", "consent_recorded", std::move(fields));
}

void SessionOrchestrator::RequestConsents(blueshare::model::Session& session) {
  auto& devices = session.devices();

  if (options_.parallel_consent && devices.size() > 1) {
    // Each worker writes only its own device's record.
    std::vector<std::exception_ptr> errors(devices.size());
    {
      WorkerGroup workers(devices.size());
      for (std::size_t i = 0; i < devices.size(); ++i) {
        std::function<void()> task = [this, &devices, &errors, i]() {
          try {
            consent_engine_->RequestConsent(devices[i]);
          } catch (...) {
            errors[i] = std::current_exception();
          }
        };
        // If a launch throws, the group still joins the workers already running.
        workers.Add(options_.launch_worker ? options_.launch_worker(std::move(task)) : std::thread(std::move(task)));
      }
    }
    for (const auto& error : errors) {
      if (error) {
        std::rethrow_exception(error);
      }
    }
  } else {
    for (auto& device : devices) {
      consent_engine_->RequestConsent(device);
    }
  }

  for (const auto& device : devices) {
    RecordConsent(session, device);
  }
}

SessionOutcome SessionOrchestrator::RunStages(blueshare::model::Session& session) {
  SessionOutcome outcome;

  if (session.DeviceCount() == 0) {
    throw blueshare::util::EmptySession("session " + session.id() + " has no devices");
  }

  RequestConsents(session);

  outcome.tally = aggregator_.Tally(session);
  Emit(session, "consensus", std::string(blueshare::consensus::ToString(outcome.tally.verdict)),
       {IntField("accept", static_cast<std::int64_t>(outcome.tally.accept)), IntField("reject", static_cast<std::int64_t>(outcome.tally.reject)),
        IntField("ambiguous", static_cast<std::int64_t>(outcome.tally.ambiguous)),
        IntField("devices", static_cast<std::int64_t>(outcome.tally.total))});

  if (outcome.tally.verdict == blueshare::consensus::Verdict::kRejected) {
    outcome.status = SessionStatus::kConsensusRejected;
    return outcome;
  }
  if (outcome.tally.verdict == blueshare::consensus::Verdict::kPending) {
    outcome.status = SessionStatus::kConsensusPending;
    return outcome;
  }

  const auto topology = selector_.Select(session);
  session.SetTopology(topology, blueshare::topology::BuildLinks(session, topology));
  Emit(session, "topology", "selected",
       {StringField("topology", blueshare::model::ToString(topology)),
        IntField("hosts", static_cast<std::int64_t>(session.CountRole(blueshare::model::DeviceRole::kHost)))});

  bandwidth_.Allocate(session);
  Emit(session, "bandwidth", "allocated",
       {DoubleField("total_mbps", session.bandwidth().total_mbps), DoubleField("fair_share_mbps", session.bandwidth().fair_share_mbps)});

  cost_.AllocateCosts(session);
  for (const auto& device : session.devices()) {
    Emit(session, "cost", "device_charged",
         {StringField("device", device.id()), DoubleField("mb_used", device.MegabytesUsed()), DoubleField("cost_usd", device.balance_usd)});
  }
  Emit(session, "cost", "allocated",
       {DoubleField("total_usd", session.cost().total_usd), DoubleField("per_device_usd", session.cost().per_device_usd)});

  outcome.payments = settler_.Settle(session);
  for (const auto& [device_id, record] : outcome.payments) {
    Emit(session, "payment", "settled",
         {StringField("device", device_id), StringField("invoice", record.invoice),
          IntField("amount_satoshi", static_cast<std::int64_t>(record.amount_satoshi)), DoubleField("amount_usd", record.amount_usd),
          StringField("status", blueshare::model::ToString(record.status))});
  }

  outcome.compliance = gate_.Evaluate(session);
  Emit(session, "compliance", outcome.compliance->Passed() ? "verified" : "violation",
       {BoolField("transparency", outcome.compliance->transparency), BoolField("fairness", outcome.compliance->fairness),
        BoolField("privacy", outcome.compliance->privacy), BoolField("accessibility", outcome.compliance->accessibility)});

  outcome.status = outcome.compliance->Passed() ? SessionStatus::kCompleted : SessionStatus::kComplianceFailed;
  return outcome;
}

SessionOutcome SessionOrchestrator::Run(blueshare::model::Session& session) {
  Emit(session, "session", "started", {IntField("devices", static_cast<std::int64_t>(session.DeviceCount()))});

  SessionOutcome outcome;
  try {
    outcome = RunStages(session);
  } catch (const std::exception& ex) {
    session.End();
    Emit(session, "session", "failed", {StringField("error", ex.what())});
    throw;
  }

  if (!outcome.Completed()) {
    session.End();
    Emit(session, "session", "aborted", {StringField("status", ToString(outcome.status))});
    return outcome;
  }

  Emit(session, "session", "completed", {StringField("topology", blueshare::model::ToString(session.topology()))});
  return outcome;
}

} // namespace blueshare::session
