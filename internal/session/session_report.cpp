#include "internal/session/session_report.hpp"

#include <stdexcept>

#include <google/protobuf/util/json_util.h>

#include "internal/util/time.hpp"

namespace blueshare::session {

namespace pb = blueshare::session::v1;

namespace {

pb::ConsentState ToProto(blueshare::model::ConsentState state) {
  switch (state) {
    case blueshare::model::ConsentState::kAccept:
      return pb::CONSENT_STATE_ACCEPT;
    case blueshare::model::ConsentState::kReject:
      return pb::CONSENT_STATE_REJECT;
    case blueshare::model::ConsentState::kAmbiguous:
      return pb::CONSENT_STATE_AMBIGUOUS;
  }
  return pb::CONSENT_STATE_UNSPECIFIED;
}

pb::Topology ToProto(blueshare::model::Topology topology) {
  switch (topology) {
    case blueshare::model::Topology::kStar:
      return pb::TOPOLOGY_STAR;
    case blueshare::model::Topology::kBus:
      return pb::TOPOLOGY_BUS;
    case blueshare::model::Topology::kMesh:
      return pb::TOPOLOGY_MESH;
    case blueshare::model::Topology::kHybrid:
      return pb::TOPOLOGY_HYBRID;
  }
  return pb::TOPOLOGY_UNSPECIFIED;
}

pb::PaymentStatus ToProto(blueshare::model::PaymentState state) {
  switch (state) {
    case blueshare::model::PaymentState::kPending:
      return pb::PAYMENT_STATUS_PENDING;
    case blueshare::model::PaymentState::kAuthorized:
      return pb::PAYMENT_STATUS_AUTHORIZED;
    case blueshare::model::PaymentState::kProcessing:
      return pb::PAYMENT_STATUS_PROCESSING;
    case blueshare::model::PaymentState::kSettled:
      return pb::PAYMENT_STATUS_SETTLED;
    case blueshare::model::PaymentState::kFailed:
      return pb::PAYMENT_STATUS_FAILED;
  }
  return pb::PAYMENT_STATUS_UNSPECIFIED;
}

pb::SessionStatus ToProto(SessionStatus status) {
  switch (status) {
    case SessionStatus::kCompleted:
      return pb::SESSION_STATUS_COMPLETED;
    case SessionStatus::kConsensusRejected:
      return pb::SESSION_STATUS_CONSENSUS_REJECTED;
    case SessionStatus::kConsensusPending:
      return pb::SESSION_STATUS_CONSENSUS_PENDING;
    case SessionStatus::kComplianceFailed:
      return pb::SESSION_STATUS_COMPLIANCE_FAILED;
  }
  return pb::SESSION_STATUS_UNSPECIFIED;
}

} // namespace

pb::SessionReport ToReport(const blueshare::model::Session& session, const SessionOutcome& outcome) {
  pb::SessionReport report;
  report.set_session_id(session.id());
  report.set_status(ToProto(outcome.status));
  report.set_start_unix_ms(blueshare::util::ToUnixMillis(session.start()));
  if (session.end()) {
    report.set_end_unix_ms(blueshare::util::ToUnixMillis(*session.end()));
  }
  report.set_active(session.active());

  if (session.HasTopology()) {
    report.set_topology(ToProto(session.topology()));
  }
  if (session.HasBandwidth()) {
    report.set_total_bandwidth_mbps(session.bandwidth().total_mbps);
    report.set_fair_share_mbps(session.bandwidth().fair_share_mbps);
  }
  if (session.HasCost()) {
    report.set_total_cost_usd(session.cost().total_usd);
    report.set_cost_per_device_usd(session.cost().per_device_usd);
  }

  for (const auto& device : session.devices()) {
    auto* entry = report.add_devices();
    entry->set_id(device.id());
    entry->set_name(device.name());
    entry->set_role(std::string(blueshare::model::ToString(device.role())));
    entry->set_rssi_dbm(device.rssi_dbm);
    if (device.consent) {
      entry->set_consent(ToProto(device.consent->state));
      if (device.consent->entropy_bits) {
        entry->set_entropy_bits(*device.consent->entropy_bits);
      }
    }
    entry->set_mb_used(device.MegabytesUsed());
    entry->set_balance_usd(device.balance_usd);
    entry->set_payment_status(ToProto(device.payment_status));
    for (const auto& peer : session.LinksOf(device.id())) {
      entry->add_links(peer);
    }
  }

  for (const auto& [device_id, record] : outcome.payments) {
    auto* payment = report.add_payments();
    payment->set_device_id(device_id);
    payment->set_invoice(record.invoice);
    payment->set_amount_satoshi(record.amount_satoshi);
    payment->set_amount_usd(record.amount_usd);
    payment->set_payment_hash(record.payment_hash);
    payment->set_expiry_unix_ms(blueshare::util::ToUnixMillis(record.expiry));
    payment->set_status(ToProto(record.status));
  }

  if (outcome.compliance) {
    auto* compliance = report.mutable_compliance();
    compliance->set_transparency(outcome.compliance->transparency);
    compliance->set_fairness(outcome.compliance->fairness);
    compliance->set_privacy(outcome.compliance->privacy);
    compliance->set_accessibility(outcome.compliance->accessibility);
    compliance->set_passed(outcome.compliance->Passed());
  }

  return report;
}

std::string ToJson(const pb::SessionReport& report) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace          = true;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(report, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize session report: " + std::string(status.message()));
  }
  return json;
}

} // namespace blueshare::session
