#include "internal/compliance/compliance_gate.hpp"

#include "internal/observability/logging.hpp"

namespace blueshare::compliance {

ComplianceReport ComplianceGate::Evaluate(blueshare::model::Session& session) const {
  ComplianceReport report;

  report.transparency = session.compliance().transparency_verified();
  if (!report.transparency) {
    report.failures.emplace_back("transparency");
  }

  report.fairness = session.compliance().fairness_verified();
  if (!report.fairness) {
    report.failures.emplace_back("fairness");
  }

  session.compliance().MarkPrivacyVerified();
  report.privacy = session.compliance().privacy_verified();

  report.accessibility = true;

  if (!report.Passed()) {
    BLUESHARE_LOG_WARN("Compliance check failed", {blueshare::observability::StringField("session", session.id()),
                                                   blueshare::observability::BoolField("transparency", report.transparency),
                                                   blueshare::observability::BoolField("fairness", report.fairness)});
  }
  return report;
}

bool ComplianceGate::Verify(blueshare::model::Session& session) const {
  return Evaluate(session).Passed();
}

} // namespace blueshare::compliance
