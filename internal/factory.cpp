#include "internal/factory.hpp"

#include <utility>

#include "internal/consensus/consent_engine.hpp"
#include "internal/crypto/entropy_source.hpp"
#include "internal/observability/events.hpp"
#include "internal/registry/device_registry.hpp"
#include "internal/session/session_orchestrator.hpp"
#include "internal/util/uuid.hpp"

namespace blueshare::factory {

using namespace blueshare;

Application Build(const blueshare::runtime::config::RuntimeConfig& config, std::shared_ptr<observability::EventSink> events) {
  Application app;

  app.entropy        = std::make_shared<crypto::SecureEntropySource>();
  app.consent_engine = std::make_shared<consensus::ConsentEngine>(app.entropy);
  app.events         = events ? std::move(events) : std::make_shared<observability::LoggingEventSink>();

  session::PipelineOptions options;
  options.parallel_consent = config.consent().parallel();
  if (!config.consent().request_type().empty()) {
    options.request_type = config.consent().request_type();
  }

  app.orchestrator = std::make_shared<session::SessionOrchestrator>(app.consent_engine, app.events, std::move(options));
  return app;
}

model::Session BuildSession(const blueshare::runtime::config::RuntimeConfig& config) {
  const auto& session_config = config.session();
  auto        session_id     = session_config.id().empty() ? util::NewSessionId() : session_config.id();
  return model::Session(std::move(session_id), registry::DeviceRegistry::FromConfig(session_config));
}

} // namespace blueshare::factory
