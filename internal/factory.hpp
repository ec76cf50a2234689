#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/model/session.hpp"

namespace blueshare::crypto {
class EntropySource;
}
namespace blueshare::consensus {
class ConsentEngine;
}
namespace blueshare::observability {
class EventSink;
}
namespace blueshare::session {
class SessionOrchestrator;
}

namespace blueshare::factory {

/*
  Application

  Owns the long-lived pipeline components for one process.
*/
struct Application {
  std::shared_ptr<crypto::EntropySource>        entropy;
  std::shared_ptr<consensus::ConsentEngine>     consent_engine;
  std::shared_ptr<observability::EventSink>     events;
  std::shared_ptr<session::SessionOrchestrator> orchestrator;
};

/*
  Build

  Composition root. The only place that picks concrete implementations;
  `events` defaults to a LoggingEventSink when null.
*/
Application Build(const blueshare::runtime::config::RuntimeConfig& config,
                  std::shared_ptr<observability::EventSink> events = nullptr);

// Session described by the config's session section, devices from DeviceRegistry.
model::Session BuildSession(const blueshare::runtime::config::RuntimeConfig& config);

} // namespace blueshare::factory
