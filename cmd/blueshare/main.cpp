#include <cstdint>
#include <iostream>
#include <string>

#include "blueshare/v1.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/session/session_orchestrator.hpp"
#include "internal/session/session_report.hpp"

namespace {

constexpr int kExitCompleted = 0;
constexpr int kExitUsage     = 1;
constexpr int kExitFatal     = 2;
constexpr int kExitAborted   = 3;

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: blueshare <config.yaml> OR blueshare --config <config.yaml>" << std::endl;
    return kExitUsage;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = blueshare::config::ConfigLoader::LoadFromYaml(config_path);

    blueshare::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build pipeline and session
    // ------------------------------------------------------------
    auto app     = blueshare::factory::Build(config);
    auto session = blueshare::factory::BuildSession(config);

    BLUESHARE_LOG_INFO("Session starting", {blueshare::observability::StringField("session", session.id()),
                                            blueshare::observability::IntField("devices", static_cast<std::int64_t>(session.DeviceCount()))});

    // ------------------------------------------------------------
    // Run
    // ------------------------------------------------------------
    const auto outcome = app.orchestrator->Run(session);

    const blueshare::v1::SessionReport report = blueshare::session::ToReport(session, outcome);
    std::cout << blueshare::session::ToJson(report) << std::endl;

    if (!outcome.Completed()) {
      BLUESHARE_LOG_WARN("Session aborted", {blueshare::observability::StringField("session", session.id()),
                                             blueshare::observability::StringField("status", blueshare::session::ToString(outcome.status))});
      blueshare::observability::ShutdownLogging();
      return kExitAborted;
    }

    BLUESHARE_LOG_INFO("Session completed", {blueshare::observability::StringField("session", session.id())});
    blueshare::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    BLUESHARE_LOG_ERROR("Fatal error", {blueshare::observability::StringField("error", e.what())});
    blueshare::observability::ShutdownLogging();
    return kExitFatal;
  }

  return kExitCompleted;
}
