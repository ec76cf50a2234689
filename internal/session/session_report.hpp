#pragma once

#include <string>

#include "blueshare/session/v1/session.pb.h"
#include "internal/model/session.hpp"
#include "internal/session/session_orchestrator.hpp"

namespace blueshare::session {

/*
  Snapshot of a finished pipeline run for presentation layers.

  Aggregates that were never computed (aborted sessions) are left at zero.
*/
blueshare::session::v1::SessionReport ToReport(const blueshare::model::Session& session, const SessionOutcome& outcome);

std::string ToJson(const blueshare::session::v1::SessionReport& report);

} // namespace blueshare::session
