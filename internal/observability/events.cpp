#include "internal/observability/events.hpp"

#include <spdlog/common.h>

namespace blueshare::observability {

const std::string* SessionEvent::Find(const std::string& key) const {
  for (const auto& field : fields) {
    if (field.key == key) {
      return &field.value;
    }
  }
  return nullptr;
}

void LoggingEventSink::Emit(const SessionEvent& event) {
  std::vector<LogField> fields;
  fields.reserve(event.fields.size() + 2);
  fields.push_back(StringField("session", event.session_id));
  fields.push_back(StringField("stage", event.stage));
  fields.insert(fields.end(), event.fields.begin(), event.fields.end());
  Log(spdlog::level::info, event.name, fields);
}

void RecordingEventSink::Emit(const SessionEvent& event) {
  std::lock_guard lock(mutex_);
  events_.push_back(event);
}

std::vector<SessionEvent> RecordingEventSink::Events() const {
  std::lock_guard lock(mutex_);
  return events_;
}

std::vector<SessionEvent> RecordingEventSink::EventsForStage(const std::string& stage) const {
  std::lock_guard           lock(mutex_);
  std::vector<SessionEvent> result;
  for (const auto& event : events_) {
    if (event.stage == stage) {
      result.push_back(event);
    }
  }
  return result;
}

bool RecordingEventSink::Contains(const std::string& stage, const std::string& name) const {
  std::lock_guard lock(mutex_);
  for (const auto& event : events_) {
    if (event.stage == stage && event.name == name) {
      return true;
    }
  }
  return false;
}

} // namespace blueshare::observability
