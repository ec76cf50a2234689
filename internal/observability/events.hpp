#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "internal/observability/logging.hpp"

namespace blueshare::observability {

/*
  Structured pipeline events.

  The session pipeline reports what it did through an EventSink instead of
  writing text. Presentation (logs, CLI, tests) lives behind the sink.
*/
struct SessionEvent {
  std::string           session_id;
  std::string           stage;
  std::string           name;
  std::vector<LogField> fields;

  const std::string* Find(const std::string& key) const;
};

class EventSink {
 public:
  virtual ~EventSink() = default;

  virtual void Emit(const SessionEvent& event) = 0;
};

// Forwards every event to the process logger at info level.
class LoggingEventSink final : public EventSink {
 public:
  void Emit(const SessionEvent& event) override;
};

// Keeps events in memory, in emission order.
class RecordingEventSink final : public EventSink {
 public:
  void Emit(const SessionEvent& event) override;

  std::vector<SessionEvent> Events() const;
  std::vector<SessionEvent> EventsForStage(const std::string& stage) const;
  bool                      Contains(const std::string& stage, const std::string& name) const;

 private:
  mutable std::mutex        mutex_;
  std::vector<SessionEvent> events_;
};

} // namespace blueshare::observability
