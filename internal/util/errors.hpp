#pragma once

#include <stdexcept>
#include <string>

namespace blueshare::util {

/*
  Central error types.

  Stages throw these; the orchestrator decides abort vs continue and the CLI
  maps them to exit codes.
*/

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ResourceExhausted : public std::runtime_error {
 public:
  explicit ResourceExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

// No host-role device: the session cannot form any topology.
class InvalidTopologyInput : public std::runtime_error {
 public:
  explicit InvalidTopologyInput(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A cross-device stage was invoked on a session with zero devices.
class EmptySession : public std::runtime_error {
 public:
  explicit EmptySession(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A stage result was read before the stage that produces it has run.
class StageOrderViolation : public std::runtime_error {
 public:
  explicit StageOrderViolation(const std::string& msg) : std::runtime_error(msg) {
  }
};

class EntropyUnavailable : public std::runtime_error {
 public:
  explicit EntropyUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

// libcrypto could not compute a digest.
class CryptoFailure : public std::runtime_error {
 public:
  explicit CryptoFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace blueshare::util
