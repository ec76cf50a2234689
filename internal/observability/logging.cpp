#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace blueshare::observability {
namespace {

// spdlog maps unknown names to "off"; a typo must not silence the process.
spdlog::level::level_enum ParseLevel(const std::string& name) {
  const auto level = spdlog::level::from_str(name);
  if (level == spdlog::level::off && name != "off") {
    throw blueshare::util::InvalidArgument("unknown log level '" + name + "'");
  }
  return level;
}

spdlog::level::level_enum ResolveLevel(const blueshare::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("BLUESHARE_LOG_LEVEL")) {
    return ParseLevel(level);
  }
  if (!config.logging().level().empty()) {
    return ParseLevel(config.logging().level());
  }
  return spdlog::level::info;
}

std::string ResolvePattern(const blueshare::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("BLUESHARE_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
}

template <typename Fields>
std::string SerializeFields(const Fields& fields) {
  std::string out;
  for (const auto& field : fields) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out.append(field.key).append("=").append(field.value);
  }
  return out;
}

template <typename Fields>
void LogWithFields(spdlog::level::level_enum level, std::string_view message, const Fields& fields) {
  if (fields.size() == 0) {
    spdlog::log(level, "{}", message);
    return;
  }
  spdlog::log(level, "{} {}", message, SerializeFields(fields));
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField DoubleField(std::string_view key, double value) {
  std::ostringstream out;
  out.precision(9);
  out << value;
  return {std::string(key), out.str()};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const blueshare::runtime::config::RuntimeConfig& config) {
  auto logger = spdlog::get("blueshare");
  if (!logger) {
    // Logs go to stderr so stdout stays reserved for the session report.
    logger = spdlog::stderr_color_mt("blueshare");
  }
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(ResolveLevel(config));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  LogWithFields(level, message, fields);
}

void Log(spdlog::level::level_enum level, std::string_view message, const std::vector<LogField>& fields) {
  LogWithFields(level, message, fields);
}

} // namespace blueshare::observability
