#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace blueshare::runtime::config {
class RuntimeConfig;
}

namespace blueshare::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField DoubleField(std::string_view key, double value);
LogField BoolField(std::string_view key, bool value);

// Level and pattern come from config, BLUESHARE_LOG_LEVEL / BLUESHARE_LOG_PATTERN
// override them. Throws util::InvalidArgument for an unknown level name.
void InitializeLogging(const blueshare::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});
void Log(spdlog::level::level_enum level, std::string_view message, const std::vector<LogField>& fields);

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace blueshare::observability

#define BLUESHARE_LOG_DEBUG(message, ...) ::blueshare::observability::LogDebug((message), ##__VA_ARGS__)
#define BLUESHARE_LOG_INFO(message, ...) ::blueshare::observability::LogInfo((message), ##__VA_ARGS__)
#define BLUESHARE_LOG_WARN(message, ...) ::blueshare::observability::LogWarn((message), ##__VA_ARGS__)
#define BLUESHARE_LOG_ERROR(message, ...) ::blueshare::observability::LogError((message), ##__VA_ARGS__)
