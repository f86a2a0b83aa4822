#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace storykb::runtime::config {
class RuntimeConfig;
}

namespace storykb::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);

// "message key=value key=value", fields in the order given.
std::string FormatLine(std::string_view message, std::initializer_list<LogField> fields);

// Installs the "storykb" logger as the spdlog default. Calling it again
// reconfigures the existing logger. An unknown level name logs at info.
void InitializeLogging(const storykb::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

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

} // namespace storykb::observability

#define STORYKB_LOG_DEBUG(message, ...) ::storykb::observability::LogDebug((message), ##__VA_ARGS__)
#define STORYKB_LOG_INFO(message, ...) ::storykb::observability::LogInfo((message), ##__VA_ARGS__)
#define STORYKB_LOG_WARN(message, ...) ::storykb::observability::LogWarn((message), ##__VA_ARGS__)
#define STORYKB_LOG_ERROR(message, ...) ::storykb::observability::LogError((message), ##__VA_ARGS__)
