#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace storykb::observability {
namespace {

constexpr const char* kLoggerName     = "storykb";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

// STORYKB_LOG_LEVEL wins over the config file.
spdlog::level::level_enum ResolveLevel(const storykb::runtime::config::LoggingConfig& logging) {
  std::string name = "info";
  if (const char* env = std::getenv("STORYKB_LOG_LEVEL"); env && *env) {
    name = env;
  } else if (!logging.level().empty()) {
    name = logging.level();
  }

  // from_str maps anything it does not know to off
  const auto level = spdlog::level::from_str(name);
  if (level == spdlog::level::off && name != "off") {
    return spdlog::level::info;
  }
  return level;
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

std::string FormatLine(std::string_view message, std::initializer_list<LogField> fields) {
  std::string line(message);
  for (const auto& field : fields) {
    line += ' ';
    line += field.key;
    line += '=';
    line += field.value;
  }
  return line;
}

void InitializeLogging(const storykb::runtime::config::RuntimeConfig& config) {
  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stdout_color_mt(kLoggerName);
  }
  logger->set_pattern(config.logging().pattern().empty() ? kDefaultPattern : config.logging().pattern());
  logger->set_level(ResolveLevel(config.logging()));
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(logger);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto logger = spdlog::default_logger_raw();
  if (!logger->should_log(level)) {
    return;
  }
  logger->log(level, FormatLine(message, fields));
}

} // namespace storykb::observability
