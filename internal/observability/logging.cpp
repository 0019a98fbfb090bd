#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace relay::observability {
namespace {

constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

std::string ResolveLevel(std::string_view configured) {
  if (const char* level = std::getenv("RELAY_LOG_LEVEL")) {
    return level;
  }

  if (!configured.empty()) {
    return std::string(configured);
  }

  return "info";
}

std::string ResolvePattern(std::string_view configured) {
  if (const char* pattern = std::getenv("RELAY_LOG_PATTERN")) {
    return pattern;
  }

  if (!configured.empty()) {
    return std::string(configured);
  }

  return kDefaultPattern;
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool               first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=' << field.value;
  }
  return out.str();
}

void Install(std::string_view logger_name, const std::string& level, const std::string& pattern) {
  spdlog::drop(std::string(logger_name));
  auto logger = spdlog::stdout_color_mt(std::string(logger_name));
  logger->set_pattern(pattern);
  logger->set_level(spdlog::level::from_str(level));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const relay::runtime::config::RuntimeConfig& config) {
  Install("relay", ResolveLevel(config.logging().level()), ResolvePattern(config.logging().pattern()));
}

void InitializeLogging(std::string_view logger_name, std::string_view level) {
  Install(logger_name, ResolveLevel(level), ResolvePattern({}));
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto serialized_fields = SerializeFields(fields);

  if (!serialized_fields.empty()) {
    spdlog::log(level, "{} {}", message, serialized_fields);
    return;
  }
  spdlog::log(level, "{}", message);
}

} // namespace relay::observability
