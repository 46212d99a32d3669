#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <string>
#include <utility>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace strata::observability {
namespace {

constexpr const char* kLoggerName     = "strata";
constexpr const char* kDefaultLevel   = "info";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

// environment beats the config file, which beats the built-in default
std::string Setting(const char* env_name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env_name)) {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

// Values with spaces, quotes or '=' are quoted so key=value stays parseable.
void AppendValue(std::string& out, const std::string& value) {
  if (!value.empty() && value.find_first_of(" \t\"=") == std::string::npos) {
    out += value;
    return;
  }
  out += '"';
  for (char c : value) {
    if (c == '"' || c == '\\') out += '\\';
    out += c;
  }
  out += '"';
}

std::string Render(std::string_view message, std::initializer_list<LogField> fields) {
  std::string line(message);
  for (const auto& field : fields) {
    line += ' ';
    line += field.key;
    line += '=';
    AppendValue(line, field.value);
  }
  return line;
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField UintField(std::string_view key, std::uint64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const strata::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  // stdout carries command output; logs go to stderr
  spdlog::drop(kLoggerName);
  auto logger = spdlog::stderr_color_mt(kLoggerName);
  logger->set_pattern(Setting("STRATA_LOG_PATTERN", logging.pattern(), kDefaultPattern));
  logger->set_level(spdlog::level::from_str(Setting("STRATA_LOG_LEVEL", logging.level(), kDefaultLevel)));
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(std::move(logger));
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }
  spdlog::log(level, "{}", Render(message, fields));
}

} // namespace strata::observability
