#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace strata::runtime::config {
class RuntimeConfig;
}

namespace strata::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField UintField(std::string_view key, std::uint64_t value);
LogField BoolField(std::string_view key, bool value);

// Safe to call more than once; the previous "strata" logger is replaced.
void InitializeLogging(const strata::runtime::config::RuntimeConfig& config);
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

} // namespace strata::observability

#define STRATA_LOG_DEBUG(message, ...) ::strata::observability::LogDebug((message), ##__VA_ARGS__)
#define STRATA_LOG_INFO(message, ...) ::strata::observability::LogInfo((message), ##__VA_ARGS__)
#define STRATA_LOG_WARN(message, ...) ::strata::observability::LogWarn((message), ##__VA_ARGS__)
#define STRATA_LOG_ERROR(message, ...) ::strata::observability::LogError((message), ##__VA_ARGS__)
