#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace loadplan::runtime::config {
class RuntimeConfig;
}

namespace loadplan::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField DoubleField(std::string_view key, double value);
LogField BoolField(std::string_view key, bool value);

// Throws std::runtime_error when the configured level is not a spdlog level name.
void InitializeLogging(const loadplan::runtime::config::RuntimeConfig& config);

spdlog::level::level_enum ParseLevel(std::string_view name);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace loadplan::observability

#define LOADPLAN_LOG_DEBUG(message, ...) ::loadplan::observability::LogDebug((message), ##__VA_ARGS__)
#define LOADPLAN_LOG_INFO(message, ...) ::loadplan::observability::LogInfo((message), ##__VA_ARGS__)
#define LOADPLAN_LOG_ERROR(message, ...) ::loadplan::observability::LogError((message), ##__VA_ARGS__)
