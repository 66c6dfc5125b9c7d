#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace registry::runtime::config {
class RuntimeConfig;
}

namespace registry::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField UintField(std::string_view key, std::uint64_t value);
LogField BoolField(std::string_view key, bool value);

// Level and pattern: REGISTRY_LOG_LEVEL / REGISTRY_LOG_PATTERN, then config, then defaults.
void InitializeLogging(const registry::runtime::config::RuntimeConfig& config);
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

} // namespace registry::observability

#define REGISTRY_LOG_DEBUG(message, ...) ::registry::observability::LogDebug((message), ##__VA_ARGS__)
#define REGISTRY_LOG_INFO(message, ...) ::registry::observability::LogInfo((message), ##__VA_ARGS__)
#define REGISTRY_LOG_WARN(message, ...) ::registry::observability::LogWarn((message), ##__VA_ARGS__)
#define REGISTRY_LOG_ERROR(message, ...) ::registry::observability::LogError((message), ##__VA_ARGS__)
