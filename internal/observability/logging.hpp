#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace freight::runtime::config {
class RuntimeConfig;
}

namespace freight::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DoubleField(std::string_view key, double value);

void InitializeLogging(const freight::runtime::config::RuntimeConfig& config);
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

} // namespace freight::observability

#define FREIGHT_LOG_DEBUG(message, ...) ::freight::observability::LogDebug((message), ##__VA_ARGS__)
#define FREIGHT_LOG_INFO(message, ...) ::freight::observability::LogInfo((message), ##__VA_ARGS__)
#define FREIGHT_LOG_WARN(message, ...) ::freight::observability::LogWarn((message), ##__VA_ARGS__)
#define FREIGHT_LOG_ERROR(message, ...) ::freight::observability::LogError((message), ##__VA_ARGS__)
