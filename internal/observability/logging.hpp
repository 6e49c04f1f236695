#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace runlens::runtime::config {
class RuntimeConfig;
}

namespace runlens::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField DoubleField(std::string_view key, double value);
LogField BoolField(std::string_view key, bool value);

void InitializeLogging(const runlens::runtime::config::RuntimeConfig& config);
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

} // namespace runlens::observability

#define RUNLENS_LOG_DEBUG(message, ...) ::runlens::observability::LogDebug((message), ##__VA_ARGS__)
#define RUNLENS_LOG_INFO(message, ...) ::runlens::observability::LogInfo((message), ##__VA_ARGS__)
#define RUNLENS_LOG_WARN(message, ...) ::runlens::observability::LogWarn((message), ##__VA_ARGS__)
#define RUNLENS_LOG_ERROR(message, ...) ::runlens::observability::LogError((message), ##__VA_ARGS__)
