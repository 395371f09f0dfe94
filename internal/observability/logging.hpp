#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace transcription::runtime::config {
class RuntimeConfig;
}

namespace transcription::observability {

// key=value pair appended to a log line; values with spaces or quotes are quoted
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DoubleField(std::string_view key, double value);
// logs whether a credential is set and its last four characters, never the value
LogField SecretField(std::string_view key, std::string_view secret);

void InitializeLogging(const transcription::runtime::config::RuntimeConfig& config);
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

} // namespace transcription::observability

#define TRANSCRIPTION_LOG_DEBUG(message, ...) ::transcription::observability::LogDebug((message), ##__VA_ARGS__)
#define TRANSCRIPTION_LOG_INFO(message, ...) ::transcription::observability::LogInfo((message), ##__VA_ARGS__)
#define TRANSCRIPTION_LOG_WARN(message, ...) ::transcription::observability::LogWarn((message), ##__VA_ARGS__)
#define TRANSCRIPTION_LOG_ERROR(message, ...) ::transcription::observability::LogError((message), ##__VA_ARGS__)
