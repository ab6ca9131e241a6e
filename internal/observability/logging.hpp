#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace vkyc::config {
class RuntimeConfig;
}

namespace vkyc::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField DoubleField(std::string_view key, double value);
LogField BoolField(std::string_view key, bool value);

// session_id=<id>; every line about one session carries the same key.
LogField SessionField(std::string_view session_id);

// Keeps the last four characters of a secret such as a link token or an
// OCR-extracted document number.
LogField RedactedField(std::string_view key, std::string_view secret);

void InitializeLogging(const vkyc::config::RuntimeConfig& config);
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

} // namespace vkyc::observability

#define VKYC_LOG_DEBUG(message, ...) ::vkyc::observability::LogDebug((message), ##__VA_ARGS__)
#define VKYC_LOG_INFO(message, ...) ::vkyc::observability::LogInfo((message), ##__VA_ARGS__)
#define VKYC_LOG_WARN(message, ...) ::vkyc::observability::LogWarn((message), ##__VA_ARGS__)
#define VKYC_LOG_ERROR(message, ...) ::vkyc::observability::LogError((message), ##__VA_ARGS__)
