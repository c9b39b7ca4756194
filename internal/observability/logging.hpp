#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <exception>
#include <initializer_list>
#include <string>
#include <string_view>

namespace tierbridge::runtime::config {
class RuntimeConfig;
}

namespace tierbridge::observability {

/*
  Structured log lines: "<message> key=value key=value".

  Values containing spaces are quoted. Paths and error texts are the common
  case, so every field goes through the same quoting.
*/
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Byte counts, rendered as "<n> (<human>)" so 4 GiB moves stay readable.
LogField BytesField(std::string_view key, std::uint64_t bytes);

// key "error", value what().
LogField ErrorField(const std::exception& error);

void InitializeLogging(const tierbridge::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

// False when level is below the configured threshold; lets hot paths skip field building.
bool Enabled(spdlog::level::level_enum level);

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

} // namespace tierbridge::observability

#define TIERBRIDGE_LOG_DEBUG(message, ...) ::tierbridge::observability::LogDebug((message), ##__VA_ARGS__)
#define TIERBRIDGE_LOG_INFO(message, ...) ::tierbridge::observability::LogInfo((message), ##__VA_ARGS__)
#define TIERBRIDGE_LOG_WARN(message, ...) ::tierbridge::observability::LogWarn((message), ##__VA_ARGS__)
#define TIERBRIDGE_LOG_ERROR(message, ...) ::tierbridge::observability::LogError((message), ##__VA_ARGS__)
