#pragma once

#include <spdlog/common.h>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <initializer_list>
#include <string>
#include <string_view>

namespace dispatcher::runtime::config {
class RuntimeConfig;
}

namespace dispatcher::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField SizeField(std::string_view key, std::size_t value);

// error=<what()>
LogField ErrorField(const std::exception& e);

/*
  Renders fields as key=value pairs separated by spaces. A value that is
  empty or holds a space, control whitespace, '"', '\\' or '=' is written
  as a double-quoted, backslash-escaped string.
*/
std::string FormatFields(std::initializer_list<LogField> fields);

void InitializeLogging(const dispatcher::runtime::config::RuntimeConfig& config);
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

} // namespace dispatcher::observability

#define DISPATCHER_LOG_DEBUG(message, ...) ::dispatcher::observability::LogDebug((message), ##__VA_ARGS__)
#define DISPATCHER_LOG_INFO(message, ...) ::dispatcher::observability::LogInfo((message), ##__VA_ARGS__)
#define DISPATCHER_LOG_WARN(message, ...) ::dispatcher::observability::LogWarn((message), ##__VA_ARGS__)
#define DISPATCHER_LOG_ERROR(message, ...) ::dispatcher::observability::LogError((message), ##__VA_ARGS__)
