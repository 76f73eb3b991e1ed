#pragma once

#include <spdlog/common.h>

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace booking::runtime::config {
class LoggingConfig;
}

namespace booking::observability {

/*
  Structured log line: "<message> key=value key=value ...".
  Values with spaces, quotes or '=' are double-quoted.
*/
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField TimeField(std::string_view key, std::chrono::system_clock::time_point value);

// Environment (BOOKING_LOG_LEVEL, BOOKING_LOG_PATTERN,
// BOOKING_LOG_INCLUDE_TRACE_CONTEXT) overrides the config.
void InitializeLogging(const runtime::config::LoggingConfig& config);
void ShutdownLogging();

std::string FormatLine(std::string_view message, std::initializer_list<LogField> fields);

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

} // namespace booking::observability

#define BOOKING_LOG_DEBUG(message, ...) ::booking::observability::Log(::spdlog::level::debug, (message), ##__VA_ARGS__)
#define BOOKING_LOG_INFO(message, ...) ::booking::observability::Log(::spdlog::level::info, (message), ##__VA_ARGS__)
#define BOOKING_LOG_WARN(message, ...) ::booking::observability::Log(::spdlog::level::warn, (message), ##__VA_ARGS__)
#define BOOKING_LOG_ERROR(message, ...) ::booking::observability::Log(::spdlog::level::err, (message), ##__VA_ARGS__)
