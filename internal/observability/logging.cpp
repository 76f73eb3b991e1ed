#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/util/time.hpp"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/context.h>
#include <opentelemetry/trace/span.h>
#endif

namespace booking::observability {
namespace {

constexpr const char* kLoggerName     = "booking-engine";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

bool g_trace_context = false;

std::string EnvOr(const char* name, const std::string& fallback) {
  const char* value = std::getenv(name);
  return value ? std::string(value) : fallback;
}

bool NeedsQuotes(std::string_view value) {
  if (value.empty()) return true;
  return value.find_first_of(" \t\"=") != std::string_view::npos;
}

void AppendValue(std::string& line, std::string_view value) {
  if (!NeedsQuotes(value)) {
    line.append(value);
    return;
  }
  line.push_back('"');
  for (char c : value) {
    if (c == '"' || c == '\\') line.push_back('\\');
    line.push_back(c);
  }
  line.push_back('"');
}

void AppendTraceContext(std::string& line) {
#ifdef ENABLE_OTEL
  auto span    = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  auto context = span->GetContext();
  if (!context.IsValid()) return;

  char trace_id[32];
  char span_id[16];
  context.trace_id().ToLowerBase16(trace_id);
  context.span_id().ToLowerBase16(span_id);
  line.append(" trace_id=").append(trace_id, sizeof(trace_id));
  line.append(" span_id=").append(span_id, sizeof(span_id));
#else
  (void)line;
#endif
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField TimeField(std::string_view key, std::chrono::system_clock::time_point value) {
  return {std::string(key), util::FormatTimestamp(value)};
}

void InitializeLogging(const runtime::config::LoggingConfig& config) {
  const auto level   = EnvOr("BOOKING_LOG_LEVEL", config.level().empty() ? "info" : config.level());
  const auto pattern = EnvOr("BOOKING_LOG_PATTERN", config.pattern().empty() ? kDefaultPattern : config.pattern());
  const auto trace   = EnvOr("BOOKING_LOG_INCLUDE_TRACE_CONTEXT", config.include_trace_context() ? "true" : "false");

  auto logger = spdlog::get(kLoggerName);
  if (!logger) logger = spdlog::stderr_color_mt(kLoggerName);
  logger->set_pattern(pattern);
  logger->set_level(spdlog::level::from_str(level));
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(std::move(logger));

  g_trace_context = trace == "1" || trace == "true";
}

void ShutdownLogging() {
  if (auto logger = spdlog::default_logger()) logger->flush();
  spdlog::shutdown();
}

std::string FormatLine(std::string_view message, std::initializer_list<LogField> fields) {
  std::string line(message);
  for (const auto& field : fields) {
    line.push_back(' ');
    line.append(field.key).push_back('=');
    AppendValue(line, field.value);
  }
  return line;
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto* logger = spdlog::default_logger_raw();
  if (!logger || !logger->should_log(level)) return;

  auto line = FormatLine(message, fields);
  if (g_trace_context) AppendTraceContext(line);
  logger->log(level, "{}", line);
}

} // namespace booking::observability
