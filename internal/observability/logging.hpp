#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace tablebook::runtime::config {
class RuntimeConfig;
}

namespace tablebook::observability {

/*
  Structured logging on the default spdlog logger.

  Lines read `message key=value key="value with blanks"`, optionally
  followed by trace_id/span_id of the active span. Level, pattern and
  trace context come from RuntimeConfig.logging and may be overridden
  with TABLEBOOK_LOG_LEVEL, TABLEBOOK_LOG_PATTERN and
  TABLEBOOK_LOG_INCLUDE_TRACE_CONTEXT.
*/
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DoubleField(std::string_view key, double value);

void InitializeLogging(const tablebook::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

} // namespace tablebook::observability

#define TABLEBOOK_LOG_DEBUG(message, ...) ::tablebook::observability::Log(::spdlog::level::debug, (message), ##__VA_ARGS__)
#define TABLEBOOK_LOG_INFO(message, ...) ::tablebook::observability::Log(::spdlog::level::info, (message), ##__VA_ARGS__)
#define TABLEBOOK_LOG_WARN(message, ...) ::tablebook::observability::Log(::spdlog::level::warn, (message), ##__VA_ARGS__)
#define TABLEBOOK_LOG_ERROR(message, ...) ::tablebook::observability::Log(::spdlog::level::err, (message), ##__VA_ARGS__)
