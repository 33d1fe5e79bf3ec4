#include "internal/observability/logging.hpp"

#include <cstdint>
#include <cstdlib>
#include <sstream>
#include <string>
#include <string_view>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace tablebook::observability {
namespace {

using tablebook::runtime::config::RuntimeConfig;

constexpr std::string_view kLoggerName     = "tablebook";
constexpr std::string_view kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

bool g_include_trace_context{false};

std::string EnvOr(const char* name, const std::string& fallback) {
  const char* value = std::getenv(name);
  return value != nullptr && *value != '\0' ? std::string(value) : fallback;
}

// spdlog maps unknown names to "off"; treat those as info instead.
spdlog::level::level_enum ParseLevel(const std::string& name) {
  if (name == "warning") return spdlog::level::warn;
  if (name == "error") return spdlog::level::err;

  auto level = spdlog::level::from_str(name);
  if (level == spdlog::level::off && name != "off") return spdlog::level::info;
  return level;
}

bool NeedsQuoting(std::string_view value) {
  if (value.empty()) return true;
  return value.find_first_of(" \t\n\"=") != std::string_view::npos;
}

// key=value pairs; values with blanks, quotes or '=' are quoted
void AppendField(std::string& line, const LogField& field) {
  line.push_back(' ');
  line.append(field.key);
  line.push_back('=');
  if (!NeedsQuoting(field.value)) {
    line.append(field.value);
    return;
  }

  line.push_back('"');
  for (char c : field.value) {
    switch (c) {
      case '"': line.append("\\\""); break;
      case '\\': line.append("\\\\"); break;
      case '\n': line.append("\\n"); break;
      case '\t': line.append("\\t"); break;
      default: line.push_back(c);
    }
  }
  line.push_back('"');
}

#ifdef ENABLE_OTEL
template <std::size_t N>
std::string HexId(const uint8_t (&bytes)[N]) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(N * 2);
  for (uint8_t b : bytes) {
    out.push_back(kHex[b >> 4]);
    out.push_back(kHex[b & 0x0F]);
  }
  return out;
}

void AppendTraceContext(std::string& line) {
  if (!g_include_trace_context) return;

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return;

  const auto context = span->GetContext();
  if (!context.IsValid() || !context.trace_id().IsValid() || !context.span_id().IsValid()) return;

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  AppendField(line, {"trace_id", HexId(trace_bytes)});
  AppendField(line, {"span_id", HexId(span_bytes)});
}
#else
void AppendTraceContext(std::string&) {}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField DoubleField(std::string_view key, double value) {
  std::ostringstream out;
  out.setf(std::ios::fixed);
  out.precision(1);
  out << value;
  return {std::string(key), out.str()};
}

void InitializeLogging(const RuntimeConfig& config) {
  const auto& logging = config.logging();

  auto logger = spdlog::get(std::string(kLoggerName));
  if (!logger) {
    logger = spdlog::stdout_color_mt(std::string(kLoggerName));
  }

  const auto pattern = EnvOr("TABLEBOOK_LOG_PATTERN", logging.pattern().empty() ? std::string(kDefaultPattern) : logging.pattern());
  const auto level   = EnvOr("TABLEBOOK_LOG_LEVEL", logging.level().empty() ? std::string("info") : logging.level());
  logger->set_pattern(pattern);
  logger->set_level(ParseLevel(level));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  const auto trace = EnvOr("TABLEBOOK_LOG_INCLUDE_TRACE_CONTEXT", logging.include_trace_context() ? "true" : "false");
  g_include_trace_context = trace == "1" || trace == "true";
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) return;

  std::string line(message);
  for (const auto& field : fields) AppendField(line, field);
  AppendTraceContext(line);
  spdlog::log(level, "{}", line);
}

} // namespace tablebook::observability
