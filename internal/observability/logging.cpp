#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace apparatus::observability {
namespace {

constexpr char kLoggerName[]     = "apparatus";
constexpr char kDefaultPattern[] = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

bool g_include_trace_context{false};

// Environment beats config beats the default.
std::string Setting(const char* env_name, const std::string& configured, std::string fallback) {
  if (const char* value = std::getenv(env_name)) {
    return value;
  }
  return configured.empty() ? std::move(fallback) : configured;
}

spdlog::level::level_enum ParseLevel(const std::string& name) {
  auto level = spdlog::level::from_str(name);
  // from_str answers "off" for names it does not know
  if (level == spdlog::level::off && name != "off") {
    throw std::invalid_argument("unknown log level \"" + name + "\"");
  }
  return level;
}

bool TraceContextEnabled(const apparatus::runtime::config::LoggingConfig& logging) {
  if (const char* include_trace = std::getenv("APPARATUS_LOG_INCLUDE_TRACE_CONTEXT")) {
    const std::string value(include_trace);
    return value == "1" || value == "true";
  }
  return logging.include_trace_context();
}

#ifdef ENABLE_OTEL
std::string Hex(const uint8_t* data, std::size_t size) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    out.push_back(kDigits[data[i] >> 4]);
    out.push_back(kDigits[data[i] & 0x0F]);
  }
  return out;
}

void AppendTraceContext(std::string& line) {
  if (!g_include_trace_context) {
    return;
  }
  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return;
  }
  auto context = span->GetContext();
  if (!context.IsValid()) {
    return;
  }

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  line += " trace_id=" + Hex(trace_bytes, sizeof(trace_bytes)) + " span_id=" + Hex(span_bytes, sizeof(span_bytes));
}
#else
void AppendTraceContext(std::string&) {
}
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

void InitializeLogging(const apparatus::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();
  const auto  level   = ParseLevel(Setting("APPARATUS_LOG_LEVEL", logging.level(), "info"));

  // stdout belongs to the embedding program
  std::vector<spdlog::sink_ptr> sinks{std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
  if (!logging.file().empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(logging.file()));
  }

  // re-initializing swaps the logger in place
  spdlog::drop(kLoggerName);
  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_pattern(Setting("APPARATUS_LOG_PATTERN", logging.pattern(), kDefaultPattern));
  logger->set_level(level);
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(std::move(logger));

  g_include_trace_context = TraceContextEnabled(logging);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  std::string line(message);
  for (const auto& field : fields) {
    line += ' ';
    line += field.key;
    line += '=';
    line += field.value;
  }
  AppendTraceContext(line);
  spdlog::log(level, "{}", line);
}

} // namespace apparatus::observability
