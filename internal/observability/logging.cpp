#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace transcription::observability {
namespace {

constexpr const char* kLoggerName     = "transcription";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

bool g_include_trace_context{false};

// env wins over the file, then the built-in default
std::string FirstSet(const char* env_name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env_name); value && *value) {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

bool TraceContextRequested(const transcription::runtime::config::RuntimeConfig& config) {
  if (const char* value = std::getenv("TRANSCRIPTION_LOG_INCLUDE_TRACE_CONTEXT"); value && *value) {
    const std::string flag(value);
    return flag == "1" || flag == "true";
  }
  return config.logging().include_trace_context();
}

bool NeedsQuoting(std::string_view value) {
  if (value.empty()) {
    return true;
  }
  for (char c : value) {
    if (c == ' ' || c == '"' || c == '=' || c == '\n' || c == '\t') {
      return true;
    }
  }
  return false;
}

void AppendField(std::ostringstream& line, const LogField& field) {
  line << ' ' << field.key << '=';
  if (NeedsQuoting(field.value)) {
    line << std::quoted(field.value);
  } else {
    line << field.value;
  }
}

#ifdef ENABLE_OTEL
template <std::size_t N>
std::string Hex(const uint8_t (&bytes)[N]) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(N * 2);
  for (uint8_t b : bytes) {
    out.push_back(kDigits[b >> 4]);
    out.push_back(kDigits[b & 0x0F]);
  }
  return out;
}

void AppendTraceContext(std::ostringstream& line) {
  if (!g_include_trace_context) {
    return;
  }
  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return;
  }
  const auto context = span->GetContext();
  if (!context.IsValid()) {
    return;
  }

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  line << " trace_id=" << Hex(trace_bytes) << " span_id=" << Hex(span_bytes);
}
#else
void AppendTraceContext(std::ostringstream&) {
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

LogField DoubleField(std::string_view key, double value) {
  std::ostringstream out;
  out << value;
  return {std::string(key), out.str()};
}

LogField SecretField(std::string_view key, std::string_view secret) {
  if (secret.empty()) {
    return {std::string(key), "unset"};
  }
  if (secret.size() <= 8) {
    return {std::string(key), "****"};
  }
  return {std::string(key), "****" + std::string(secret.substr(secret.size() - 4))};
}

void InitializeLogging(const transcription::runtime::config::RuntimeConfig& config) {
  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stdout_color_mt(kLoggerName);
  }
  logger->set_pattern(FirstSet("TRANSCRIPTION_LOG_PATTERN", config.logging().pattern(), kDefaultPattern));
  logger->set_level(spdlog::level::from_str(FirstSet("TRANSCRIPTION_LOG_LEVEL", config.logging().level(), "info")));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
  g_include_trace_context = TraceContextRequested(config);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }

  std::ostringstream line;
  line << message;
  for (const auto& field : fields) {
    AppendField(line, field);
  }
  AppendTraceContext(line);
  spdlog::log(level, "{}", line.str());
}

} // namespace transcription::observability
