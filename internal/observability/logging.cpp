#include "internal/observability/logging.hpp"

#include <cstdlib>
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

namespace blockforge::observability {
namespace {

struct LoggingSettings {
  std::string level{"info"};
  std::string pattern{"%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [blockforge] %v"};
  bool        include_trace_context{false};
};

bool EnvFlag(const char* value) {
  const std::string flag(value);
  return flag == "1" || flag == "true" || flag == "yes";
}

// Environment overrides config; config overrides defaults.
LoggingSettings ResolveSettings(const blockforge::runtime::config::RuntimeConfig& config) {
  LoggingSettings settings;
  const auto&     logging = config.logging();

  if (!logging.level().empty()) settings.level = logging.level();
  if (!logging.pattern().empty()) settings.pattern = logging.pattern();
  settings.include_trace_context = logging.include_trace_context();

  if (const char* level = std::getenv("BLOCKFORGE_LOG_LEVEL")) settings.level = level;
  if (const char* pattern = std::getenv("BLOCKFORGE_LOG_PATTERN")) settings.pattern = pattern;
  if (const char* trace = std::getenv("BLOCKFORGE_LOG_INCLUDE_TRACE_CONTEXT")) settings.include_trace_context = EnvFlag(trace);

  return settings;
}

bool g_include_trace_context{false};

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool               first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=' << field.value;
  }
  return out.str();
}

#ifdef ENABLE_OTEL
std::string HexId(const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           result;
  result.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    result.push_back(kHex[(data[i] >> 4) & 0x0F]);
    result.push_back(kHex[data[i] & 0x0F]);
  }
  return result;
}

std::string TraceContextFields() {
  if (!g_include_trace_context) {
    return {};
  }

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return {};
  }

  auto context = span->GetContext();
  if (!context.IsValid()) {
    return {};
  }

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  return "trace_id=" + HexId(trace_bytes, 16) + " span_id=" + HexId(span_bytes, 8);
}
#else
std::string TraceContextFields() {
  return {};
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

LogField BlockField(std::uint64_t block_id) {
  return {"block_id", std::to_string(block_id)};
}

LogField VersionField(std::uint32_t version) {
  return {"version", std::to_string(version)};
}

void InitializeLogging(const blockforge::runtime::config::RuntimeConfig& config) {
  const auto settings = ResolveSettings(config);

  auto logger = spdlog::get("blockforge");
  if (!logger) {
    logger = spdlog::stdout_color_mt("blockforge");
  }
  logger->set_pattern(settings.pattern);
  logger->set_level(spdlog::level::from_str(settings.level));
  spdlog::set_default_logger(logger);
  spdlog::flush_on(spdlog::level::warn);
  g_include_trace_context = settings.include_trace_context;
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto serialized_fields = SerializeFields(fields);
  auto trace_fields      = TraceContextFields();

  if (!serialized_fields.empty() && !trace_fields.empty()) {
    spdlog::log(level, "{} {} {}", message, serialized_fields, trace_fields);
    return;
  }
  if (!serialized_fields.empty()) {
    spdlog::log(level, "{} {}", message, serialized_fields);
    return;
  }
  if (!trace_fields.empty()) {
    spdlog::log(level, "{} {}", message, trace_fields);
    return;
  }
  spdlog::log(level, "{}", message);
}

} // namespace blockforge::observability
