#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace blockforge::runtime::config {
class RuntimeConfig;
}

namespace blockforge::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Lifecycle events always carry the block and, where relevant, the version.
LogField BlockField(std::uint64_t block_id);
LogField VersionField(std::uint32_t version);

void InitializeLogging(const blockforge::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace blockforge::observability

#define BLOCKFORGE_LOG_INFO(message, ...) ::blockforge::observability::LogInfo((message), ##__VA_ARGS__)
#define BLOCKFORGE_LOG_WARN(message, ...) ::blockforge::observability::LogWarn((message), ##__VA_ARGS__)
#define BLOCKFORGE_LOG_ERROR(message, ...) ::blockforge::observability::LogError((message), ##__VA_ARGS__)
