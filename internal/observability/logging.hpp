#pragma once

#include <spdlog/common.h>

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace discovery::runtime::config {
class RuntimeConfig;
}

namespace discovery::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
// Rendered as "<n>ms".
LogField DurationField(std::string_view key, std::chrono::milliseconds value);

/*
  Installs the process-wide logger. `role` names the binary (registry-server,
  read-server); every line is tagged "<role>@<node_id>" so merged logs from a
  cluster stay attributable. DISCOVERY_LOG_LEVEL / DISCOVERY_LOG_PATTERN
  override the config values.
*/
void InitializeLogging(const discovery::runtime::config::RuntimeConfig& config, std::string_view role);
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

} // namespace discovery::observability

#define DISCOVERY_LOG_INFO(message, ...) ::discovery::observability::LogInfo((message), ##__VA_ARGS__)
#define DISCOVERY_LOG_WARN(message, ...) ::discovery::observability::LogWarn((message), ##__VA_ARGS__)
#define DISCOVERY_LOG_ERROR(message, ...) ::discovery::observability::LogError((message), ##__VA_ARGS__)
