#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pulse::runtime::config {
class RuntimeConfig;
}

namespace pulse::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Strict level names (trace, debug, info, warn, error, critical, off).
std::optional<spdlog::level::level_enum> ParseLevel(std::string_view name);

void InitializeLogging(const pulse::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

/*
  LogScope

  Fields attached to every line logged on this thread while the scope is
  alive, e.g. the automation and execution a run is working on. Scopes nest;
  a field passed to the log call itself wins over a scoped one with the
  same key.
*/
class LogScope {
 public:
  explicit LogScope(std::initializer_list<LogField> fields);
  ~LogScope();

  LogScope(const LogScope&)            = delete;
  LogScope& operator=(const LogScope&) = delete;

 private:
  std::size_t previous_size_;
};

// Scoped fields currently active on this thread, outermost first.
const std::vector<LogField>& ScopedFields();

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

} // namespace pulse::observability

#define PULSE_LOG_DEBUG(message, ...) ::pulse::observability::LogDebug((message), ##__VA_ARGS__)
#define PULSE_LOG_INFO(message, ...) ::pulse::observability::LogInfo((message), ##__VA_ARGS__)
#define PULSE_LOG_WARN(message, ...) ::pulse::observability::LogWarn((message), ##__VA_ARGS__)
#define PULSE_LOG_ERROR(message, ...) ::pulse::observability::LogError((message), ##__VA_ARGS__)
