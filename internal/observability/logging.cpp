#include "internal/observability/logging.hpp"

#include <algorithm>
#include <array>
#include <cstdlib>
#include <sstream>
#include <string>
#include <utility>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace pulse::observability {
namespace {

thread_local std::vector<LogField> t_scoped_fields;

constexpr std::array<std::pair<std::string_view, spdlog::level::level_enum>, 7> kLevels = {{
    {"trace", spdlog::level::trace},
    {"debug", spdlog::level::debug},
    {"info", spdlog::level::info},
    {"warn", spdlog::level::warn},
    {"error", spdlog::level::err},
    {"critical", spdlog::level::critical},
    {"off", spdlog::level::off},
}};

// An unknown PULSE_LOG_LEVEL is ignored; the config value was validated at load.
spdlog::level::level_enum ResolveLevel(const pulse::runtime::config::RuntimeConfig& config) {
  if (const char* env = std::getenv("PULSE_LOG_LEVEL")) {
    if (auto level = ParseLevel(env)) {
      return *level;
    }
  }

  if (auto level = ParseLevel(config.logging().level())) {
    return *level;
  }

  return spdlog::level::info;
}

std::string ResolvePattern(const pulse::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("PULSE_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool first = true;
  auto write = [&](const LogField& field) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=' << field.value;
  };

  for (const auto& field : fields) {
    write(field);
  }
  for (const auto& scoped : t_scoped_fields) {
    const bool shadowed = std::any_of(fields.begin(), fields.end(), [&](const LogField& f) { return f.key == scoped.key; });
    if (!shadowed) {
      write(scoped);
    }
  }
  return out.str();
}

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

std::optional<spdlog::level::level_enum> ParseLevel(std::string_view name) {
  for (const auto& [label, level] : kLevels) {
    if (label == name) {
      return level;
    }
  }
  return std::nullopt;
}

LogScope::LogScope(std::initializer_list<LogField> fields) : previous_size_(t_scoped_fields.size()) {
  t_scoped_fields.insert(t_scoped_fields.end(), fields.begin(), fields.end());
}

LogScope::~LogScope() {
  t_scoped_fields.resize(previous_size_);
}

const std::vector<LogField>& ScopedFields() {
  return t_scoped_fields;
}

void InitializeLogging(const pulse::runtime::config::RuntimeConfig& config) {
  auto logger = spdlog::stdout_color_mt("pulse-automation");
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(ResolveLevel(config));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto serialized_fields = SerializeFields(fields);

  if (!serialized_fields.empty()) {
    spdlog::log(level, "{} {}", message, serialized_fields);
    return;
  }
  spdlog::log(level, "{}", message);
}

} // namespace pulse::observability
