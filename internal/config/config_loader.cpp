#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cmath>
#include <cstdlib>
#include <stdexcept>

#include "internal/graph/graph_ops.hpp"
#include "internal/model/slippage.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace pulse::config {

namespace {

using google::protobuf::Value;
using pulse::runtime::config::RuntimeConfig;

constexpr uint32_t kDefaultStaleAfterSeconds  = 600;
constexpr uint32_t kDefaultSweepIntervalSeconds = 60;

// Plain scalars that parse as numbers or booleans become typed values so the
// JSON parser accepts them for numeric and bool fields. Quoted scalars
// (tag "!") are always strings.
Value ScalarToValue(const YAML::Node& node) {
  Value       out;
  const auto& text = node.Scalar();

  if (node.Tag() == "!") {
    out.set_string_value(text);
    return out;
  }
  if (text == "true" || text == "false") {
    out.set_bool_value(text == "true");
    return out;
  }

  char*        end    = nullptr;
  const double number = std::strtod(text.c_str(), &end);
  if (!text.empty() && end != nullptr && *end == '\0') {
    out.set_number_value(number);
  } else {
    out.set_string_value(text);
  }
  return out;
}

Value YamlToValue(const YAML::Node& node) {
  Value out;
  switch (node.Type()) {
    case YAML::NodeType::Null:
      out.set_null_value(google::protobuf::NULL_VALUE);
      return out;
    case YAML::NodeType::Scalar:
      return ScalarToValue(node);
    case YAML::NodeType::Sequence:
      for (const auto& item : node) {
        *out.mutable_list_value()->add_values() = YamlToValue(item);
      }
      return out;
    case YAML::NodeType::Map:
      // `memory: {}` must still select the oneof branch
      out.mutable_struct_value();
      for (const auto& entry : node) {
        (*out.mutable_struct_value()->mutable_fields())[entry.first.Scalar()] = YamlToValue(entry.second);
      }
      return out;
    default:
      throw std::runtime_error("Unsupported YAML node in configuration");
  }
}

RuntimeConfig ParseStrict(const Value& document) {
  std::string json;
  auto        encoded = google::protobuf::util::MessageToJsonString(document, &json);
  if (!encoded.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(encoded.message()));
  }

  RuntimeConfig                            config;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto parsed = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!parsed.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(parsed.message()));
  }
  return config;
}

void Reject(const std::string& field, const std::string& reason) {
  throw std::runtime_error("Invalid configuration: " + field + " " + reason);
}

void Validate(const RuntimeConfig& config) {
  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    Reject("database.sqlite.path", "must be set when the sqlite backend is selected");
  }

  const auto& level = config.logging().level();
  if (!level.empty() && !pulse::observability::ParseLevel(level)) {
    Reject("logging.level", "'" + level + "' is not one of trace, debug, info, warn, error, critical, off");
  }

  const auto& execution = config.execution();
  if (execution.default_slippage() != 0.0) {
    try {
      (void)pulse::model::SlippageTolerance::FromDecimal(execution.default_slippage());
    } catch (const pulse::util::InvalidArgument& e) {
      Reject("execution.default_slippage", e.what());
    }
  }
  if (!std::isfinite(execution.node_spacing_x()) || execution.node_spacing_x() < 0.0) {
    Reject("execution.node_spacing_x", "must be a non-negative distance");
  }
}

// Zero means "not configured" for every execution field.
void ApplyExecutionDefaults(RuntimeConfig& config) {
  auto* execution = config.mutable_execution();
  if (execution->default_slippage() == 0.0) {
    execution->set_default_slippage(pulse::model::SlippageTolerance::Default().decimal());
  }
  if (execution->node_spacing_x() == 0.0) {
    execution->set_node_spacing_x(pulse::graph::kDefaultNodeSpacingX);
  }
  if (execution->stale_after_seconds() == 0) {
    execution->set_stale_after_seconds(kDefaultStaleAfterSeconds);
  }
  if (execution->stale_sweep_interval_seconds() == 0) {
    execution->set_stale_sweep_interval_seconds(kDefaultSweepIntervalSeconds);
  }
}

} // namespace

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  auto config = ParseStrict(YamlToValue(yaml));
  Validate(config);
  ApplyExecutionDefaults(config);
  return config;
}

} // namespace pulse::config
