#pragma once

#include <cstdint>
#include <string>

namespace pulse::db::model {

// Per-node entry of an execution. input/output are serialized artifacts.
struct ExecutionLogRecord {
  std::string execution_id;
  std::string node_id;
  std::string node_type;
  std::string input_json;
  std::string output_json;
  std::string error;
  uint64_t    created_at_ms = 0;
};

} // namespace pulse::db::model
