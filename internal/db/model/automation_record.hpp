#pragma once

#include <cstdint>
#include <string>

namespace pulse::db::model {

/*
  Persistent automation row.

  definition_json is the automation graph encoded as protobuf JSON
  (pulse.automation.v1.Graph). The record owns the graph; there are no
  separate node or connection rows.
*/
struct AutomationRecord {
  std::string id;
  std::string owner_id;
  std::string name;
  std::string definition_json;

  // Applied to swap-like nodes appended without an explicit tolerance.
  double default_slippage = 0.01;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

} // namespace pulse::db::model
