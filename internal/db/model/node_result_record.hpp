#pragma once

#include <cstdint>
#include <string>

namespace pulse::db::model {

/*
  Latest durable result of a node, keyed by (automation_id, node_id).

  Writes carrying a lower run_sequence than the stored row are discarded,
  so a slow writer from an older run never overwrites a newer result.
*/
struct NodeResultRecord {
  std::string automation_id;
  std::string node_id;
  std::string execution_id;
  uint64_t    run_sequence = 0;
  std::string artifact_json;
  uint64_t    updated_at_ms = 0;
};

} // namespace pulse::db::model
