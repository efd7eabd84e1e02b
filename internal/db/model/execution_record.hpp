#pragma once

#include <cstdint>
#include <string>

#include "pulse/automation/v1/execution.pb.h"

namespace pulse::db::model {

// One run of an automation. run_sequence grows per automation.
struct ExecutionRecord {
  std::string id;
  std::string automation_id;
  uint64_t    run_sequence = 0;

  pulse::automation::v1::RunStatus status = pulse::automation::v1::RUN_STATUS_RUNNING;

  std::string error;
  uint64_t    started_at_ms  = 0;
  uint64_t    finished_at_ms = 0;  // 0 while running
};

} // namespace pulse::db::model
