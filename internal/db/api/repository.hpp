#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/automation_record.hpp"
#include "internal/db/model/execution_log_record.hpp"
#include "internal/db/model/execution_record.hpp"
#include "internal/db/model/node_result_record.hpp"

namespace pulse::db {

/*
  Repository abstraction.

  GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - Deleting an automation removes its executions, logs and node results
  - Node result upserts never move run_sequence backwards

  The DB is the source of truth for:
    automation definitions
    execution history
    latest node results
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Automations
  // ---------------------------------------------------------------------

  virtual Result InsertAutomation(Transaction&, const model::AutomationRecord&) = 0;

  virtual std::optional<model::AutomationRecord> GetAutomation(Transaction&, const std::string& id) = 0;

  // Ordered by created_at_ms, then id.
  virtual std::vector<model::AutomationRecord> ListAutomations(Transaction&, const std::string& owner_id) = 0;

  virtual Result UpdateAutomation(Transaction&, const model::AutomationRecord&) = 0;

  virtual Result DeleteAutomation(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Executions
  // ---------------------------------------------------------------------

  virtual Result InsertExecution(Transaction&, const model::ExecutionRecord&) = 0;

  virtual std::optional<model::ExecutionRecord> GetExecution(Transaction&, const std::string& id) = 0;

  // Newest first (highest run_sequence).
  virtual std::vector<model::ExecutionRecord> ListExecutions(Transaction&, const std::string& automation_id,
                                                             std::optional<uint64_t> limit) = 0;

  virtual Result UpdateExecution(Transaction&, const model::ExecutionRecord&) = 0;

  // RUNNING executions of every automation started before the cutoff,
  // oldest first.
  virtual std::vector<model::ExecutionRecord> ListRunningExecutions(Transaction&, uint64_t started_before_ms) = 0;

  // One above the highest run_sequence recorded for the automation.
  virtual uint64_t NextRunSequence(Transaction&, const std::string& automation_id) = 0;

  // ---------------------------------------------------------------------
  // Execution logs
  // ---------------------------------------------------------------------

  virtual Result InsertExecutionLog(Transaction&, const model::ExecutionLogRecord&) = 0;

  // Insertion order.
  virtual std::vector<model::ExecutionLogRecord> GetExecutionLogs(Transaction&, const std::string& execution_id) = 0;

  // ---------------------------------------------------------------------
  // Node results (latest per node)
  // ---------------------------------------------------------------------

  virtual Result UpsertNodeResult(Transaction&, const model::NodeResultRecord&) = 0;

  virtual std::optional<model::NodeResultRecord> GetNodeResult(Transaction&, const std::string& automation_id, const std::string& node_id) = 0;

  virtual std::vector<model::NodeResultRecord> ListNodeResults(Transaction&, const std::string& automation_id) = 0;
};

} // namespace pulse::db
