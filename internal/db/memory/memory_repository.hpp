#pragma once

#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace pulse::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertAutomation(Transaction&, const model::AutomationRecord&) override;
  std::optional<model::AutomationRecord> GetAutomation(Transaction&, const std::string&) override;
  std::vector<model::AutomationRecord> ListAutomations(Transaction&, const std::string& owner_id) override;
  Result UpdateAutomation(Transaction&, const model::AutomationRecord&) override;
  Result DeleteAutomation(Transaction&, const std::string&) override;

  Result InsertExecution(Transaction&, const model::ExecutionRecord&) override;
  std::optional<model::ExecutionRecord> GetExecution(Transaction&, const std::string&) override;
  std::vector<model::ExecutionRecord> ListExecutions(Transaction&, const std::string& automation_id,
                                                     std::optional<uint64_t> limit) override;
  Result UpdateExecution(Transaction&, const model::ExecutionRecord&) override;
  std::vector<model::ExecutionRecord> ListRunningExecutions(Transaction&, uint64_t started_before_ms) override;
  uint64_t NextRunSequence(Transaction&, const std::string& automation_id) override;

  Result InsertExecutionLog(Transaction&, const model::ExecutionLogRecord&) override;
  std::vector<model::ExecutionLogRecord> GetExecutionLogs(Transaction&, const std::string& execution_id) override;

  Result UpsertNodeResult(Transaction&, const model::NodeResultRecord&) override;
  std::optional<model::NodeResultRecord> GetNodeResult(Transaction&, const std::string& automation_id,
                                                       const std::string& node_id) override;
  std::vector<model::NodeResultRecord> ListNodeResults(Transaction&, const std::string& automation_id) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::map<std::string, model::AutomationRecord> automations;
    std::map<std::string, model::ExecutionRecord>  executions;
    std::vector<model::ExecutionLogRecord>         logs;

    std::map<std::pair<std::string, std::string>, model::NodeResultRecord> node_results;
  };

  // Held by a transaction for its whole lifetime.
  std::mutex writer_mutex_;

  std::mutex state_mutex_;
  State      committed_;
};

} // namespace pulse::db::memory
