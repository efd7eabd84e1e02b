#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_tx.hpp"

namespace pulse::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

} // namespace pulse::db::sqlite
