#include "internal/db/memory/memory_repository.hpp"

#include <algorithm>

#include "internal/db/memory/memory_tx.hpp"

namespace pulse::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Automations
// ------------------------------------------------------------------

Result MemoryRepository::InsertAutomation(Transaction& t, const model::AutomationRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.automations.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "automation exists: " + r.id);
  s.automations[r.id] = r;
  return Result::Ok();
}

std::optional<model::AutomationRecord> MemoryRepository::GetAutomation(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.automations.find(id);
  if (it == s.automations.end()) return std::nullopt;
  return it->second;
}

std::vector<model::AutomationRecord> MemoryRepository::ListAutomations(Transaction& t, const std::string& owner_id) {
  std::vector<model::AutomationRecord> out;
  for (const auto& [_, record] : TX(t).View().automations) {
    if (record.owner_id == owner_id) out.push_back(record);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return a.created_at_ms != b.created_at_ms ? a.created_at_ms < b.created_at_ms : a.id < b.id;
  });
  return out;
}

Result MemoryRepository::UpdateAutomation(Transaction& t, const model::AutomationRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.automations.contains(r.id)) return Result::Err(ErrorCode::NotFound, "automation not found: " + r.id);
  s.automations[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteAutomation(Transaction& t, const std::string& id) {
  auto& s = TX(t).Mutable();
  if (s.automations.erase(id) == 0) return Result::Err(ErrorCode::NotFound, "automation not found: " + id);

  for (auto it = s.executions.begin(); it != s.executions.end();) {
    if (it->second.automation_id != id) {
      ++it;
      continue;
    }
    const auto execution_id = it->first;
    std::erase_if(s.logs, [&](const auto& log) { return log.execution_id == execution_id; });
    it = s.executions.erase(it);
  }
  std::erase_if(s.node_results, [&](const auto& entry) { return entry.first.first == id; });
  return Result::Ok();
}

// ------------------------------------------------------------------
// Executions
// ------------------------------------------------------------------

Result MemoryRepository::InsertExecution(Transaction& t, const model::ExecutionRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.automations.contains(r.automation_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "automation not found: " + r.automation_id);
  }
  if (s.executions.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "execution exists: " + r.id);
  for (const auto& [_, existing] : s.executions) {
    if (existing.automation_id == r.automation_id && existing.run_sequence == r.run_sequence) {
      return Result::Err(ErrorCode::AlreadyExists, "run sequence already used");
    }
  }
  s.executions[r.id] = r;
  return Result::Ok();
}

std::optional<model::ExecutionRecord> MemoryRepository::GetExecution(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.executions.find(id);
  if (it == s.executions.end()) return std::nullopt;
  return it->second;
}

std::vector<model::ExecutionRecord> MemoryRepository::ListExecutions(Transaction& t, const std::string& automation_id,
                                                                     std::optional<uint64_t> limit) {
  std::vector<model::ExecutionRecord> out;
  for (const auto& [_, record] : TX(t).View().executions) {
    if (record.automation_id == automation_id) out.push_back(record);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.run_sequence > b.run_sequence; });
  if (limit && out.size() > *limit) out.resize(*limit);
  return out;
}

Result MemoryRepository::UpdateExecution(Transaction& t, const model::ExecutionRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.executions.contains(r.id)) return Result::Err(ErrorCode::NotFound, "execution not found: " + r.id);
  s.executions[r.id] = r;
  return Result::Ok();
}

std::vector<model::ExecutionRecord> MemoryRepository::ListRunningExecutions(Transaction& t, uint64_t started_before_ms) {
  std::vector<model::ExecutionRecord> out;
  for (const auto& [_, record] : TX(t).View().executions) {
    if (record.status == pulse::automation::v1::RUN_STATUS_RUNNING && record.started_at_ms < started_before_ms) out.push_back(record);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return a.started_at_ms != b.started_at_ms ? a.started_at_ms < b.started_at_ms : a.id < b.id;
  });
  return out;
}

uint64_t MemoryRepository::NextRunSequence(Transaction& t, const std::string& automation_id) {
  uint64_t highest = 0;
  for (const auto& [_, record] : TX(t).View().executions) {
    if (record.automation_id == automation_id) highest = std::max(highest, record.run_sequence);
  }
  return highest + 1;
}

// ------------------------------------------------------------------
// Execution logs
// ------------------------------------------------------------------

Result MemoryRepository::InsertExecutionLog(Transaction& t, const model::ExecutionLogRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.executions.contains(r.execution_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "execution not found: " + r.execution_id);
  }
  s.logs.push_back(r);
  return Result::Ok();
}

std::vector<model::ExecutionLogRecord> MemoryRepository::GetExecutionLogs(Transaction& t, const std::string& execution_id) {
  std::vector<model::ExecutionLogRecord> out;
  for (const auto& log : TX(t).View().logs) {
    if (log.execution_id == execution_id) out.push_back(log);
  }
  return out;
}

// ------------------------------------------------------------------
// Node results
// ------------------------------------------------------------------

Result MemoryRepository::UpsertNodeResult(Transaction& t, const model::NodeResultRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.automations.contains(r.automation_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "automation not found: " + r.automation_id);
  }

  auto [it, inserted] = s.node_results.try_emplace({r.automation_id, r.node_id}, r);
  if (!inserted && it->second.run_sequence <= r.run_sequence) {
    it->second = r;
  }
  return Result::Ok();
}

std::optional<model::NodeResultRecord> MemoryRepository::GetNodeResult(Transaction& t, const std::string& automation_id,
                                                                       const std::string& node_id) {
  const auto& s  = TX(t).View();
  auto        it = s.node_results.find({automation_id, node_id});
  if (it == s.node_results.end()) return std::nullopt;
  return it->second;
}

std::vector<model::NodeResultRecord> MemoryRepository::ListNodeResults(Transaction& t, const std::string& automation_id) {
  std::vector<model::NodeResultRecord> out;
  for (const auto& [key, record] : TX(t).View().node_results) {
    if (key.first == automation_id) out.push_back(record);
  }
  return out;
}

} // namespace pulse::db::memory
