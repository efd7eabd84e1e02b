#include "internal/db/sqlite/sqlite_repository.hpp"

#include <sqlite3.h>

namespace pulse::db::sqlite {

using pulse::db::ErrorCode;
using pulse::db::Result;

static StatementPtr Prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
        return nullptr;
    }
    return StatementPtr(st);
}

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

static void BindDouble(sqlite3_stmt* st, int idx, double v) {
    sqlite3_bind_double(st, idx, v);
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

static int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

static model::AutomationRecord ReadAutomation(sqlite3_stmt* st) {
    model::AutomationRecord r;
    r.id = ColText(st, 0);
    r.owner_id = ColText(st, 1);
    r.name = ColText(st, 2);
    r.definition_json = ColText(st, 3);
    r.default_slippage = sqlite3_column_double(st, 4);
    r.created_at_ms = ColU64(st, 5);
    r.updated_at_ms = ColU64(st, 6);
    return r;
}

static model::ExecutionRecord ReadExecution(sqlite3_stmt* st) {
    model::ExecutionRecord r;
    r.id = ColText(st, 0);
    r.automation_id = ColText(st, 1);
    r.run_sequence = ColU64(st, 2);
    r.status = static_cast<pulse::automation::v1::RunStatus>(ColI32(st, 3));
    r.error = ColText(st, 4);
    r.started_at_ms = ColU64(st, 5);
    r.finished_at_ms = ColU64(st, 6);
    return r;
}

static model::NodeResultRecord ReadNodeResult(sqlite3_stmt* st) {
    model::NodeResultRecord r;
    r.automation_id = ColText(st, 0);
    r.node_id = ColText(st, 1);
    r.execution_id = ColText(st, 2);
    r.run_sequence = ColU64(st, 3);
    r.artifact_json = ColText(st, 4);
    r.updated_at_ms = ColU64(st, 5);
    return r;
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT: {
            const int ext = sqlite3_extended_errcode(db);
            if (ext == SQLITE_CONSTRAINT_PRIMARYKEY || ext == SQLITE_CONSTRAINT_UNIQUE)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        }
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Automations
// ------------------------------------------------------------------

Result SqliteRepository::InsertAutomation(Transaction& t, const model::AutomationRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO automations(id,owner_id,name,definition,default_slippage,created_at_ms,updated_at_ms) "
        "VALUES(?,?,?,?,?,?,?);";

    auto st = Prepare(db, sql);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.owner_id);
    BindText(st.get(), 3, r.name);
    BindText(st.get(), 4, r.definition_json);
    BindDouble(st.get(), 5, r.default_slippage);
    BindU64(st.get(), 6, r.created_at_ms);
    BindU64(st.get(), 7, r.updated_at_ms);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::AutomationRecord>
SqliteRepository::GetAutomation(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "SELECT id,owner_id,name,definition,default_slippage,created_at_ms,updated_at_ms "
        "FROM automations WHERE id=?;");
    if (!st) return std::nullopt;

    BindText(st.get(), 1, id);
    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ReadAutomation(st.get());
}

std::vector<model::AutomationRecord>
SqliteRepository::ListAutomations(Transaction& t, const std::string& owner_id) {
    auto* db = TX(t).Handle();
    std::vector<model::AutomationRecord> out;

    auto st = Prepare(db,
        "SELECT id,owner_id,name,definition,default_slippage,created_at_ms,updated_at_ms "
        "FROM automations WHERE owner_id=? ORDER BY created_at_ms, id;");
    if (!st) return out;

    BindText(st.get(), 1, owner_id);
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        out.push_back(ReadAutomation(st.get()));
    }
    return out;
}

Result SqliteRepository::UpdateAutomation(Transaction& t, const model::AutomationRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "UPDATE automations SET owner_id=?,name=?,definition=?,default_slippage=?,updated_at_ms=? WHERE id=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.owner_id);
    BindText(st.get(), 2, r.name);
    BindText(st.get(), 3, r.definition_json);
    BindDouble(st.get(), 4, r.default_slippage);
    BindU64(st.get(), 5, r.updated_at_ms);
    BindText(st.get(), 6, r.id);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "automation not found: " + r.id);
    return Translate(db, rc);
}

Result SqliteRepository::DeleteAutomation(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    // executions, logs and node results go through ON DELETE CASCADE
    auto st = Prepare(db, "DELETE FROM automations WHERE id=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, id);
    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "automation not found: " + id);
    return Translate(db, rc);
}

// ------------------------------------------------------------------
// Executions
// ------------------------------------------------------------------

Result SqliteRepository::InsertExecution(Transaction& t, const model::ExecutionRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "INSERT INTO executions(id,automation_id,run_sequence,status,error,started_at_ms,finished_at_ms) "
        "VALUES(?,?,?,?,?,?,?);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.automation_id);
    BindU64(st.get(), 3, r.run_sequence);
    BindI32(st.get(), 4, static_cast<int>(r.status));
    BindText(st.get(), 5, r.error);
    BindU64(st.get(), 6, r.started_at_ms);
    BindU64(st.get(), 7, r.finished_at_ms);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::ExecutionRecord>
SqliteRepository::GetExecution(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "SELECT id,automation_id,run_sequence,status,error,started_at_ms,finished_at_ms "
        "FROM executions WHERE id=?;");
    if (!st) return std::nullopt;

    BindText(st.get(), 1, id);
    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ReadExecution(st.get());
}

std::vector<model::ExecutionRecord>
SqliteRepository::ListExecutions(Transaction& t, const std::string& automation_id, std::optional<uint64_t> limit) {
    auto* db = TX(t).Handle();
    std::vector<model::ExecutionRecord> out;

    // LIMIT -1 means unbounded in sqlite
    auto st = Prepare(db,
        "SELECT id,automation_id,run_sequence,status,error,started_at_ms,finished_at_ms "
        "FROM executions WHERE automation_id=? ORDER BY run_sequence DESC LIMIT ?;");
    if (!st) return out;

    BindText(st.get(), 1, automation_id);
    sqlite3_bind_int64(st.get(), 2, limit ? static_cast<sqlite3_int64>(*limit) : -1);
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        out.push_back(ReadExecution(st.get()));
    }
    return out;
}

Result SqliteRepository::UpdateExecution(Transaction& t, const model::ExecutionRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, "UPDATE executions SET status=?,error=?,finished_at_ms=? WHERE id=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI32(st.get(), 1, static_cast<int>(r.status));
    BindText(st.get(), 2, r.error);
    BindU64(st.get(), 3, r.finished_at_ms);
    BindText(st.get(), 4, r.id);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "execution not found: " + r.id);
    return Translate(db, rc);
}

std::vector<model::ExecutionRecord>
SqliteRepository::ListRunningExecutions(Transaction& t, uint64_t started_before_ms) {
    auto* db = TX(t).Handle();
    std::vector<model::ExecutionRecord> out;

    auto st = Prepare(db,
        "SELECT id,automation_id,run_sequence,status,error,started_at_ms,finished_at_ms "
        "FROM executions WHERE status=? AND started_at_ms<? ORDER BY started_at_ms, id;");
    if (!st) return out;

    BindI32(st.get(), 1, static_cast<int>(pulse::automation::v1::RUN_STATUS_RUNNING));
    BindU64(st.get(), 2, started_before_ms);
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        out.push_back(ReadExecution(st.get()));
    }
    return out;
}

uint64_t SqliteRepository::NextRunSequence(Transaction& t, const std::string& automation_id) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, "SELECT COALESCE(MAX(run_sequence), 0) FROM executions WHERE automation_id=?;");
    if (!st) return 1;

    BindText(st.get(), 1, automation_id);
    if (sqlite3_step(st.get()) != SQLITE_ROW) return 1;
    return ColU64(st.get(), 0) + 1;
}

// ------------------------------------------------------------------
// Execution logs
// ------------------------------------------------------------------

Result SqliteRepository::InsertExecutionLog(Transaction& t, const model::ExecutionLogRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "INSERT INTO execution_logs(execution_id,node_id,node_type,input,output,error,created_at_ms) "
        "VALUES(?,?,?,?,?,?,?);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.execution_id);
    BindText(st.get(), 2, r.node_id);
    BindText(st.get(), 3, r.node_type);
    BindText(st.get(), 4, r.input_json);
    BindText(st.get(), 5, r.output_json);
    BindText(st.get(), 6, r.error);
    BindU64(st.get(), 7, r.created_at_ms);

    return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::ExecutionLogRecord>
SqliteRepository::GetExecutionLogs(Transaction& t, const std::string& execution_id) {
    auto* db = TX(t).Handle();
    std::vector<model::ExecutionLogRecord> out;

    auto st = Prepare(db,
        "SELECT execution_id,node_id,node_type,input,output,error,created_at_ms "
        "FROM execution_logs WHERE execution_id=? ORDER BY log_id;");
    if (!st) return out;

    BindText(st.get(), 1, execution_id);
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        model::ExecutionLogRecord r;
        r.execution_id = ColText(st.get(), 0);
        r.node_id = ColText(st.get(), 1);
        r.node_type = ColText(st.get(), 2);
        r.input_json = ColText(st.get(), 3);
        r.output_json = ColText(st.get(), 4);
        r.error = ColText(st.get(), 5);
        r.created_at_ms = ColU64(st.get(), 6);
        out.push_back(std::move(r));
    }
    return out;
}

// ------------------------------------------------------------------
// Node results
// ------------------------------------------------------------------

Result SqliteRepository::UpsertNodeResult(Transaction& t, const model::NodeResultRecord& r) {
    auto* db = TX(t).Handle();

    // older runs never overwrite a newer stored result
    auto st = Prepare(db,
        "INSERT INTO node_results(automation_id,node_id,execution_id,run_sequence,artifact,updated_at_ms) "
        "VALUES(?,?,?,?,?,?) "
        "ON CONFLICT(automation_id,node_id) DO UPDATE SET execution_id=excluded.execution_id, "
        "run_sequence=excluded.run_sequence, artifact=excluded.artifact, updated_at_ms=excluded.updated_at_ms "
        "WHERE excluded.run_sequence >= node_results.run_sequence;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.automation_id);
    BindText(st.get(), 2, r.node_id);
    BindText(st.get(), 3, r.execution_id);
    BindU64(st.get(), 4, r.run_sequence);
    BindText(st.get(), 5, r.artifact_json);
    BindU64(st.get(), 6, r.updated_at_ms);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::NodeResultRecord>
SqliteRepository::GetNodeResult(Transaction& t, const std::string& automation_id, const std::string& node_id) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "SELECT automation_id,node_id,execution_id,run_sequence,artifact,updated_at_ms "
        "FROM node_results WHERE automation_id=? AND node_id=?;");
    if (!st) return std::nullopt;

    BindText(st.get(), 1, automation_id);
    BindText(st.get(), 2, node_id);
    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ReadNodeResult(st.get());
}

std::vector<model::NodeResultRecord>
SqliteRepository::ListNodeResults(Transaction& t, const std::string& automation_id) {
    auto* db = TX(t).Handle();
    std::vector<model::NodeResultRecord> out;

    auto st = Prepare(db,
        "SELECT automation_id,node_id,execution_id,run_sequence,artifact,updated_at_ms "
        "FROM node_results WHERE automation_id=? ORDER BY node_id;");
    if (!st) return out;

    BindText(st.get(), 1, automation_id);
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        out.push_back(ReadNodeResult(st.get()));
    }
    return out;
}

} // namespace pulse::db::sqlite
