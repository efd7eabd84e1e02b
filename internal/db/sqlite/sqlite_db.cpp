#include "internal/db/sqlite/sqlite_db.hpp"

#include <stdexcept>
#include <vector>

namespace pulse::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path, bool wal_mode) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  Configure(wal_mode);
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

StatementPtr SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  ThrowIf(rc, db_, "sqlite prepare");
  return StatementPtr(stmt);
}

void SqliteDB::Configure(bool wal_mode) {
  // WAL enables concurrent readers while the writer holds the lock
  Exec(wal_mode ? "PRAGMA journal_mode=WAL;" : "PRAGMA journal_mode=DELETE;");
  Exec("PRAGMA synchronous=NORMAL;");

  // foreign keys are OFF by default in sqlite; deletes cascade through them
  Exec("PRAGMA foreign_keys=ON;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");
}

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS automations (id TEXT PRIMARY KEY, owner_id TEXT NOT NULL, name TEXT NOT NULL, definition TEXT NOT NULL, default_slippage REAL NOT NULL, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS automations_owner ON automations(owner_id);",
      "CREATE TABLE IF NOT EXISTS executions (id TEXT PRIMARY KEY, automation_id TEXT NOT NULL REFERENCES automations(id) ON DELETE CASCADE, run_sequence INTEGER NOT NULL, status INTEGER NOT NULL, error TEXT NOT NULL DEFAULT '', started_at_ms INTEGER NOT NULL, finished_at_ms INTEGER NOT NULL DEFAULT 0, UNIQUE(automation_id, run_sequence));",
      "CREATE INDEX IF NOT EXISTS executions_running ON executions(status, started_at_ms);",
      "CREATE TABLE IF NOT EXISTS execution_logs (log_id INTEGER PRIMARY KEY AUTOINCREMENT, execution_id TEXT NOT NULL REFERENCES executions(id) ON DELETE CASCADE, node_id TEXT NOT NULL, node_type TEXT NOT NULL, input TEXT NOT NULL, output TEXT NOT NULL, error TEXT NOT NULL DEFAULT '', created_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS node_results (automation_id TEXT NOT NULL REFERENCES automations(id) ON DELETE CASCADE, node_id TEXT NOT NULL, execution_id TEXT NOT NULL, run_sequence INTEGER NOT NULL, artifact TEXT NOT NULL, updated_at_ms INTEGER NOT NULL, PRIMARY KEY (automation_id, node_id));"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }
}

} // namespace pulse::db::sqlite
