#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace pulse::db::sqlite {

struct StatementDeleter {
  void operator()(sqlite3_stmt* stmt) const {
    sqlite3_finalize(stmt);
  }
};

using StatementPtr = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

/*
  Thin RAII wrapper around sqlite3*.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  StatementPtr Prepare(const std::string& sql);

  // Transactions on one connection must not interleave; held for a
  // transaction's lifetime.
  std::mutex& TransactionMutex() {
    return tx_mutex_;
  }

  // Configure PRAGMAs (journal mode, foreign keys, busy timeout)
  void Configure(bool wal_mode);

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

// Creates the automation tables if they do not exist yet.
void BootstrapSchema(SqliteDB& db);

} // namespace pulse::db::sqlite
