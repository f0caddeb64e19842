#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace freight::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  A single connection is shared by all threads; TxMutex() serializes
  transactions on it since SQLite allows one writer at a time anyway.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

// Creates tables and indexes if missing.
void BootstrapSchema(SqliteDB& db);

} // namespace freight::db::sqlite
