#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>
#include <vector>

namespace taskorch::db::sqlite {

/*
  Thin RAII wrapper around one sqlite3 connection.

  Every worker process opens its own connection to the same file;
  cross-process serialization comes from BEGIN IMMEDIATE plus the
  busy timeout, never from an in-process lock.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, int busy_timeout_ms = 5000);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/schema)
  void Exec(const std::string& sql);

  // Run idempotent schema statements inside one transaction.
  void ApplySchema(const std::vector<std::string>& statements);

 private:
  // Configure recommended PRAGMAs (WAL, foreign keys, busy timeout)
  void Configure();

  sqlite3*    db_ = nullptr;
  std::string path_;
  int         busy_timeout_ms_;
};

} // namespace taskorch::db::sqlite
