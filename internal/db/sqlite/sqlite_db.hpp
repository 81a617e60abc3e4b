#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <string>

namespace activity::db::sqlite {

struct SqliteOptions {
  bool     wal_mode        = true;
  uint32_t busy_timeout_ms = 5000;
};

/*
  Thin RAII wrapper around sqlite3*.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, SqliteOptions options = {});
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations/transaction control)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

 private:
  sqlite3*      db_ = nullptr;
  std::string   path_;
  SqliteOptions options_;
};

} // namespace activity::db::sqlite
