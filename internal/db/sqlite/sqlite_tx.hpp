#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace activity::db::sqlite {

/*
  SQLite transaction wrapper.

  Read-write uses BEGIN IMMEDIATE:
    - grabs write lock early
    - avoids deadlock-y behavior later
  Read-only uses BEGIN DEFERRED so readers never take the write lock.
*/
class SqliteTransaction final : public db::Transaction {
public:
  SqliteTransaction(std::shared_ptr<SqliteDB> db, TransactionMode mode);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<SqliteDB> db_;
  bool committed_ = false;
  bool finished_  = false;
};

}
