#pragma once

namespace activity::db {

enum class TransactionMode {
  kReadWrite,
  kReadOnly,
};

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Commit() of a read-write transaction throws util::WriteConflict
    when a concurrent writer committed first

  SQLite: BEGIN IMMEDIATE (read-write) / BEGIN DEFERRED (read-only)
  Memory: snapshot copy-on-write
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;
};

}
