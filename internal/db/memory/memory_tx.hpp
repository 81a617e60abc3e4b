#pragma once

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace activity::db::memory {

/*
  Transaction = snapshot + write set

  Commit is first-committer-wins: if another read-write transaction
  committed after our snapshot was taken, Commit() throws
  util::WriteConflict and nothing is published.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  MemoryTransaction(MemoryRepository& repo, TransactionMode mode);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  bool ReadOnly() const {
    return mode_ == TransactionMode::kReadOnly;
  }

  MemoryRepository::State& Mutable();
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&       repo_;
  TransactionMode         mode_;
  MemoryRepository::State working_;
  uint64_t                snapshot_version_ = 0;
  bool                    committed_        = false;
  bool                    rolled_back_      = false;
};

} // namespace activity::db::memory
