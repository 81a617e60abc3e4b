#include "memory_tx.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace activity::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo, TransactionMode mode) : repo_(repo), mode_(mode) {
  std::scoped_lock lock(repo_.mutex_);
  working_          = repo_.committed_; // snapshot copy
  snapshot_version_ = repo_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  if (ReadOnly()) {
    throw std::logic_error("memory transaction: write attempted in a read-only transaction");
  }
  return working_;
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw std::logic_error("memory transaction: already finished");
  }
  if (ReadOnly()) {
    committed_ = true;
    return;
  }

  std::scoped_lock lock(repo_.mutex_);
  if (repo_.committed_version_ != snapshot_version_) {
    rolled_back_ = true;
    throw util::WriteConflict("transaction conflict: state was modified by a concurrent transaction");
  }
  repo_.committed_ = std::move(working_);
  repo_.committed_version_++;
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
}

} // namespace activity::db::memory
