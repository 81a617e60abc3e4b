#include "sqlite_tx.hpp"

#include <stdexcept>
#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace activity::db::sqlite {

namespace {

// Lock contention on BEGIN or COMMIT surfaces as a write conflict.
void ExecControl(sqlite3* db, const char* sql, const char* what) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db, sql, nullptr, nullptr, &err);
  if (rc == SQLITE_OK) return;

  std::string msg = err ? err : what;
  sqlite3_free(err);
  if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
    throw util::WriteConflict("transaction conflict: " + msg);
  }
  throw std::runtime_error(msg);
}

} // namespace

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, TransactionMode mode) : db_(std::move(db)) {
  ExecControl(db_->Handle(), mode == TransactionMode::kReadWrite ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;",
              "sqlite begin failed");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    try {
      Rollback();
    } catch (const std::exception& e) {
      ACTIVITY_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  if (finished_) throw std::logic_error("sqlite transaction: already finished");

  ExecControl(db_->Handle(), "COMMIT;", "sqlite commit failed");
  committed_ = true;
  finished_  = true;
}

void SqliteTransaction::Rollback() {
  finished_ = true;
  db_->Exec("ROLLBACK;");
}

} // namespace activity::db::sqlite
