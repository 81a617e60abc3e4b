#include "sqlite_schema.hpp"

#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"
#include "sqlite_statement.hpp"

namespace activity::db::sqlite {

SqliteMigrationExecutor::SqliteMigrationExecutor(SqliteDB& db) : db_(db) {
  db_.Exec(sql::CREATE_SCHEMA_MIGRATIONS);
}

void SqliteMigrationExecutor::ExecuteSQL(const std::string& sql) {
  db_.Exec(sql);
}

uint32_t SqliteMigrationExecutor::AppliedVersion() {
  Statement st(db_.Handle(), sql::SELECT_SCHEMA_VERSION);
  if (!st.Ok() || st.Step() != SQLITE_ROW) {
    throw std::runtime_error(std::string("sqlite schema version: ") + sqlite3_errmsg(db_.Handle()));
  }
  return static_cast<uint32_t>(st.GetInt64(0));
}

void SqliteMigrationExecutor::RecordVersion(uint32_t version) {
  Statement st(db_.Handle(), sql::INSERT_SCHEMA_VERSION);
  if (!st.Ok()) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db_.Handle()));
  }
  st.Bind({static_cast<int64_t>(version), util::NowMillis()});
  if (st.Step() != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite record migration: ") + sqlite3_errmsg(db_.Handle()));
  }
}

uint32_t BootstrapSchema(SqliteDB& db) {
  SqliteMigrationExecutor executor(db);

  db.Exec("BEGIN IMMEDIATE;");
  try {
    const uint32_t applied = sql::RunMigrations(executor, sql::HistorySchemaMigrations());
    db.Exec("COMMIT;");
    if (applied > 0) {
      ACTIVITY_LOG_INFO("sqlite schema migrated", {observability::StringField("path", db.Path()), observability::IntField("applied", applied)});
    }
    return applied;
  } catch (const std::exception&) {
    db.Exec("ROLLBACK;");
    throw;
  }
}

} // namespace activity::db::sqlite
