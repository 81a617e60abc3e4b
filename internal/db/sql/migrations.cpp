#include "migrations.hpp"

namespace activity::db::sql {

uint32_t RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  const uint32_t applied = executor.AppliedVersion();
  uint32_t       count   = 0;

  for (uint32_t i = applied; i < ordered_sql.size(); ++i) {
    executor.ExecuteSQL(ordered_sql[i]);
    executor.RecordVersion(i + 1);
    ++count;
  }
  return count;
}

const std::vector<std::string>& HistorySchemaMigrations() {
  static const std::vector<std::string> kMigrations = {
      // 1
      "CREATE TABLE IF NOT EXISTS activity_modules ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " slug TEXT NOT NULL UNIQUE,"
      " title TEXT NOT NULL,"
      " description TEXT NOT NULL DEFAULT '',"
      " type INTEGER NOT NULL,"
      " status INTEGER NOT NULL,"
      " created_by INTEGER NOT NULL,"
      " created_at_ms INTEGER NOT NULL,"
      " origin_module_id INTEGER,"
      " forked_from_id INTEGER);",
      // 2
      "CREATE TABLE IF NOT EXISTS branches ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " name TEXT NOT NULL UNIQUE,"
      " description TEXT NOT NULL DEFAULT '',"
      " is_default INTEGER NOT NULL DEFAULT 0,"
      " created_by INTEGER NOT NULL,"
      " created_at_ms INTEGER NOT NULL);",
      // 3
      "CREATE TABLE IF NOT EXISTS commits ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " hash TEXT NOT NULL,"
      " message TEXT NOT NULL,"
      " author INTEGER NOT NULL,"
      " committer INTEGER NOT NULL,"
      " module_id INTEGER NOT NULL,"
      " parent_commit_id INTEGER REFERENCES commits(id),"
      " is_merge_commit INTEGER NOT NULL DEFAULT 0,"
      " committed_at_ms INTEGER NOT NULL);",
      // 4
      "CREATE INDEX IF NOT EXISTS commits_hash_idx ON commits(hash);",
      // 5
      "CREATE TABLE IF NOT EXISTS commit_parents ("
      " commit_id INTEGER NOT NULL REFERENCES commits(id),"
      " parent_commit_id INTEGER NOT NULL REFERENCES commits(id),"
      " parent_order INTEGER NOT NULL,"
      " PRIMARY KEY (commit_id, parent_order));",
      // 6
      "CREATE TABLE IF NOT EXISTS module_versions ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " module_id INTEGER NOT NULL REFERENCES activity_modules(id),"
      " branch_id INTEGER NOT NULL REFERENCES branches(id),"
      " commit_id INTEGER NOT NULL REFERENCES commits(id),"
      " content TEXT NOT NULL,"
      " title TEXT NOT NULL,"
      " description TEXT NOT NULL DEFAULT '',"
      " content_hash TEXT NOT NULL,"
      " is_current_head INTEGER NOT NULL DEFAULT 0,"
      " created_at_ms INTEGER NOT NULL);",
      // 7: at most one head per (module, branch)
      "CREATE UNIQUE INDEX IF NOT EXISTS module_versions_head_idx"
      " ON module_versions(module_id, branch_id) WHERE is_current_head = 1;",
      // 8
      "CREATE TABLE IF NOT EXISTS merge_requests ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " title TEXT NOT NULL,"
      " description TEXT NOT NULL DEFAULT '',"
      " from_module_id INTEGER NOT NULL,"
      " to_module_id INTEGER NOT NULL,"
      " status INTEGER NOT NULL,"
      " created_by INTEGER NOT NULL,"
      " created_at_ms INTEGER NOT NULL,"
      " merged_by INTEGER, merged_at_ms INTEGER,"
      " rejected_by INTEGER, rejected_at_ms INTEGER,"
      " closed_by INTEGER, closed_at_ms INTEGER,"
      " reason TEXT NOT NULL DEFAULT '',"
      " allow_comments INTEGER NOT NULL DEFAULT 1);",
      // 9
      "CREATE TABLE IF NOT EXISTS merge_request_comments ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " merge_request_id INTEGER NOT NULL REFERENCES merge_requests(id),"
      " author INTEGER NOT NULL,"
      " text TEXT NOT NULL,"
      " created_at_ms INTEGER NOT NULL);",
  };
  return kMigrations;
}

} // namespace activity::db::sql
