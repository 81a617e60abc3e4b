#include "factory.hpp"

#include <stdexcept>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/observability/logging.hpp"

namespace activity::factory {

db::sqlite::SqliteOptions SqliteOptionsFromConfig(const activity::runtime::config::SqliteConfig& sqlite) {
  db::sqlite::SqliteOptions options;
  if (sqlite.has_wal_mode()) options.wal_mode = sqlite.wal_mode();
  if (sqlite.busy_timeout_ms() > 0) options.busy_timeout_ms = sqlite.busy_timeout_ms();
  return options;
}

std::shared_ptr<db::Repository> BuildRepository(const activity::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    const auto& sqlite = database.sqlite();
    if (sqlite.path().empty()) {
      throw std::runtime_error("database.sqlite.path is required");
    }

    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), SqliteOptionsFromConfig(sqlite));
    db::sqlite::BootstrapSchema(*sqlite_db);
    ACTIVITY_LOG_INFO("using sqlite repository", {observability::StringField("path", sqlite.path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

RuntimeDependencies BuildRuntime(const activity::runtime::config::RuntimeConfig& config) {
  return BuildRuntime(config, BuildRepository(config));
}

RuntimeDependencies BuildRuntime(const activity::runtime::config::RuntimeConfig& config,
                                 std::shared_ptr<db::Repository> repository) {
  const auto default_branch = config::DefaultBranchName(config);

  RuntimeDependencies deps;
  deps.repository     = std::move(repository);
  deps.branches       = std::make_shared<core::BranchManager>(deps.repository, default_branch);
  deps.revisions      = std::make_shared<core::RevisionManager>(deps.repository, default_branch,
                                                                config::SearchPageSize(config), config::HistoryLimit(config));
  deps.merge_engine   = std::make_shared<core::MergeEngine>(deps.repository, deps.revisions);
  deps.merge_requests = std::make_shared<core::MergeRequestWorkflow>(deps.repository, deps.merge_engine);
  return deps;
}

} // namespace activity::factory
