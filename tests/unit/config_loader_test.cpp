#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

namespace {

using activity::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "activity_history_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestSqliteBackendFromFile() {
  const auto yaml_path = WriteYaml("sqlite_backend",
                                   R"(database:
  sqlite:
    path: "C:\\activity\\\"quoted\"\\history.db"
    wal_mode: true
    busy_timeout_ms: 2500
logging:
  level: debug
history:
  default_branch: trunk
  search_page_size: 5
  history_limit: 12
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "C:\\activity\\\"quoted\"\\history.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.database().sqlite().busy_timeout_ms() == 2500);
  assert(config.logging().level() == "debug");

  assert(activity::config::DefaultBranchName(config) == "trunk");
  assert(activity::config::SearchPageSize(config) == 5);
  assert(activity::config::HistoryLimit(config) == 12);
}

void TestOmittedSqliteFieldsKeepDefaults() {
  auto bare = ConfigLoader::LoadFromString("database:\n  sqlite:\n    path: history.db\n");
  assert(!bare.database().sqlite().has_wal_mode());
  auto options = activity::factory::SqliteOptionsFromConfig(bare.database().sqlite());
  assert(options.wal_mode);
  assert(options.busy_timeout_ms == 5000);

  auto off = ConfigLoader::LoadFromString("database:\n  sqlite:\n    path: history.db\n    wal_mode: false\n");
  assert(off.database().sqlite().has_wal_mode());
  options = activity::factory::SqliteOptionsFromConfig(off.database().sqlite());
  assert(!options.wal_mode);
  assert(options.busy_timeout_ms == 5000);
}

void TestBareMemoryKeySelectsMemoryBackend() {
  auto config = ConfigLoader::LoadFromString("database:\n  memory:\n");
  assert(config.database().has_memory());
  assert(!config.database().has_sqlite());

  auto braced = ConfigLoader::LoadFromString("database:\n  memory: {}\n");
  assert(braced.database().has_memory());
}

void TestEmptyDocumentUsesDefaults() {
  auto config = ConfigLoader::LoadFromString("");
  assert(!config.database().has_sqlite());
  assert(activity::config::DefaultBranchName(config) == "main");
  assert(activity::config::SearchPageSize(config) == 20);
  assert(activity::config::HistoryLimit(config) == 50);
}

void TestQuotedNumbersStayStrings() {
  auto config = ConfigLoader::LoadFromString("history:\n  default_branch: \"2024\"\n");
  assert(activity::config::DefaultBranchName(config) == "2024");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(database:
  memory: {}
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/activity-history.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestLoggingLevelFromConfig() {
  unsetenv("ACTIVITY_LOG_LEVEL");
  auto config = ConfigLoader::LoadFromString("logging:\n  level: warn\n");
  activity::observability::InitializeLogging(config);

  auto logger = spdlog::get("activity-history");
  assert(logger);
  assert(spdlog::default_logger() == logger);
  assert(logger->level() == spdlog::level::warn);
  activity::observability::LogWarn("config loaded", {activity::observability::StringField("level", "warn")});

  activity::observability::ShutdownLogging();
}

} // namespace

int main() {
  TestSqliteBackendFromFile();
  TestOmittedSqliteFieldsKeepDefaults();
  TestBareMemoryKeySelectsMemoryBackend();
  TestEmptyDocumentUsesDefaults();
  TestQuotedNumbersStayStrings();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();
  TestLoggingLevelFromConfig();

  std::cout << "activity_history_unit_config_loader: pass\n";
  return 0;
}
