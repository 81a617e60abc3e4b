#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/core/branch_manager.hpp"
#include "internal/core/merge_engine.hpp"
#include "internal/core/merge_request_workflow.hpp"
#include "internal/core/revision_manager.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"

namespace activity::factory {

/*
  RuntimeDependencies

  Owns the repository and the managers built on it.
*/
struct RuntimeDependencies {
  std::shared_ptr<db::Repository> repository;

  std::shared_ptr<core::BranchManager>        branches;
  std::shared_ptr<core::RevisionManager>      revisions;
  std::shared_ptr<core::MergeEngine>          merge_engine;
  std::shared_ptr<core::MergeRequestWorkflow> merge_requests;
};

/*
  BuildRepository

  Memory unless the config selects sqlite. The sqlite schema is brought
  up to date before the repository is returned.

  NOTE:
  This is the ONLY place allowed to know concrete DB types.
*/
// Fields left out of the config keep the SqliteOptions defaults.
db::sqlite::SqliteOptions SqliteOptionsFromConfig(const activity::runtime::config::SqliteConfig& sqlite);

std::shared_ptr<db::Repository> BuildRepository(const activity::runtime::config::RuntimeConfig& config);

RuntimeDependencies BuildRuntime(const activity::runtime::config::RuntimeConfig& config);

// Wires the managers over an existing repository.
RuntimeDependencies BuildRuntime(const activity::runtime::config::RuntimeConfig& config,
                                 std::shared_ptr<db::Repository> repository);

} // namespace activity::factory
