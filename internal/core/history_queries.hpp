#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/commit.hpp"

namespace activity::core::history {

/*
  Lookups shared by the managers. Everything runs inside the caller's
  transaction and throws util:: errors.
*/

db::model::ModuleRecord RequireModule(db::Repository& repo, db::Transaction& tx, std::int64_t id);
db::model::ModuleRecord RequireModule(db::Repository& repo, db::Transaction& tx, const std::string& slug);

db::model::BranchRecord RequireBranch(db::Repository& repo, db::Transaction& tx, const std::string& name);

db::model::CommitRecord RequireCommit(db::Repository& repo, db::Transaction& tx, std::int64_t id);

// Returns the default branch, creating it under `name` when the store
// has none.
db::model::BranchRecord EnsureDefaultBranch(db::Repository& repo, db::Transaction& tx, const std::string& name,
                                            std::int64_t actor);

// Named branch, or the default branch when `name` is empty. Never creates.
db::model::BranchRecord ResolveBranch(db::Repository& repo, db::Transaction& tx, const std::optional<std::string>& name);

std::optional<db::model::VersionRecord> FindHead(db::Repository& repo, db::Transaction& tx, std::int64_t module_id,
                                                 std::int64_t branch_id);

// Current heads of a module on every branch, in branch id order.
std::vector<db::model::VersionRecord> ModuleHeads(db::Repository& repo, db::Transaction& tx, std::int64_t module_id);

// Primary parent first, then extra parents by order.
std::vector<std::int64_t> ParentIds(db::Repository& repo, db::Transaction& tx, const db::model::CommitRecord& commit);

/*
  Commits leading from `ancestor` (exclusive) to `descendant` (inclusive),
  oldest first, following primary and extra parents. Empty when the two
  are equal; nullopt when `ancestor` is not reachable from `descendant`.
*/
std::optional<std::vector<std::int64_t>> AncestryPath(db::Repository& repo, db::Transaction& tx, std::int64_t ancestor,
                                                      std::int64_t descendant);

bool IsAncestor(db::Repository& repo, db::Transaction& tx, std::int64_t ancestor, std::int64_t descendant);

model::Commit ToCommit(db::Repository& repo, db::Transaction& tx, const db::model::CommitRecord& record);

} // namespace activity::core::history
