#include "history_queries.hpp"

#include <algorithm>
#include <deque>
#include <unordered_map>

#include "internal/core/error_mapping.hpp"
#include "internal/util/errors.hpp"

namespace activity::core::history {

db::model::ModuleRecord RequireModule(db::Repository& repo, db::Transaction& tx, std::int64_t id) {
  auto module = repo.GetModule(tx, id);
  if (!module) throw util::NotFound("module " + std::to_string(id) + " not found");
  return *module;
}

db::model::ModuleRecord RequireModule(db::Repository& repo, db::Transaction& tx, const std::string& slug) {
  auto module = repo.GetModuleBySlug(tx, slug);
  if (!module) throw util::NotFound("module '" + slug + "' not found");
  return *module;
}

db::model::BranchRecord RequireBranch(db::Repository& repo, db::Transaction& tx, const std::string& name) {
  auto branch = repo.GetBranchByName(tx, name);
  if (!branch) throw util::NotFound("branch '" + name + "' not found");
  return *branch;
}

db::model::CommitRecord RequireCommit(db::Repository& repo, db::Transaction& tx, std::int64_t id) {
  auto commit = repo.GetCommit(tx, id);
  if (!commit) throw util::NotFound("commit " + std::to_string(id) + " not found");
  return *commit;
}

db::model::BranchRecord EnsureDefaultBranch(db::Repository& repo, db::Transaction& tx, const std::string& name,
                                            std::int64_t actor) {
  if (auto existing = repo.GetDefaultBranch(tx)) {
    return *existing;
  }
  if (repo.GetBranchByName(tx, name)) {
    throw util::InvalidOperation("branch '" + name + "' exists but is not the default branch");
  }

  db::model::BranchRecord branch;
  branch.name        = name;
  branch.description = "Default branch";
  branch.is_default  = true;
  branch.created_by  = actor;
  ThrowIfDbError(repo.InsertBranch(tx, branch), "create default branch");
  return branch;
}

db::model::BranchRecord ResolveBranch(db::Repository& repo, db::Transaction& tx, const std::optional<std::string>& name) {
  if (name && !name->empty()) {
    return RequireBranch(repo, tx, *name);
  }
  auto branch = repo.GetDefaultBranch(tx);
  if (!branch) throw util::NotFound("no default branch");
  return *branch;
}

std::optional<db::model::VersionRecord> FindHead(db::Repository& repo, db::Transaction& tx, std::int64_t module_id,
                                                 std::int64_t branch_id) {
  db::VersionFilter filter;
  filter.module_id       = module_id;
  filter.branch_id       = branch_id;
  filter.is_current_head = true;

  auto heads = repo.ListVersions(tx, filter);
  if (heads.empty()) return std::nullopt;
  return heads.front();
}

std::vector<db::model::VersionRecord> ModuleHeads(db::Repository& repo, db::Transaction& tx, std::int64_t module_id) {
  db::VersionFilter filter;
  filter.module_id       = module_id;
  filter.is_current_head = true;

  auto heads = repo.ListVersions(tx, filter);
  std::stable_sort(heads.begin(), heads.end(),
                   [](const auto& a, const auto& b) { return a.branch_id < b.branch_id; });
  return heads;
}

std::vector<std::int64_t> ParentIds(db::Repository& repo, db::Transaction& tx, const db::model::CommitRecord& commit) {
  std::vector<std::int64_t> parents;
  if (commit.parent_commit_id) parents.push_back(*commit.parent_commit_id);
  for (const auto& extra : repo.GetCommitParents(tx, commit.id)) {
    parents.push_back(extra.parent_commit_id);
  }
  return parents;
}

std::optional<std::vector<std::int64_t>> AncestryPath(db::Repository& repo, db::Transaction& tx, std::int64_t ancestor,
                                                      std::int64_t descendant) {
  if (ancestor == descendant) return std::vector<std::int64_t>{};

  // breadth-first from the descendant, remembering which child led to each commit
  std::unordered_map<std::int64_t, std::int64_t> child_of;
  std::deque<std::int64_t>                       queue{descendant};
  child_of.emplace(descendant, descendant);

  bool found = false;
  while (!queue.empty() && !found) {
    const auto current = queue.front();
    queue.pop_front();

    auto commit = repo.GetCommit(tx, current);
    if (!commit) continue;

    for (auto parent : ParentIds(repo, tx, *commit)) {
      if (child_of.count(parent)) continue;
      child_of.emplace(parent, current);
      if (parent == ancestor) {
        found = true;
        break;
      }
      queue.push_back(parent);
    }
  }
  if (!found) return std::nullopt;

  std::vector<std::int64_t> path;
  for (auto id = child_of.at(ancestor); ; id = child_of.at(id)) {
    path.push_back(id);
    if (id == descendant) break;
  }
  return path;
}

bool IsAncestor(db::Repository& repo, db::Transaction& tx, std::int64_t ancestor, std::int64_t descendant) {
  return AncestryPath(repo, tx, ancestor, descendant).has_value();
}

model::Commit ToCommit(db::Repository& repo, db::Transaction& tx, const db::model::CommitRecord& record) {
  model::CommitHeader header;
  header.id              = record.id;
  header.hash            = record.hash;
  header.message         = record.message;
  header.author          = record.author;
  header.committer       = record.committer;
  header.module_id       = record.module_id;
  header.committed_at_ms = record.committed_at_ms;

  if (!record.is_merge_commit) {
    return model::LinearCommit{std::move(header), record.parent_commit_id};
  }

  model::MergeCommit merge;
  merge.header            = std::move(header);
  merge.primary_parent_id = record.parent_commit_id.value_or(0);
  for (const auto& extra : repo.GetCommitParents(tx, record.id)) {
    merge.extra_parent_ids.push_back(extra.parent_commit_id);
  }
  return merge;
}

} // namespace activity::core::history
