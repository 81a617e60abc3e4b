#include "memory_repository.hpp"

#include <algorithm>
#include <chrono>

#include "memory_tx.hpp"

namespace activity::db::memory {

namespace {

uint64_t NowMs() {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count());
}

bool Matches(const model::ModuleRecord& m, const ModuleFilter& f) {
  if (f.slug && m.slug != *f.slug) return false;
  if (f.title_contains && m.title.find(*f.title_contains) == std::string::npos) return false;
  if (f.type && m.type != *f.type) return false;
  if (f.status && m.status != *f.status) return false;
  if (f.created_by && m.created_by != *f.created_by) return false;
  return true;
}

bool Matches(const model::VersionRecord& v, const VersionFilter& f) {
  if (f.module_id && v.module_id != *f.module_id) return false;
  if (f.branch_id && v.branch_id != *f.branch_id) return false;
  if (f.commit_id && v.commit_id != *f.commit_id) return false;
  if (f.is_current_head && v.is_current_head != *f.is_current_head) return false;
  return true;
}

bool Matches(const model::MergeRequestRecord& r, const MergeRequestFilter& f) {
  if (f.module_id && r.from_module_id != *f.module_id && r.to_module_id != *f.module_id) return false;
  if (f.from_module_id && r.from_module_id != *f.from_module_id) return false;
  if (f.to_module_id && r.to_module_id != *f.to_module_id) return false;
  if (f.status && r.status != *f.status) return false;
  return true;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin(TransactionMode mode) {
  return std::make_unique<MemoryTransaction>(*this, mode);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Modules
// ------------------------------------------------------------------

Result MemoryRepository::InsertModule(Transaction& t, model::ModuleRecord& r) {
  auto& s = TX(t).Mutable();
  for (const auto& [_, existing] : s.modules) {
    if (existing.slug == r.slug) return Result::Err(ErrorCode::AlreadyExists, "module slug already exists");
  }
  r.id = s.next_module_id++;
  if (r.created_at_ms == 0) r.created_at_ms = NowMs();
  s.modules[r.id] = r;
  return Result::Ok();
}

std::optional<model::ModuleRecord> MemoryRepository::GetModule(Transaction& t, std::int64_t id) {
  const auto& s  = TX(t).View();
  const auto  it = s.modules.find(id);
  if (it == s.modules.end()) return std::nullopt;
  return it->second;
}

std::optional<model::ModuleRecord> MemoryRepository::GetModuleBySlug(Transaction& t, const std::string& slug) {
  for (const auto& [_, m] : TX(t).View().modules)
    if (m.slug == slug) return m;
  return std::nullopt;
}

std::vector<model::ModuleRecord> MemoryRepository::ListModules(Transaction& t, const ModuleFilter& filter,
                                                               const Pagination& pagination, SortOrder order) {
  std::vector<model::ModuleRecord> matched;
  for (const auto& [_, m] : TX(t).View().modules)
    if (Matches(m, filter)) matched.push_back(m);

  if (order == SortOrder::kNewestFirst) {
    std::stable_sort(matched.begin(), matched.end(), [](const model::ModuleRecord& a, const model::ModuleRecord& b) {
      if (a.created_at_ms != b.created_at_ms) return a.created_at_ms > b.created_at_ms;
      return a.id > b.id;
    });
  }

  std::vector<model::ModuleRecord> out;
  for (std::size_t i = pagination.offset; i < matched.size() && out.size() < pagination.limit; ++i) {
    out.push_back(matched[i]);
  }
  return out;
}

uint64_t MemoryRepository::CountModules(Transaction& t, const ModuleFilter& filter) {
  const auto& modules = TX(t).View().modules;
  return static_cast<uint64_t>(
      std::count_if(modules.begin(), modules.end(), [&](const auto& entry) { return Matches(entry.second, filter); }));
}

Result MemoryRepository::UpdateModule(Transaction& t, const model::ModuleRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.modules.contains(r.id)) return Result::Err(ErrorCode::NotFound);
  s.modules[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteModule(Transaction& t, std::int64_t id) {
  auto& s = TX(t).Mutable();
  if (s.modules.erase(id) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Branches
// ------------------------------------------------------------------

Result MemoryRepository::InsertBranch(Transaction& t, model::BranchRecord& r) {
  auto& s = TX(t).Mutable();
  for (const auto& [_, existing] : s.branches) {
    if (existing.name == r.name) return Result::Err(ErrorCode::AlreadyExists, "branch name already exists");
  }
  r.id = s.next_branch_id++;
  if (r.created_at_ms == 0) r.created_at_ms = NowMs();
  s.branches[r.id] = r;
  return Result::Ok();
}

std::optional<model::BranchRecord> MemoryRepository::GetBranch(Transaction& t, std::int64_t id) {
  const auto& s  = TX(t).View();
  const auto  it = s.branches.find(id);
  if (it == s.branches.end()) return std::nullopt;
  return it->second;
}

std::optional<model::BranchRecord> MemoryRepository::GetBranchByName(Transaction& t, const std::string& name) {
  for (const auto& [_, b] : TX(t).View().branches)
    if (b.name == name) return b;
  return std::nullopt;
}

std::optional<model::BranchRecord> MemoryRepository::GetDefaultBranch(Transaction& t) {
  for (const auto& [_, b] : TX(t).View().branches)
    if (b.is_default) return b;
  return std::nullopt;
}

std::vector<model::BranchRecord> MemoryRepository::ListBranches(Transaction& t) {
  std::vector<model::BranchRecord> out;
  for (const auto& [_, b] : TX(t).View().branches) out.push_back(b);
  return out;
}

Result MemoryRepository::DeleteBranch(Transaction& t, std::int64_t id) {
  auto& s = TX(t).Mutable();
  if (s.branches.erase(id) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Commit DAG
// ------------------------------------------------------------------

Result MemoryRepository::InsertCommit(Transaction& t, model::CommitRecord& r) {
  auto& s = TX(t).Mutable();
  if (r.parent_commit_id && !s.commits.contains(*r.parent_commit_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "parent commit does not exist");
  }
  r.id = s.next_commit_id++;
  if (r.committed_at_ms == 0) r.committed_at_ms = NowMs();
  s.commits[r.id] = r;
  return Result::Ok();
}

std::optional<model::CommitRecord> MemoryRepository::GetCommit(Transaction& t, std::int64_t id) {
  const auto& s  = TX(t).View();
  const auto  it = s.commits.find(id);
  if (it == s.commits.end()) return std::nullopt;
  return it->second;
}

std::vector<model::CommitRecord> MemoryRepository::FindCommitsByHash(Transaction& t, const std::string& hash) {
  std::vector<model::CommitRecord> out;
  for (const auto& [_, c] : TX(t).View().commits)
    if (c.hash == hash) out.push_back(c);
  return out;
}

uint64_t MemoryRepository::CountCommits(Transaction& t) {
  return TX(t).View().commits.size();
}

Result MemoryRepository::InsertCommitParent(Transaction& t, const model::CommitParentRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.commits.contains(r.commit_id) || !s.commits.contains(r.parent_commit_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "commit parent references a missing commit");
  }
  s.commit_parents.push_back(r);
  return Result::Ok();
}

std::vector<model::CommitParentRecord> MemoryRepository::GetCommitParents(Transaction& t, std::int64_t commit_id) {
  std::vector<model::CommitParentRecord> out;
  for (const auto& p : TX(t).View().commit_parents)
    if (p.commit_id == commit_id) out.push_back(p);
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.parent_order < b.parent_order; });
  return out;
}

// ------------------------------------------------------------------
// Versions
// ------------------------------------------------------------------

Result MemoryRepository::InsertVersion(Transaction& t, model::VersionRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.modules.contains(r.module_id) || !s.branches.contains(r.branch_id) || !s.commits.contains(r.commit_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "version references a missing module, branch or commit");
  }
  if (r.is_current_head) {
    for (const auto& [_, v] : s.versions) {
      if (v.is_current_head && v.module_id == r.module_id && v.branch_id == r.branch_id) {
        return Result::Err(ErrorCode::ConstraintViolation, "module already has a head on this branch");
      }
    }
  }
  r.id = s.next_version_id++;
  if (r.created_at_ms == 0) r.created_at_ms = NowMs();
  s.versions[r.id] = r;
  return Result::Ok();
}

std::optional<model::VersionRecord> MemoryRepository::GetVersion(Transaction& t, std::int64_t id) {
  const auto& s  = TX(t).View();
  const auto  it = s.versions.find(id);
  if (it == s.versions.end()) return std::nullopt;
  return it->second;
}

std::vector<model::VersionRecord> MemoryRepository::ListVersions(Transaction& t, const VersionFilter& filter) {
  std::vector<model::VersionRecord> out;
  for (const auto& [_, v] : TX(t).View().versions)
    if (Matches(v, filter)) out.push_back(v);
  return out;
}

Result MemoryRepository::SetVersionHead(Transaction& t, std::int64_t id, bool is_current_head) {
  auto&      s  = TX(t).Mutable();
  const auto it = s.versions.find(id);
  if (it == s.versions.end()) return Result::Err(ErrorCode::NotFound);
  it->second.is_current_head = is_current_head;
  return Result::Ok();
}

Result MemoryRepository::DeleteVersion(Transaction& t, std::int64_t id) {
  auto& s = TX(t).Mutable();
  if (s.versions.erase(id) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Merge requests
// ------------------------------------------------------------------

Result MemoryRepository::InsertMergeRequest(Transaction& t, model::MergeRequestRecord& r) {
  auto& s = TX(t).Mutable();
  r.id    = s.next_merge_request_id++;
  if (r.created_at_ms == 0) r.created_at_ms = NowMs();
  s.merge_requests[r.id] = r;
  return Result::Ok();
}

std::optional<model::MergeRequestRecord> MemoryRepository::GetMergeRequest(Transaction& t, std::int64_t id) {
  const auto& s  = TX(t).View();
  const auto  it = s.merge_requests.find(id);
  if (it == s.merge_requests.end()) return std::nullopt;
  return it->second;
}

std::vector<model::MergeRequestRecord> MemoryRepository::ListMergeRequests(Transaction& t, const MergeRequestFilter& filter,
                                                                           SortOrder order) {
  std::vector<model::MergeRequestRecord> out;
  for (const auto& [_, r] : TX(t).View().merge_requests)
    if (Matches(r, filter)) out.push_back(r);
  if (order == SortOrder::kNewestFirst) {
    std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
      if (a.created_at_ms != b.created_at_ms) return a.created_at_ms > b.created_at_ms;
      return a.id > b.id;
    });
  }
  return out;
}

Result MemoryRepository::UpdateMergeRequest(Transaction& t, const model::MergeRequestRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.merge_requests.contains(r.id)) return Result::Err(ErrorCode::NotFound);
  s.merge_requests[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteMergeRequest(Transaction& t, std::int64_t id) {
  auto& s = TX(t).Mutable();
  if (s.merge_requests.erase(id) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

Result MemoryRepository::InsertComment(Transaction& t, model::MergeRequestCommentRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.merge_requests.contains(r.merge_request_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "comment references a missing merge request");
  }
  r.id = s.next_comment_id++;
  if (r.created_at_ms == 0) r.created_at_ms = NowMs();
  s.comments[r.id] = r;
  return Result::Ok();
}

std::vector<model::MergeRequestCommentRecord> MemoryRepository::ListComments(Transaction& t, std::int64_t merge_request_id) {
  std::vector<model::MergeRequestCommentRecord> out;
  for (const auto& [_, c] : TX(t).View().comments)
    if (c.merge_request_id == merge_request_id) out.push_back(c);
  return out;
}

Result MemoryRepository::DeleteComments(Transaction& t, std::int64_t merge_request_id) {
  auto& comments = TX(t).Mutable().comments;
  for (auto it = comments.begin(); it != comments.end();) {
    if (it->second.merge_request_id == merge_request_id) {
      it = comments.erase(it);
    } else {
      ++it;
    }
  }
  return Result::Ok();
}

} // namespace activity::db::memory
