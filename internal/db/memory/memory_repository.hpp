#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace activity::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin(TransactionMode mode = TransactionMode::kReadWrite) override;

  Result InsertModule(Transaction&, model::ModuleRecord&) override;
  std::optional<model::ModuleRecord> GetModule(Transaction&, std::int64_t id) override;
  std::optional<model::ModuleRecord> GetModuleBySlug(Transaction&, const std::string& slug) override;
  std::vector<model::ModuleRecord> ListModules(Transaction&, const ModuleFilter&, const Pagination&,
                                               SortOrder order) override;
  uint64_t CountModules(Transaction&, const ModuleFilter&) override;
  Result UpdateModule(Transaction&, const model::ModuleRecord&) override;
  Result DeleteModule(Transaction&, std::int64_t id) override;

  Result InsertBranch(Transaction&, model::BranchRecord&) override;
  std::optional<model::BranchRecord> GetBranch(Transaction&, std::int64_t id) override;
  std::optional<model::BranchRecord> GetBranchByName(Transaction&, const std::string& name) override;
  std::optional<model::BranchRecord> GetDefaultBranch(Transaction&) override;
  std::vector<model::BranchRecord> ListBranches(Transaction&) override;
  Result DeleteBranch(Transaction&, std::int64_t id) override;

  Result InsertCommit(Transaction&, model::CommitRecord&) override;
  std::optional<model::CommitRecord> GetCommit(Transaction&, std::int64_t id) override;
  std::vector<model::CommitRecord> FindCommitsByHash(Transaction&, const std::string& hash) override;
  uint64_t CountCommits(Transaction&) override;
  Result InsertCommitParent(Transaction&, const model::CommitParentRecord&) override;
  std::vector<model::CommitParentRecord> GetCommitParents(Transaction&, std::int64_t commit_id) override;

  Result InsertVersion(Transaction&, model::VersionRecord&) override;
  std::optional<model::VersionRecord> GetVersion(Transaction&, std::int64_t id) override;
  std::vector<model::VersionRecord> ListVersions(Transaction&, const VersionFilter&) override;
  Result SetVersionHead(Transaction&, std::int64_t id, bool is_current_head) override;
  Result DeleteVersion(Transaction&, std::int64_t id) override;

  Result InsertMergeRequest(Transaction&, model::MergeRequestRecord&) override;
  std::optional<model::MergeRequestRecord> GetMergeRequest(Transaction&, std::int64_t id) override;
  std::vector<model::MergeRequestRecord> ListMergeRequests(Transaction&, const MergeRequestFilter&,
                                                           SortOrder order) override;
  Result UpdateMergeRequest(Transaction&, const model::MergeRequestRecord&) override;
  Result DeleteMergeRequest(Transaction&, std::int64_t id) override;

  Result InsertComment(Transaction&, model::MergeRequestCommentRecord&) override;
  std::vector<model::MergeRequestCommentRecord> ListComments(Transaction&, std::int64_t merge_request_id) override;
  Result DeleteComments(Transaction&, std::int64_t merge_request_id) override;

private:
  friend class MemoryTransaction;

  // Ordered by id so iteration is insertion order.
  struct State {
    std::map<std::int64_t, model::ModuleRecord> modules;
    std::map<std::int64_t, model::BranchRecord> branches;
    std::map<std::int64_t, model::CommitRecord> commits;
    std::vector<model::CommitParentRecord> commit_parents;
    std::map<std::int64_t, model::VersionRecord> versions;
    std::map<std::int64_t, model::MergeRequestRecord> merge_requests;
    std::map<std::int64_t, model::MergeRequestCommentRecord> comments;

    std::int64_t next_module_id        = 1;
    std::int64_t next_branch_id        = 1;
    std::int64_t next_commit_id        = 1;
    std::int64_t next_version_id       = 1;
    std::int64_t next_merge_request_id = 1;
    std::int64_t next_comment_id       = 1;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

}
