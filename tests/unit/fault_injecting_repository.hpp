#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace activity::testing {

using activity::db::Result;
using activity::db::Transaction;
namespace dbm = activity::db::model;

/*
  Passes everything through to a real repository, but fails version
  inserts or deletes once a configured number of them has succeeded.
*/
class FaultInjectingRepository final : public activity::db::Repository {
 public:
  explicit FaultInjectingRepository(std::shared_ptr<activity::db::Repository> inner) : inner_(std::move(inner)) {
  }

  void FailVersionInsertsAfter(std::optional<int> allowed) {
    allowed_version_inserts_ = allowed;
    version_inserts_         = 0;
  }

  void FailVersionDeletesAfter(std::optional<int> allowed) {
    allowed_version_deletes_ = allowed;
    version_deletes_         = 0;
  }

  std::unique_ptr<Transaction> Begin(activity::db::TransactionMode mode = activity::db::TransactionMode::kReadWrite) override {
    return inner_->Begin(mode);
  }

  Result InsertModule(Transaction& t, dbm::ModuleRecord& r) override {
    return inner_->InsertModule(t, r);
  }
  std::optional<dbm::ModuleRecord> GetModule(Transaction& t, std::int64_t id) override {
    return inner_->GetModule(t, id);
  }
  std::optional<dbm::ModuleRecord> GetModuleBySlug(Transaction& t, const std::string& slug) override {
    return inner_->GetModuleBySlug(t, slug);
  }
  std::vector<dbm::ModuleRecord> ListModules(Transaction& t, const activity::db::ModuleFilter& f,
                                             const activity::db::Pagination& p, activity::db::SortOrder o) override {
    return inner_->ListModules(t, f, p, o);
  }
  uint64_t CountModules(Transaction& t, const activity::db::ModuleFilter& f) override {
    return inner_->CountModules(t, f);
  }
  Result UpdateModule(Transaction& t, const dbm::ModuleRecord& r) override {
    return inner_->UpdateModule(t, r);
  }
  Result DeleteModule(Transaction& t, std::int64_t id) override {
    return inner_->DeleteModule(t, id);
  }

  Result InsertBranch(Transaction& t, dbm::BranchRecord& r) override {
    return inner_->InsertBranch(t, r);
  }
  std::optional<dbm::BranchRecord> GetBranch(Transaction& t, std::int64_t id) override {
    return inner_->GetBranch(t, id);
  }
  std::optional<dbm::BranchRecord> GetBranchByName(Transaction& t, const std::string& name) override {
    return inner_->GetBranchByName(t, name);
  }
  std::optional<dbm::BranchRecord> GetDefaultBranch(Transaction& t) override {
    return inner_->GetDefaultBranch(t);
  }
  std::vector<dbm::BranchRecord> ListBranches(Transaction& t) override {
    return inner_->ListBranches(t);
  }
  Result DeleteBranch(Transaction& t, std::int64_t id) override {
    return inner_->DeleteBranch(t, id);
  }

  Result InsertCommit(Transaction& t, dbm::CommitRecord& r) override {
    return inner_->InsertCommit(t, r);
  }
  std::optional<dbm::CommitRecord> GetCommit(Transaction& t, std::int64_t id) override {
    return inner_->GetCommit(t, id);
  }
  std::vector<dbm::CommitRecord> FindCommitsByHash(Transaction& t, const std::string& hash) override {
    return inner_->FindCommitsByHash(t, hash);
  }
  uint64_t CountCommits(Transaction& t) override {
    return inner_->CountCommits(t);
  }
  Result InsertCommitParent(Transaction& t, const dbm::CommitParentRecord& r) override {
    return inner_->InsertCommitParent(t, r);
  }
  std::vector<dbm::CommitParentRecord> GetCommitParents(Transaction& t, std::int64_t commit_id) override {
    return inner_->GetCommitParents(t, commit_id);
  }

  Result InsertVersion(Transaction& t, dbm::VersionRecord& r) override {
    if (allowed_version_inserts_ && version_inserts_ >= *allowed_version_inserts_) {
      return Result::Err(activity::db::ErrorCode::IOError, "injected version insert failure");
    }
    ++version_inserts_;
    return inner_->InsertVersion(t, r);
  }
  std::optional<dbm::VersionRecord> GetVersion(Transaction& t, std::int64_t id) override {
    return inner_->GetVersion(t, id);
  }
  std::vector<dbm::VersionRecord> ListVersions(Transaction& t, const activity::db::VersionFilter& f) override {
    return inner_->ListVersions(t, f);
  }
  Result SetVersionHead(Transaction& t, std::int64_t id, bool is_current_head) override {
    return inner_->SetVersionHead(t, id, is_current_head);
  }
  Result DeleteVersion(Transaction& t, std::int64_t id) override {
    if (allowed_version_deletes_ && version_deletes_ >= *allowed_version_deletes_) {
      return Result::Err(activity::db::ErrorCode::IOError, "injected version delete failure");
    }
    ++version_deletes_;
    return inner_->DeleteVersion(t, id);
  }

  Result InsertMergeRequest(Transaction& t, dbm::MergeRequestRecord& r) override {
    return inner_->InsertMergeRequest(t, r);
  }
  std::optional<dbm::MergeRequestRecord> GetMergeRequest(Transaction& t, std::int64_t id) override {
    return inner_->GetMergeRequest(t, id);
  }
  std::vector<dbm::MergeRequestRecord> ListMergeRequests(Transaction& t, const activity::db::MergeRequestFilter& f,
                                                         activity::db::SortOrder o) override {
    return inner_->ListMergeRequests(t, f, o);
  }
  Result UpdateMergeRequest(Transaction& t, const dbm::MergeRequestRecord& r) override {
    return inner_->UpdateMergeRequest(t, r);
  }
  Result DeleteMergeRequest(Transaction& t, std::int64_t id) override {
    return inner_->DeleteMergeRequest(t, id);
  }

  Result InsertComment(Transaction& t, dbm::MergeRequestCommentRecord& r) override {
    return inner_->InsertComment(t, r);
  }
  std::vector<dbm::MergeRequestCommentRecord> ListComments(Transaction& t, std::int64_t merge_request_id) override {
    return inner_->ListComments(t, merge_request_id);
  }
  Result DeleteComments(Transaction& t, std::int64_t merge_request_id) override {
    return inner_->DeleteComments(t, merge_request_id);
  }

 private:
  std::shared_ptr<activity::db::Repository> inner_;
  std::optional<int>                        allowed_version_inserts_;
  int                                       version_inserts_ = 0;
  std::optional<int>                        allowed_version_deletes_;
  int                                       version_deletes_ = 0;
};

} // namespace activity::testing
