#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/branch_record.hpp"
#include "internal/db/model/commit_record.hpp"
#include "internal/db/model/merge_request_record.hpp"
#include "internal/db/model/module_record.hpp"
#include "internal/db/model/version_record.hpp"

namespace activity::db {

/*
  Repository abstraction (the persistence port).

  CRITICAL GUARANTEES:

  - All writes require a read-write Transaction
  - Reads inside a transaction see its writes
  - Insert* assigns the row id and writes it back into the record
  - Rows are returned in insertion (id) order unless a SortOrder says
    otherwise

  The DB is the source of truth for:
    modules and their lineage
    branches
    the commit DAG and version heads
    merge requests
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin(TransactionMode mode = TransactionMode::kReadWrite) = 0;

  // ---------------------------------------------------------------------
  // Modules
  // ---------------------------------------------------------------------

  virtual Result InsertModule(Transaction&, model::ModuleRecord&) = 0;

  virtual std::optional<model::ModuleRecord> GetModule(Transaction&, std::int64_t id) = 0;

  virtual std::optional<model::ModuleRecord> GetModuleBySlug(Transaction&, const std::string& slug) = 0;

  virtual std::vector<model::ModuleRecord> ListModules(Transaction&, const ModuleFilter&, const Pagination&,
                                                       SortOrder order = SortOrder::kNewestFirst) = 0;

  virtual uint64_t CountModules(Transaction&, const ModuleFilter&) = 0;

  virtual Result UpdateModule(Transaction&, const model::ModuleRecord&) = 0;

  virtual Result DeleteModule(Transaction&, std::int64_t id) = 0;

  // ---------------------------------------------------------------------
  // Branches
  // ---------------------------------------------------------------------

  virtual Result InsertBranch(Transaction&, model::BranchRecord&) = 0;

  virtual std::optional<model::BranchRecord> GetBranch(Transaction&, std::int64_t id) = 0;

  virtual std::optional<model::BranchRecord> GetBranchByName(Transaction&, const std::string& name) = 0;

  virtual std::optional<model::BranchRecord> GetDefaultBranch(Transaction&) = 0;

  virtual std::vector<model::BranchRecord> ListBranches(Transaction&) = 0;

  virtual Result DeleteBranch(Transaction&, std::int64_t id) = 0;

  // ---------------------------------------------------------------------
  // Commit DAG
  // ---------------------------------------------------------------------

  virtual Result InsertCommit(Transaction&, model::CommitRecord&) = 0;

  virtual std::optional<model::CommitRecord> GetCommit(Transaction&, std::int64_t id) = 0;

  // Hashes are not unique keys; oldest first.
  virtual std::vector<model::CommitRecord> FindCommitsByHash(Transaction&, const std::string& hash) = 0;

  virtual uint64_t CountCommits(Transaction&) = 0;

  virtual Result InsertCommitParent(Transaction&, const model::CommitParentRecord&) = 0;

  // Extra parents of a merge commit ordered by parent_order.
  virtual std::vector<model::CommitParentRecord> GetCommitParents(Transaction&, std::int64_t commit_id) = 0;

  // ---------------------------------------------------------------------
  // Versions
  // ---------------------------------------------------------------------

  virtual Result InsertVersion(Transaction&, model::VersionRecord&) = 0;

  virtual std::optional<model::VersionRecord> GetVersion(Transaction&, std::int64_t id) = 0;

  virtual std::vector<model::VersionRecord> ListVersions(Transaction&, const VersionFilter&) = 0;

  virtual Result SetVersionHead(Transaction&, std::int64_t id, bool is_current_head) = 0;

  virtual Result DeleteVersion(Transaction&, std::int64_t id) = 0;

  // ---------------------------------------------------------------------
  // Merge requests
  // ---------------------------------------------------------------------

  virtual Result InsertMergeRequest(Transaction&, model::MergeRequestRecord&) = 0;

  virtual std::optional<model::MergeRequestRecord> GetMergeRequest(Transaction&, std::int64_t id) = 0;

  virtual std::vector<model::MergeRequestRecord> ListMergeRequests(Transaction&, const MergeRequestFilter&,
                                                                   SortOrder order = SortOrder::kNewestFirst) = 0;

  virtual Result UpdateMergeRequest(Transaction&, const model::MergeRequestRecord&) = 0;

  virtual Result DeleteMergeRequest(Transaction&, std::int64_t id) = 0;

  virtual Result InsertComment(Transaction&, model::MergeRequestCommentRecord&) = 0;

  virtual std::vector<model::MergeRequestCommentRecord> ListComments(Transaction&, std::int64_t merge_request_id) = 0;

  virtual Result DeleteComments(Transaction&, std::int64_t merge_request_id) = 0;
};

} // namespace activity::db
