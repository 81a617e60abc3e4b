#pragma once

#include <functional>
#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/db/sql/sql_params.hpp"
#include "internal/db/sql/sql_row.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace activity::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  using RowReader = std::function<void(const sql::Row&)>;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);

  // Runs a statement expected to return no rows. Sets *row_id to the
  // inserted rowid and reports NotFound when a mutation touched nothing
  // if require_change is set.
  static Result Execute(Transaction& t, const std::string& sql, const sql::Params& params,
                        std::int64_t* row_id = nullptr, bool require_change = false);

  static void Query(Transaction& t, const std::string& sql, const sql::Params& params, const RowReader& reader);
};

}
