#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <chrono>
#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"
#include "sqlite_statement.hpp"

namespace activity::db::sqlite {

using activity::db::ErrorCode;
using activity::db::Result;

namespace {

uint64_t NowMs() {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count());
}

sql::Param Opt(const std::optional<std::int64_t>& v) {
  if (!v) return nullptr;
  return *v;
}

sql::Param Opt(const std::optional<uint64_t>& v) {
  if (!v) return nullptr;
  return *v;
}

sql::Param Flag(bool v) {
  return static_cast<int32_t>(v ? 1 : 0);
}

model::ModuleRecord ReadModule(const sql::Row& row) {
  model::ModuleRecord r;
  r.id               = row.GetInt64(0);
  r.slug             = row.GetText(1);
  r.title            = row.GetText(2);
  r.description      = row.GetText(3);
  r.type             = static_cast<activity::model::ModuleType>(row.GetInt(4));
  r.status           = static_cast<activity::model::ModuleStatus>(row.GetInt(5));
  r.created_by       = row.GetInt64(6);
  r.created_at_ms    = row.GetU64(7);
  r.origin_module_id = row.GetOptionalInt64(8);
  r.forked_from_id   = row.GetOptionalInt64(9);
  return r;
}

model::BranchRecord ReadBranch(const sql::Row& row) {
  model::BranchRecord r;
  r.id            = row.GetInt64(0);
  r.name          = row.GetText(1);
  r.description   = row.GetText(2);
  r.is_default    = row.GetBool(3);
  r.created_by    = row.GetInt64(4);
  r.created_at_ms = row.GetU64(5);
  return r;
}

model::CommitRecord ReadCommit(const sql::Row& row) {
  model::CommitRecord r;
  r.id               = row.GetInt64(0);
  r.hash             = row.GetText(1);
  r.message          = row.GetText(2);
  r.author           = row.GetInt64(3);
  r.committer        = row.GetInt64(4);
  r.module_id        = row.GetInt64(5);
  r.parent_commit_id = row.GetOptionalInt64(6);
  r.is_merge_commit  = row.GetBool(7);
  r.committed_at_ms  = row.GetU64(8);
  return r;
}

model::VersionRecord ReadVersion(const sql::Row& row) {
  model::VersionRecord r;
  r.id              = row.GetInt64(0);
  r.module_id       = row.GetInt64(1);
  r.branch_id       = row.GetInt64(2);
  r.commit_id       = row.GetInt64(3);
  r.content         = row.GetText(4);
  r.title           = row.GetText(5);
  r.description     = row.GetText(6);
  r.content_hash    = row.GetText(7);
  r.is_current_head = row.GetBool(8);
  r.created_at_ms   = row.GetU64(9);
  return r;
}

model::MergeRequestRecord ReadMergeRequest(const sql::Row& row) {
  model::MergeRequestRecord r;
  r.id             = row.GetInt64(0);
  r.title          = row.GetText(1);
  r.description    = row.GetText(2);
  r.from_module_id = row.GetInt64(3);
  r.to_module_id   = row.GetInt64(4);
  r.status         = static_cast<activity::model::MergeRequestStatus>(row.GetInt(5));
  r.created_by     = row.GetInt64(6);
  r.created_at_ms  = row.GetU64(7);
  r.merged_by      = row.GetOptionalInt64(8);
  r.merged_at_ms   = row.GetOptionalU64(9);
  r.rejected_by    = row.GetOptionalInt64(10);
  r.rejected_at_ms = row.GetOptionalU64(11);
  r.closed_by      = row.GetOptionalInt64(12);
  r.closed_at_ms   = row.GetOptionalU64(13);
  r.reason         = row.GetText(14);
  r.allow_comments = row.GetBool(15);
  return r;
}

model::MergeRequestCommentRecord ReadComment(const sql::Row& row) {
  model::MergeRequestCommentRecord r;
  r.id               = row.GetInt64(0);
  r.merge_request_id = row.GetInt64(1);
  r.author           = row.GetInt64(2);
  r.text             = row.GetText(3);
  r.created_at_ms    = row.GetU64(4);
  return r;
}

// Appends " WHERE a AND b ..." for the module filter.
void AppendModuleWhere(std::string& sql, sql::Params& params, const ModuleFilter& f) {
  std::string where;
  auto        add = [&](const char* clause) {
    where += where.empty() ? " WHERE " : " AND ";
    where += clause;
  };
  if (f.slug) {
    add("slug=?");
    params.emplace_back(*f.slug);
  }
  if (f.title_contains) {
    add("instr(title, ?) > 0");
    params.emplace_back(*f.title_contains);
  }
  if (f.type) {
    add("type=?");
    params.emplace_back(static_cast<int32_t>(*f.type));
  }
  if (f.status) {
    add("status=?");
    params.emplace_back(static_cast<int32_t>(*f.status));
  }
  if (f.created_by) {
    add("created_by=?");
    params.emplace_back(*f.created_by);
  }
  sql += where;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin(TransactionMode mode) {
    return std::make_unique<SqliteTransaction>(db_, mode);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

Result SqliteRepository::Execute(Transaction& t, const std::string& sql, const sql::Params& params,
                                 std::int64_t* row_id, bool require_change) {
    auto* db = TX(t).Handle();

    Statement st(db, sql);
    if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    st.Bind(params);
    int rc = st.Step();
    if (rc != SQLITE_DONE) return Translate(db, rc);

    if (row_id) *row_id = static_cast<std::int64_t>(sqlite3_last_insert_rowid(db));
    if (require_change && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
}

void SqliteRepository::Query(Transaction& t, const std::string& sql, const sql::Params& params, const RowReader& reader) {
    auto* db = TX(t).Handle();

    Statement st(db, sql);
    if (!st.Ok()) throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));

    st.Bind(params);
    int rc;
    while ((rc = st.Step()) == SQLITE_ROW) {
        reader(st);
    }
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("sqlite query: ") + sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Modules
// ------------------------------------------------------------------

Result SqliteRepository::InsertModule(Transaction& t, model::ModuleRecord& r) {
    if (r.created_at_ms == 0) r.created_at_ms = NowMs();

    auto result = Execute(t, sql::INSERT_MODULE,
                          {r.slug, r.title, r.description, static_cast<int32_t>(r.type), static_cast<int32_t>(r.status),
                           r.created_by, r.created_at_ms, Opt(r.origin_module_id), Opt(r.forked_from_id)},
                          &r.id);
    if (result.code == ErrorCode::ConstraintViolation) {
        return Result::Err(ErrorCode::AlreadyExists, result.message);
    }
    return result;
}

std::optional<model::ModuleRecord> SqliteRepository::GetModule(Transaction& t, std::int64_t id) {
    std::optional<model::ModuleRecord> out;
    Query(t, std::string(sql::MODULE_SELECT) + " WHERE id=?;", {id}, [&](const sql::Row& row) { out = ReadModule(row); });
    return out;
}

std::optional<model::ModuleRecord> SqliteRepository::GetModuleBySlug(Transaction& t, const std::string& slug) {
    std::optional<model::ModuleRecord> out;
    Query(t, std::string(sql::MODULE_SELECT) + " WHERE slug=?;", {slug}, [&](const sql::Row& row) { out = ReadModule(row); });
    return out;
}

std::vector<model::ModuleRecord> SqliteRepository::ListModules(Transaction& t, const ModuleFilter& filter,
                                                               const Pagination& pagination, SortOrder order) {
    std::string sql = sql::MODULE_SELECT;
    sql::Params params;
    AppendModuleWhere(sql, params, filter);
    sql += order == SortOrder::kNewestFirst ? " ORDER BY created_at_ms DESC, id DESC" : " ORDER BY id ASC";
    sql += " LIMIT ? OFFSET ?;";
    params.emplace_back(static_cast<uint64_t>(pagination.limit));
    params.emplace_back(static_cast<uint64_t>(pagination.offset));

    std::vector<model::ModuleRecord> out;
    Query(t, sql, params, [&](const sql::Row& row) { out.push_back(ReadModule(row)); });
    return out;
}

uint64_t SqliteRepository::CountModules(Transaction& t, const ModuleFilter& filter) {
    std::string sql = sql::MODULE_COUNT;
    sql::Params params;
    AppendModuleWhere(sql, params, filter);
    sql += ";";

    uint64_t count = 0;
    Query(t, sql, params, [&](const sql::Row& row) { count = row.GetU64(0); });
    return count;
}

Result SqliteRepository::UpdateModule(Transaction& t, const model::ModuleRecord& r) {
    return Execute(t, sql::UPDATE_MODULE,
                   {r.slug, r.title, r.description, static_cast<int32_t>(r.type), static_cast<int32_t>(r.status),
                    Opt(r.origin_module_id), Opt(r.forked_from_id), r.id},
                   nullptr, /*require_change=*/true);
}

Result SqliteRepository::DeleteModule(Transaction& t, std::int64_t id) {
    return Execute(t, sql::DELETE_MODULE, {id}, nullptr, /*require_change=*/true);
}

// ------------------------------------------------------------------
// Branches
// ------------------------------------------------------------------

Result SqliteRepository::InsertBranch(Transaction& t, model::BranchRecord& r) {
    if (r.created_at_ms == 0) r.created_at_ms = NowMs();

    auto result = Execute(t, sql::INSERT_BRANCH, {r.name, r.description, Flag(r.is_default), r.created_by, r.created_at_ms}, &r.id);
    if (result.code == ErrorCode::ConstraintViolation) {
        return Result::Err(ErrorCode::AlreadyExists, result.message);
    }
    return result;
}

std::optional<model::BranchRecord> SqliteRepository::GetBranch(Transaction& t, std::int64_t id) {
    std::optional<model::BranchRecord> out;
    Query(t, std::string(sql::BRANCH_SELECT) + " WHERE id=?;", {id}, [&](const sql::Row& row) { out = ReadBranch(row); });
    return out;
}

std::optional<model::BranchRecord> SqliteRepository::GetBranchByName(Transaction& t, const std::string& name) {
    std::optional<model::BranchRecord> out;
    Query(t, std::string(sql::BRANCH_SELECT) + " WHERE name=?;", {name}, [&](const sql::Row& row) { out = ReadBranch(row); });
    return out;
}

std::optional<model::BranchRecord> SqliteRepository::GetDefaultBranch(Transaction& t) {
    std::optional<model::BranchRecord> out;
    Query(t, std::string(sql::BRANCH_SELECT) + " WHERE is_default=1 ORDER BY id LIMIT 1;", {},
          [&](const sql::Row& row) { out = ReadBranch(row); });
    return out;
}

std::vector<model::BranchRecord> SqliteRepository::ListBranches(Transaction& t) {
    std::vector<model::BranchRecord> out;
    Query(t, std::string(sql::BRANCH_SELECT) + " ORDER BY id;", {}, [&](const sql::Row& row) { out.push_back(ReadBranch(row)); });
    return out;
}

Result SqliteRepository::DeleteBranch(Transaction& t, std::int64_t id) {
    return Execute(t, sql::DELETE_BRANCH, {id}, nullptr, /*require_change=*/true);
}

// ------------------------------------------------------------------
// Commit DAG
// ------------------------------------------------------------------

Result SqliteRepository::InsertCommit(Transaction& t, model::CommitRecord& r) {
    if (r.committed_at_ms == 0) r.committed_at_ms = NowMs();

    return Execute(t, sql::INSERT_COMMIT,
                   {r.hash, r.message, r.author, r.committer, r.module_id, Opt(r.parent_commit_id), Flag(r.is_merge_commit),
                    r.committed_at_ms},
                   &r.id);
}

std::optional<model::CommitRecord> SqliteRepository::GetCommit(Transaction& t, std::int64_t id) {
    std::optional<model::CommitRecord> out;
    Query(t, std::string(sql::COMMIT_SELECT) + " WHERE id=?;", {id}, [&](const sql::Row& row) { out = ReadCommit(row); });
    return out;
}

std::vector<model::CommitRecord> SqliteRepository::FindCommitsByHash(Transaction& t, const std::string& hash) {
    std::vector<model::CommitRecord> out;
    Query(t, std::string(sql::COMMIT_SELECT) + " WHERE hash=? ORDER BY id;", {hash},
          [&](const sql::Row& row) { out.push_back(ReadCommit(row)); });
    return out;
}

uint64_t SqliteRepository::CountCommits(Transaction& t) {
    uint64_t count = 0;
    Query(t, sql::COMMIT_COUNT, {}, [&](const sql::Row& row) { count = row.GetU64(0); });
    return count;
}

Result SqliteRepository::InsertCommitParent(Transaction& t, const model::CommitParentRecord& r) {
    return Execute(t, sql::INSERT_COMMIT_PARENT, {r.commit_id, r.parent_commit_id, static_cast<int32_t>(r.parent_order)});
}

std::vector<model::CommitParentRecord> SqliteRepository::GetCommitParents(Transaction& t, std::int64_t commit_id) {
    std::vector<model::CommitParentRecord> out;
    Query(t, sql::SELECT_COMMIT_PARENTS, {commit_id}, [&](const sql::Row& row) {
        model::CommitParentRecord r;
        r.commit_id        = row.GetInt64(0);
        r.parent_commit_id = row.GetInt64(1);
        r.parent_order     = static_cast<std::uint32_t>(row.GetInt(2));
        out.push_back(r);
    });
    return out;
}

// ------------------------------------------------------------------
// Versions
// ------------------------------------------------------------------

Result SqliteRepository::InsertVersion(Transaction& t, model::VersionRecord& r) {
    if (r.created_at_ms == 0) r.created_at_ms = NowMs();

    return Execute(t, sql::INSERT_VERSION,
                   {r.module_id, r.branch_id, r.commit_id, r.content, r.title, r.description, r.content_hash,
                    Flag(r.is_current_head), r.created_at_ms},
                   &r.id);
}

std::optional<model::VersionRecord> SqliteRepository::GetVersion(Transaction& t, std::int64_t id) {
    std::optional<model::VersionRecord> out;
    Query(t, std::string(sql::VERSION_SELECT) + " WHERE id=?;", {id}, [&](const sql::Row& row) { out = ReadVersion(row); });
    return out;
}

std::vector<model::VersionRecord> SqliteRepository::ListVersions(Transaction& t, const VersionFilter& f) {
    std::string sql = sql::VERSION_SELECT;
    sql::Params params;
    std::string where;
    auto        add = [&](const char* clause, sql::Param value) {
        where += where.empty() ? " WHERE " : " AND ";
        where += clause;
        params.push_back(std::move(value));
    };
    if (f.module_id) add("module_id=?", *f.module_id);
    if (f.branch_id) add("branch_id=?", *f.branch_id);
    if (f.commit_id) add("commit_id=?", *f.commit_id);
    if (f.is_current_head) add("is_current_head=?", Flag(*f.is_current_head));
    sql += where + " ORDER BY id;";

    std::vector<model::VersionRecord> out;
    Query(t, sql, params, [&](const sql::Row& row) { out.push_back(ReadVersion(row)); });
    return out;
}

Result SqliteRepository::SetVersionHead(Transaction& t, std::int64_t id, bool is_current_head) {
    return Execute(t, sql::SET_VERSION_HEAD, {Flag(is_current_head), id}, nullptr, /*require_change=*/true);
}

Result SqliteRepository::DeleteVersion(Transaction& t, std::int64_t id) {
    return Execute(t, sql::DELETE_VERSION, {id}, nullptr, /*require_change=*/true);
}

// ------------------------------------------------------------------
// Merge requests
// ------------------------------------------------------------------

Result SqliteRepository::InsertMergeRequest(Transaction& t, model::MergeRequestRecord& r) {
    if (r.created_at_ms == 0) r.created_at_ms = NowMs();

    return Execute(t, sql::INSERT_MERGE_REQUEST,
                   {r.title, r.description, r.from_module_id, r.to_module_id, static_cast<int32_t>(r.status), r.created_by,
                    r.created_at_ms, Opt(r.merged_by), Opt(r.merged_at_ms), Opt(r.rejected_by), Opt(r.rejected_at_ms),
                    Opt(r.closed_by), Opt(r.closed_at_ms), r.reason, Flag(r.allow_comments)},
                   &r.id);
}

std::optional<model::MergeRequestRecord> SqliteRepository::GetMergeRequest(Transaction& t, std::int64_t id) {
    std::optional<model::MergeRequestRecord> out;
    Query(t, std::string(sql::MERGE_REQUEST_SELECT) + " WHERE id=?;", {id},
          [&](const sql::Row& row) { out = ReadMergeRequest(row); });
    return out;
}

std::vector<model::MergeRequestRecord> SqliteRepository::ListMergeRequests(Transaction& t, const MergeRequestFilter& f,
                                                                           SortOrder order) {
    std::string sql = sql::MERGE_REQUEST_SELECT;
    sql::Params params;
    std::string where;
    auto        add = [&](const char* clause) { where += where.empty() ? " WHERE " : " AND "; where += clause; };
    if (f.module_id) {
        add("(from_module_id=? OR to_module_id=?)");
        params.emplace_back(*f.module_id);
        params.emplace_back(*f.module_id);
    }
    if (f.from_module_id) {
        add("from_module_id=?");
        params.emplace_back(*f.from_module_id);
    }
    if (f.to_module_id) {
        add("to_module_id=?");
        params.emplace_back(*f.to_module_id);
    }
    if (f.status) {
        add("status=?");
        params.emplace_back(static_cast<int32_t>(*f.status));
    }
    sql += where;
    sql += order == SortOrder::kNewestFirst ? " ORDER BY created_at_ms DESC, id DESC;" : " ORDER BY id ASC;";

    std::vector<model::MergeRequestRecord> out;
    Query(t, sql, params, [&](const sql::Row& row) { out.push_back(ReadMergeRequest(row)); });
    return out;
}

Result SqliteRepository::UpdateMergeRequest(Transaction& t, const model::MergeRequestRecord& r) {
    return Execute(t, sql::UPDATE_MERGE_REQUEST,
                   {r.title, r.description, static_cast<int32_t>(r.status), Opt(r.merged_by), Opt(r.merged_at_ms),
                    Opt(r.rejected_by), Opt(r.rejected_at_ms), Opt(r.closed_by), Opt(r.closed_at_ms), r.reason,
                    Flag(r.allow_comments), r.id},
                   nullptr, /*require_change=*/true);
}

Result SqliteRepository::DeleteMergeRequest(Transaction& t, std::int64_t id) {
    return Execute(t, sql::DELETE_MERGE_REQUEST, {id}, nullptr, /*require_change=*/true);
}

Result SqliteRepository::InsertComment(Transaction& t, model::MergeRequestCommentRecord& r) {
    if (r.created_at_ms == 0) r.created_at_ms = NowMs();

    return Execute(t, sql::INSERT_COMMENT, {r.merge_request_id, r.author, r.text, r.created_at_ms}, &r.id);
}

std::vector<model::MergeRequestCommentRecord> SqliteRepository::ListComments(Transaction& t, std::int64_t merge_request_id) {
    std::vector<model::MergeRequestCommentRecord> out;
    Query(t, sql::SELECT_COMMENTS, {merge_request_id}, [&](const sql::Row& row) { out.push_back(ReadComment(row)); });
    return out;
}

Result SqliteRepository::DeleteComments(Transaction& t, std::int64_t merge_request_id) {
    return Execute(t, sql::DELETE_COMMENTS, {merge_request_id});
}

} // namespace activity::db::sqlite
