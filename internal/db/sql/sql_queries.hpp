#pragma once

namespace activity::db::sql {

/*
  Canonical SQL used by the SQL backends.

  IMPORTANT:
  Column order here is the order the row mappers read.
  List queries with optional filters are assembled by the backend
  from the *_SELECT prefixes below.
*/

// modules

static constexpr const char* INSERT_MODULE =
    "INSERT INTO activity_modules(slug,title,description,type,status,created_by,created_at_ms,origin_module_id,forked_from_id)"
    " VALUES(?,?,?,?,?,?,?,?,?);";

static constexpr const char* MODULE_SELECT =
    "SELECT id,slug,title,description,type,status,created_by,created_at_ms,origin_module_id,forked_from_id"
    " FROM activity_modules";

static constexpr const char* MODULE_COUNT =
    "SELECT COUNT(*) FROM activity_modules";

static constexpr const char* UPDATE_MODULE =
    "UPDATE activity_modules SET slug=?,title=?,description=?,type=?,status=?,origin_module_id=?,forked_from_id=?"
    " WHERE id=?;";

static constexpr const char* DELETE_MODULE =
    "DELETE FROM activity_modules WHERE id=?;";

// branches

static constexpr const char* INSERT_BRANCH =
    "INSERT INTO branches(name,description,is_default,created_by,created_at_ms)"
    " VALUES(?,?,?,?,?);";

static constexpr const char* BRANCH_SELECT =
    "SELECT id,name,description,is_default,created_by,created_at_ms FROM branches";

static constexpr const char* DELETE_BRANCH =
    "DELETE FROM branches WHERE id=?;";

// commits

static constexpr const char* INSERT_COMMIT =
    "INSERT INTO commits(hash,message,author,committer,module_id,parent_commit_id,is_merge_commit,committed_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?);";

static constexpr const char* COMMIT_SELECT =
    "SELECT id,hash,message,author,committer,module_id,parent_commit_id,is_merge_commit,committed_at_ms FROM commits";

static constexpr const char* COMMIT_COUNT =
    "SELECT COUNT(*) FROM commits;";

static constexpr const char* INSERT_COMMIT_PARENT =
    "INSERT INTO commit_parents(commit_id,parent_commit_id,parent_order) VALUES(?,?,?);";

static constexpr const char* SELECT_COMMIT_PARENTS =
    "SELECT commit_id,parent_commit_id,parent_order FROM commit_parents"
    " WHERE commit_id=? ORDER BY parent_order;";

// versions

static constexpr const char* INSERT_VERSION =
    "INSERT INTO module_versions(module_id,branch_id,commit_id,content,title,description,content_hash,is_current_head,created_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?);";

static constexpr const char* VERSION_SELECT =
    "SELECT id,module_id,branch_id,commit_id,content,title,description,content_hash,is_current_head,created_at_ms"
    " FROM module_versions";

static constexpr const char* SET_VERSION_HEAD =
    "UPDATE module_versions SET is_current_head=? WHERE id=?;";

static constexpr const char* DELETE_VERSION =
    "DELETE FROM module_versions WHERE id=?;";

// merge requests

static constexpr const char* INSERT_MERGE_REQUEST =
    "INSERT INTO merge_requests(title,description,from_module_id,to_module_id,status,created_by,created_at_ms,"
    "merged_by,merged_at_ms,rejected_by,rejected_at_ms,closed_by,closed_at_ms,reason,allow_comments)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* MERGE_REQUEST_SELECT =
    "SELECT id,title,description,from_module_id,to_module_id,status,created_by,created_at_ms,"
    "merged_by,merged_at_ms,rejected_by,rejected_at_ms,closed_by,closed_at_ms,reason,allow_comments"
    " FROM merge_requests";

static constexpr const char* UPDATE_MERGE_REQUEST =
    "UPDATE merge_requests SET title=?,description=?,status=?,merged_by=?,merged_at_ms=?,rejected_by=?,rejected_at_ms=?,"
    "closed_by=?,closed_at_ms=?,reason=?,allow_comments=?"
    " WHERE id=?;";

static constexpr const char* DELETE_MERGE_REQUEST =
    "DELETE FROM merge_requests WHERE id=?;";

static constexpr const char* INSERT_COMMENT =
    "INSERT INTO merge_request_comments(merge_request_id,author,text,created_at_ms) VALUES(?,?,?,?);";

static constexpr const char* SELECT_COMMENTS =
    "SELECT id,merge_request_id,author,text,created_at_ms FROM merge_request_comments"
    " WHERE merge_request_id=? ORDER BY id;";

static constexpr const char* DELETE_COMMENTS =
    "DELETE FROM merge_request_comments WHERE merge_request_id=?;";

// schema bookkeeping

static constexpr const char* CREATE_SCHEMA_MIGRATIONS =
    "CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);";

static constexpr const char* SELECT_SCHEMA_VERSION =
    "SELECT COALESCE(MAX(version), 0) FROM schema_migrations;";

static constexpr const char* INSERT_SCHEMA_VERSION =
    "INSERT INTO schema_migrations(version,applied_at_ms) VALUES(?,?);";

}
