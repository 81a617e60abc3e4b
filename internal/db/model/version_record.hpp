#pragma once

#include <cstdint>
#include <string>

namespace activity::db::model {

/*
  Materialized (module, branch, commit) snapshot.

  content holds canonical JSON. At most one row per (module, branch)
  has is_current_head set.
*/

struct VersionRecord {
  std::int64_t id        = 0;
  std::int64_t module_id = 0;
  std::int64_t branch_id = 0;
  std::int64_t commit_id = 0;

  std::string content;
  std::string title;
  std::string description;
  std::string content_hash;

  bool     is_current_head = false;
  uint64_t created_at_ms   = 0;
};

} // namespace activity::db::model
