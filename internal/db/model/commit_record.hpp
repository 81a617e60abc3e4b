#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace activity::db::model {

/*
  Immutable commit row.

  parent_commit_id is the primary parent. Merge commits record every
  further parent as a CommitParentRecord.
*/

struct CommitRecord {
  std::int64_t id = 0;
  std::string  hash;
  std::string  message;
  std::int64_t author    = 0;
  std::int64_t committer = 0;

  // module the commit was written for
  std::int64_t module_id = 0;

  std::optional<std::int64_t> parent_commit_id;
  bool                        is_merge_commit = false;

  // epoch ms
  uint64_t committed_at_ms = 0;
};

struct CommitParentRecord {
  std::int64_t commit_id        = 0;
  std::int64_t parent_commit_id = 0;

  // 1-based; 0 is the implicit primary parent
  std::uint32_t parent_order = 1;
};

} // namespace activity::db::model
