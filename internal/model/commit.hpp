#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace activity::model {

/*
  Commit as seen by callers.

  Storage keeps both kinds as rows (a nullable primary parent plus
  commit_parents join rows); callers get the sum type and look parents
  up by id.
*/

struct CommitHeader {
  std::int64_t id = 0;
  std::string  hash;
  std::string  message;
  std::int64_t author    = 0;
  std::int64_t committer = 0;
  std::int64_t module_id = 0;
  uint64_t     committed_at_ms = 0;
};

struct LinearCommit {
  CommitHeader                header;
  std::optional<std::int64_t> parent_id;
};

struct MergeCommit {
  CommitHeader              header;
  std::int64_t              primary_parent_id = 0;
  std::vector<std::int64_t> extra_parent_ids;
};

using Commit = std::variant<LinearCommit, MergeCommit>;

inline const CommitHeader& Header(const Commit& commit) {
  return std::visit([](const auto& c) -> const CommitHeader& { return c.header; }, commit);
}

inline bool IsMerge(const Commit& commit) {
  return std::holds_alternative<MergeCommit>(commit);
}

} // namespace activity::model
