#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/merge_request_state.hpp"

namespace activity::db::model {

struct MergeRequestRecord {
  std::int64_t id = 0;

  std::string title;
  std::string description;

  std::int64_t from_module_id = 0;
  std::int64_t to_module_id   = 0;

  activity::model::MergeRequestStatus status = activity::model::MergeRequestStatus::kOpen;

  std::int64_t created_by    = 0;
  uint64_t     created_at_ms = 0;

  std::optional<std::int64_t> merged_by;
  std::optional<uint64_t>     merged_at_ms;
  std::optional<std::int64_t> rejected_by;
  std::optional<uint64_t>     rejected_at_ms;
  std::optional<std::int64_t> closed_by;
  std::optional<uint64_t>     closed_at_ms;

  std::string reason;
  bool        allow_comments = true;
};

struct MergeRequestCommentRecord {
  std::int64_t id               = 0;
  std::int64_t merge_request_id = 0;
  std::int64_t author           = 0;
  std::string  text;
  uint64_t     created_at_ms = 0;
};

} // namespace activity::db::model
