#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/merge_request_state.hpp"
#include "internal/model/module.hpp"

namespace activity::db {

struct Pagination {
  std::size_t limit  = 100;
  std::size_t offset = 0;
};

// Equality on every set field; title is a substring match.
struct ModuleFilter {
  std::optional<std::string>                   slug;
  std::optional<std::string>                   title_contains;
  std::optional<activity::model::ModuleType>   type;
  std::optional<activity::model::ModuleStatus> status;
  std::optional<std::int64_t>                  created_by;
};

struct VersionFilter {
  std::optional<std::int64_t> module_id;
  std::optional<std::int64_t> branch_id;
  std::optional<std::int64_t> commit_id;
  std::optional<bool>         is_current_head;
};

// module_id matches either endpoint.
struct MergeRequestFilter {
  std::optional<std::int64_t>                        module_id;
  std::optional<std::int64_t>                        from_module_id;
  std::optional<std::int64_t>                        to_module_id;
  std::optional<activity::model::MergeRequestStatus> status;
};

enum class SortOrder {
  kOldestFirst,
  kNewestFirst,
};

} // namespace activity::db
