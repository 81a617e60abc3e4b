#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/module.hpp"

namespace activity::db::model {

/*
  Persistent activity module row.

  origin_module_id is the lineage root; unset means this module is a
  root itself. forked_from_id is the module it was forked from.
*/

struct ModuleRecord {
  std::int64_t id = 0;

  std::string slug;
  std::string title;
  std::string description;

  activity::model::ModuleType   type   = activity::model::ModuleType::kPage;
  activity::model::ModuleStatus status = activity::model::ModuleStatus::kDraft;

  std::int64_t created_by = 0;
  uint64_t     created_at_ms = 0;

  std::optional<std::int64_t> origin_module_id;
  std::optional<std::int64_t> forked_from_id;
};

inline std::int64_t LineageRoot(const ModuleRecord& module) {
  return module.origin_module_id.value_or(module.id);
}

} // namespace activity::db::model
