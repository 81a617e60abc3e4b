#pragma once

#include <cstdint>
#include <string>

namespace activity::db::model {

struct BranchRecord {
  std::int64_t id = 0;
  std::string  name;
  std::string  description;
  bool         is_default = false;
  std::int64_t created_by = 0;
  uint64_t     created_at_ms = 0;
};

} // namespace activity::db::model
