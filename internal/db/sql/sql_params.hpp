#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace activity::db::sql {

/*
  Parameter abstraction.

  SQLite: ? ? ?

  Ordered binding; nullptr binds SQL NULL.
*/

using Param = std::variant<
    std::nullptr_t,
    int32_t,
    int64_t,
    uint64_t,
    std::string
>;

using Params = std::vector<Param>;

}
