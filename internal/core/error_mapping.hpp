#pragma once

#include <exception>
#include <string>
#include <string_view>
#include <type_traits>

#include "internal/core/outcome.hpp"
#include "internal/db/api/result.hpp"
#include "internal/observability/logging.hpp"

namespace activity::core {

Error ToError(const std::exception& e);

// Turns a failed store result into the matching util:: exception.
void ThrowIfDbError(const db::Result& result, const std::string& context);

/*
  Runs fn and converts any exception into an Outcome error.

  fn owns its transaction, so by the time the exception reaches here
  the transaction destructor has already rolled back.
*/
template <typename Fn>
auto Guard(std::string_view operation, Fn&& fn) -> Outcome<std::invoke_result_t<Fn>> {
  try {
    return fn();
  } catch (const std::exception& e) {
    auto error = ToError(e);
    ACTIVITY_LOG_WARN("operation failed", {observability::StringField("op", operation),
                                           observability::StringField("kind", ToString(error.kind)),
                                           observability::StringField("error", error.message)});
    return error;
  }
}

} // namespace activity::core
