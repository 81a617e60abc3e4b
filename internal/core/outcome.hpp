#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace activity::core {

enum class ErrorKind {
  kNotFound,
  kDuplicateSlug,
  kDuplicateBranch,
  kDuplicateRequest,
  kInvalidArgument,
  kInvalidOperation,
  kCommentsDisabled,
  kConflictResolutionRequired,
  kWriteConflict,
  kUnknown,
};

constexpr std::string_view ToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNotFound:
      return "NotFound";
    case ErrorKind::kDuplicateSlug:
      return "DuplicateSlug";
    case ErrorKind::kDuplicateBranch:
      return "DuplicateBranch";
    case ErrorKind::kDuplicateRequest:
      return "DuplicateRequest";
    case ErrorKind::kInvalidArgument:
      return "InvalidArgument";
    case ErrorKind::kInvalidOperation:
      return "InvalidOperation";
    case ErrorKind::kCommentsDisabled:
      return "CommentsDisabled";
    case ErrorKind::kConflictResolutionRequired:
      return "ConflictResolutionRequired";
    case ErrorKind::kWriteConflict:
      return "WriteConflict";
    case ErrorKind::kUnknown:
      break;
  }
  return "Unknown";
}

struct Error {
  ErrorKind   kind = ErrorKind::kUnknown;
  std::string message;
};

/*
  Result of a public manager operation: the value or a typed error.

  Exceptions never cross the manager boundary; see Guard() in
  error_mapping.hpp.
*/
template <typename T>
class Outcome {
 public:
  Outcome(T value) : state_(std::in_place_index<0>, std::move(value)) {
  }

  Outcome(Error error) : state_(std::in_place_index<1>, std::move(error)) {
  }

  bool ok() const {
    return state_.index() == 0;
  }

  explicit operator bool() const {
    return ok();
  }

  // Throws std::bad_variant_access when called on an error.
  const T& value() const& {
    return std::get<0>(state_);
  }

  T& value() & {
    return std::get<0>(state_);
  }

  T&& value() && {
    return std::get<0>(std::move(state_));
  }

  const Error& error() const {
    return std::get<1>(state_);
  }

  ErrorKind kind() const {
    return ok() ? ErrorKind::kUnknown : error().kind;
  }

 private:
  std::variant<T, Error> state_;
};

} // namespace activity::core
