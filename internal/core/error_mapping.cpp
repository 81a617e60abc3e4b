#include "error_mapping.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace activity::core {

Error ToError(const std::exception& e) {
  using namespace activity::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {ErrorKind::kNotFound, e.what()};
  }
  if (dynamic_cast<const DuplicateSlug*>(&e)) {
    return {ErrorKind::kDuplicateSlug, e.what()};
  }
  if (dynamic_cast<const DuplicateBranch*>(&e)) {
    return {ErrorKind::kDuplicateBranch, e.what()};
  }
  if (dynamic_cast<const DuplicateRequest*>(&e)) {
    return {ErrorKind::kDuplicateRequest, e.what()};
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {ErrorKind::kInvalidArgument, e.what()};
  }
  if (dynamic_cast<const InvalidOperation*>(&e)) {
    return {ErrorKind::kInvalidOperation, e.what()};
  }
  if (dynamic_cast<const CommentsDisabled*>(&e)) {
    return {ErrorKind::kCommentsDisabled, e.what()};
  }
  if (dynamic_cast<const ConflictResolutionRequired*>(&e)) {
    return {ErrorKind::kConflictResolutionRequired, e.what()};
  }
  if (dynamic_cast<const WriteConflict*>(&e)) {
    return {ErrorKind::kWriteConflict, e.what()};
  }

  return {ErrorKind::kUnknown, e.what()};
}

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::AlreadyExists:
      throw util::InvalidArgument(message);
    case db::ErrorCode::Busy:
    case db::ErrorCode::Conflict:
      throw util::WriteConflict(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace activity::core
