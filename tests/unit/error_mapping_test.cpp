#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/core/error_mapping.hpp"
#include "internal/util/errors.hpp"

namespace {

using activity::core::ErrorKind;
using activity::core::Guard;
using activity::core::ToError;

template <typename Fn>
ErrorKind KindOfThrow(Fn&& fn) {
  try {
    fn();
  } catch (const std::exception& e) {
    return ToError(e).kind;
  }
  return ErrorKind::kUnknown;
}

void TestErrorTypesMapToKinds() {
  using namespace activity::util;

  assert(ToError(NotFound("x")).kind == ErrorKind::kNotFound);
  assert(ToError(DuplicateSlug("x")).kind == ErrorKind::kDuplicateSlug);
  assert(ToError(DuplicateBranch("x")).kind == ErrorKind::kDuplicateBranch);
  assert(ToError(DuplicateRequest("x")).kind == ErrorKind::kDuplicateRequest);
  assert(ToError(InvalidArgument("x")).kind == ErrorKind::kInvalidArgument);
  assert(ToError(InvalidOperation("x")).kind == ErrorKind::kInvalidOperation);
  assert(ToError(CommentsDisabled("x")).kind == ErrorKind::kCommentsDisabled);
  assert(ToError(ConflictResolutionRequired("x")).kind == ErrorKind::kConflictResolutionRequired);
  assert(ToError(WriteConflict("x")).kind == ErrorKind::kWriteConflict);

  auto unknown = ToError(std::logic_error("boom"));
  assert(unknown.kind == ErrorKind::kUnknown);
  assert(unknown.message == "boom");
}

void TestDbResultsBecomeExceptions() {
  using activity::db::ErrorCode;
  using activity::db::Result;

  activity::core::ThrowIfDbError(Result::Ok(), "noop");

  assert(KindOfThrow([] { activity::core::ThrowIfDbError(Result::Err(ErrorCode::NotFound), "get"); }) ==
         ErrorKind::kNotFound);
  assert(KindOfThrow([] { activity::core::ThrowIfDbError(Result::Err(ErrorCode::Busy), "commit"); }) ==
         ErrorKind::kWriteConflict);
  assert(KindOfThrow([] { activity::core::ThrowIfDbError(Result::Err(ErrorCode::Conflict), "commit"); }) ==
         ErrorKind::kWriteConflict);
  assert(KindOfThrow([] { activity::core::ThrowIfDbError(Result::Err(ErrorCode::Corruption), "read"); }) ==
         ErrorKind::kUnknown);
  assert(KindOfThrow([] { activity::core::ThrowIfDbError(Result::Err(ErrorCode::AlreadyExists), "insert"); }) ==
         ErrorKind::kInvalidArgument);
  assert(KindOfThrow([] {
           activity::core::ThrowIfDbError(Result::Err(ErrorCode::ConstraintViolation), "insert");
         }) == ErrorKind::kUnknown);
  assert(KindOfThrow([] { activity::core::ThrowIfDbError(Result::Err(ErrorCode::InternalError), "step"); }) ==
         ErrorKind::kUnknown);

  try {
    activity::core::ThrowIfDbError(Result::Err(ErrorCode::IOError, "disk full"), "insert version");
    assert(false);
  } catch (const std::runtime_error& e) {
    assert(std::string(e.what()) == "insert version: disk full");
  }
}

void TestGuardReturnsValueOrError() {
  auto ok = Guard("ok", [] { return 7; });
  assert(ok.ok());
  assert(ok.value() == 7);
  assert(ok.kind() == ErrorKind::kUnknown);

  auto failed = Guard("fail", []() -> int { throw activity::util::DuplicateSlug("slug taken"); });
  assert(!failed);
  assert(failed.kind() == ErrorKind::kDuplicateSlug);
  assert(failed.error().message == "slug taken");
}

void TestKindNames() {
  assert(activity::core::ToString(ErrorKind::kConflictResolutionRequired) == "ConflictResolutionRequired");
  assert(activity::core::ToString(ErrorKind::kCommentsDisabled) == "CommentsDisabled");
  assert(activity::core::ToString(ErrorKind::kUnknown) == "Unknown");
}

} // namespace

int main() {
  TestErrorTypesMapToKinds();
  TestDbResultsBecomeExceptions();
  TestGuardReturnsValueOrError();
  TestKindNames();

  std::cout << "activity_history_unit_error_mapping: pass\n";
  return 0;
}
