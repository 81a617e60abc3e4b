#pragma once

#include <stdexcept>
#include <string>

namespace activity::util {

/*
  Central error types.

  Thrown inside the core and translated to core::Outcome at the
  manager boundary (see internal/core/error_mapping.hpp).
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DuplicateSlug : public std::runtime_error {
 public:
  explicit DuplicateSlug(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DuplicateBranch : public std::runtime_error {
 public:
  explicit DuplicateBranch(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DuplicateRequest : public std::runtime_error {
 public:
  explicit DuplicateRequest(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidOperation : public std::runtime_error {
 public:
  explicit InvalidOperation(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CommentsDisabled : public std::runtime_error {
 public:
  explicit CommentsDisabled(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ConflictResolutionRequired : public std::runtime_error {
 public:
  explicit ConflictResolutionRequired(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Raised by a store when a concurrent transaction committed first.
class WriteConflict : public std::runtime_error {
 public:
  explicit WriteConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace activity::util
