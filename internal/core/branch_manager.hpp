#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/outcome.hpp"
#include "internal/db/api/repository.hpp"

namespace activity::core {

struct CreateBranchArgs {
  std::string name;
  // default branch when unset
  std::optional<std::string> from;
  std::int64_t               actor = 0;
  std::string                description;
};

struct CreateBranchResult {
  db::model::BranchRecord branch;
  db::model::BranchRecord source_branch;
  std::size_t             copied_version_count = 0;
};

struct ForkModuleArgs {
  std::string                source_slug;
  std::string                new_slug;
  std::int64_t               actor = 0;
  std::optional<std::string> title;
};

struct ForkModuleResult {
  db::model::ModuleRecord module;
  db::model::ModuleRecord source_module;
  std::size_t             copied_version_count = 0;
};

/*
  BranchManager

  Branch refs and module forks. Forking is a pointer copy: new version
  rows point at existing commits, no commit is written.
*/
class BranchManager {
 public:
  BranchManager(std::shared_ptr<db::Repository> repository, std::string default_branch_name);

  Outcome<db::model::BranchRecord> GetOrCreateDefaultBranch(std::int64_t actor);

  Outcome<db::model::BranchRecord> GetBranchByName(const std::string& name);

  Outcome<std::vector<db::model::BranchRecord>> ListBranches();

  Outcome<CreateBranchResult> CreateBranch(const CreateBranchArgs& args);

  // Removes every version on the branch, then the branch.
  Outcome<db::model::BranchRecord> DeleteBranch(const std::string& name);

  Outcome<ForkModuleResult> ForkModule(const ForkModuleArgs& args);

  const std::string& DefaultBranchName() const {
    return default_branch_name_;
  }

 private:
  std::shared_ptr<db::Repository> repository_;
  std::string                     default_branch_name_;
};

} // namespace activity::core
