#include "branch_manager.hpp"

#include "internal/core/error_mapping.hpp"
#include "internal/core/history_queries.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace activity::core {

using observability::IntField;
using observability::StringField;

namespace {

db::model::VersionRecord PointerCopy(const db::model::VersionRecord& source) {
  db::model::VersionRecord copy = source;
  copy.id              = 0;
  copy.created_at_ms   = 0;
  copy.is_current_head = true;
  return copy;
}

} // namespace

BranchManager::BranchManager(std::shared_ptr<db::Repository> repository, std::string default_branch_name)
    : repository_(std::move(repository)), default_branch_name_(std::move(default_branch_name)) {
}

Outcome<db::model::BranchRecord> BranchManager::GetOrCreateDefaultBranch(std::int64_t actor) {
  return Guard("get_or_create_default_branch", [&] {
    auto tx = repository_->Begin();
    auto branch = history::EnsureDefaultBranch(*repository_, *tx, default_branch_name_, actor);
    tx->Commit();
    return branch;
  });
}

Outcome<db::model::BranchRecord> BranchManager::GetBranchByName(const std::string& name) {
  return Guard("get_branch", [&] {
    auto tx = repository_->Begin(db::TransactionMode::kReadOnly);
    auto branch = history::RequireBranch(*repository_, *tx, name);
    tx->Commit();
    return branch;
  });
}

Outcome<std::vector<db::model::BranchRecord>> BranchManager::ListBranches() {
  return Guard("list_branches", [&] {
    auto tx = repository_->Begin(db::TransactionMode::kReadOnly);
    auto branches = repository_->ListBranches(*tx);
    tx->Commit();
    return branches;
  });
}

Outcome<CreateBranchResult> BranchManager::CreateBranch(const CreateBranchArgs& args) {
  return Guard("create_branch", [&] {
    if (args.name.empty()) throw util::InvalidArgument("create branch: name is required");
    if (args.actor == 0) throw util::InvalidArgument("create branch: actor is required");

    auto tx = repository_->Begin();
    if (repository_->GetBranchByName(*tx, args.name)) {
      throw util::DuplicateBranch("branch '" + args.name + "' already exists");
    }

    CreateBranchResult result;
    result.source_branch = args.from ? history::RequireBranch(*repository_, *tx, *args.from)
                                     : history::EnsureDefaultBranch(*repository_, *tx, default_branch_name_, args.actor);

    result.branch.name        = args.name;
    result.branch.description = args.description;
    result.branch.created_by  = args.actor;
    auto inserted = repository_->InsertBranch(*tx, result.branch);
    if (inserted.code == db::ErrorCode::AlreadyExists) {
      throw util::DuplicateBranch("branch '" + args.name + "' already exists");
    }
    ThrowIfDbError(inserted, "create branch");

    db::VersionFilter heads;
    heads.branch_id       = result.source_branch.id;
    heads.is_current_head = true;
    for (const auto& head : repository_->ListVersions(*tx, heads)) {
      auto copy      = PointerCopy(head);
      copy.branch_id = result.branch.id;
      ThrowIfDbError(repository_->InsertVersion(*tx, copy), "create branch: copy head");
      ++result.copied_version_count;
    }

    tx->Commit();
    ACTIVITY_LOG_INFO("branch created", {StringField("branch", result.branch.name),
                                         StringField("from", result.source_branch.name),
                                         IntField("copied_versions", static_cast<std::int64_t>(result.copied_version_count))});
    return result;
  });
}

Outcome<db::model::BranchRecord> BranchManager::DeleteBranch(const std::string& name) {
  return Guard("delete_branch", [&] {
    auto tx = repository_->Begin();
    auto branch = history::RequireBranch(*repository_, *tx, name);
    if (branch.is_default) {
      throw util::InvalidOperation("cannot delete the default branch '" + name + "'");
    }

    db::VersionFilter filter;
    filter.branch_id = branch.id;
    for (const auto& version : repository_->ListVersions(*tx, filter)) {
      ThrowIfDbError(repository_->DeleteVersion(*tx, version.id), "delete branch: version");
    }
    ThrowIfDbError(repository_->DeleteBranch(*tx, branch.id), "delete branch");

    tx->Commit();
    ACTIVITY_LOG_INFO("branch deleted", {StringField("branch", name)});
    return branch;
  });
}

Outcome<ForkModuleResult> BranchManager::ForkModule(const ForkModuleArgs& args) {
  return Guard("fork_module", [&] {
    if (args.new_slug.empty()) throw util::InvalidArgument("fork module: slug is required");
    if (args.actor == 0) throw util::InvalidArgument("fork module: actor is required");

    auto tx = repository_->Begin();

    ForkModuleResult result;
    result.source_module = history::RequireModule(*repository_, *tx, args.source_slug);
    if (repository_->GetModuleBySlug(*tx, args.new_slug)) {
      throw util::DuplicateSlug("slug '" + args.new_slug + "' is already taken");
    }

    auto& module            = result.module;
    module.slug             = args.new_slug;
    module.title            = args.title.value_or(result.source_module.title);
    module.description      = result.source_module.description;
    module.type             = result.source_module.type;
    module.status           = result.source_module.status;
    module.created_by       = args.actor;
    module.origin_module_id = db::model::LineageRoot(result.source_module);
    module.forked_from_id   = result.source_module.id;
    auto inserted = repository_->InsertModule(*tx, module);
    if (inserted.code == db::ErrorCode::AlreadyExists) {
      throw util::DuplicateSlug("slug '" + args.new_slug + "' is already taken");
    }
    ThrowIfDbError(inserted, "fork module");

    for (const auto& head : history::ModuleHeads(*repository_, *tx, result.source_module.id)) {
      auto copy      = PointerCopy(head);
      copy.module_id = module.id;
      ThrowIfDbError(repository_->InsertVersion(*tx, copy), "fork module: copy head");
      ++result.copied_version_count;
    }

    tx->Commit();
    ACTIVITY_LOG_INFO("module forked", {StringField("source", result.source_module.slug), StringField("module", module.slug),
                                        IntField("copied_versions", static_cast<std::int64_t>(result.copied_version_count))});
    return result;
  });
}

} // namespace activity::core
