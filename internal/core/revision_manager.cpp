#include "revision_manager.hpp"

#include "internal/core/error_mapping.hpp"
#include "internal/core/history_queries.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"
#include "internal/util/time.hpp"

namespace activity::core {

using observability::StringField;

HeadContent MakeHeadContent(const util::Content& content, std::string title, std::string description) {
  HeadContent head;
  head.content      = util::CanonicalJson(content);
  head.content_hash = util::ContentHash(content);
  head.title        = std::move(title);
  head.description  = std::move(description);
  return head;
}

RevisionManager::RevisionManager(std::shared_ptr<db::Repository> repository, std::string default_branch_name,
                                 std::uint32_t search_page_size, std::uint32_t history_limit)
    : repository_(std::move(repository)),
      default_branch_name_(std::move(default_branch_name)),
      search_page_size_(search_page_size == 0 ? 20 : search_page_size),
      history_limit_(history_limit == 0 ? 50 : history_limit) {
}

// ---------------------------------------------------------------------
// Transactional primitives
// ---------------------------------------------------------------------

db::model::CommitRecord RevisionManager::WriteCommit(db::Transaction& tx, const WriteCommitArgs& args) {
  db::model::CommitRecord commit;
  commit.message         = args.message;
  commit.author          = args.actor;
  commit.committer       = args.actor;
  commit.module_id       = args.module_id;
  commit.is_merge_commit = !args.extra_parents.empty();
  commit.committed_at_ms = util::NowMillis();

  std::optional<std::string> parent_hash;
  if (args.parent) {
    commit.parent_commit_id = args.parent->id;
    parent_hash             = args.parent->hash;
  }
  commit.hash = util::CommitHash(args.content, commit.message, commit.author, commit.committed_at_ms, parent_hash);

  ThrowIfDbError(repository_->InsertCommit(tx, commit), "write commit");

  std::uint32_t order = 1;
  for (auto parent_id : args.extra_parents) {
    db::model::CommitParentRecord parent;
    parent.commit_id        = commit.id;
    parent.parent_commit_id = parent_id;
    parent.parent_order     = order++;
    ThrowIfDbError(repository_->InsertCommitParent(tx, parent), "write commit parent");
  }
  return commit;
}

db::model::VersionRecord RevisionManager::AdvanceHead(db::Transaction& tx, std::int64_t module_id, std::int64_t branch_id,
                                                      std::int64_t commit_id, const HeadContent& head) {
  if (auto previous = history::FindHead(*repository_, tx, module_id, branch_id)) {
    ThrowIfDbError(repository_->SetVersionHead(tx, previous->id, false), "demote head");
  }

  db::model::VersionRecord version;
  version.module_id       = module_id;
  version.branch_id       = branch_id;
  version.commit_id       = commit_id;
  version.content         = head.content;
  version.content_hash    = head.content_hash;
  version.title           = head.title;
  version.description     = head.description;
  version.is_current_head = true;
  ThrowIfDbError(repository_->InsertVersion(tx, version), "insert head version");
  return version;
}

// ---------------------------------------------------------------------
// Operations
// ---------------------------------------------------------------------

Outcome<ModuleRevision> RevisionManager::CreateModule(const CreateModuleArgs& args) {
  return Guard("create_module", [&] {
    if (args.slug.empty()) throw util::InvalidArgument("create module: slug is required");
    if (args.title.empty()) throw util::InvalidArgument("create module: title is required");
    if (args.actor == 0) throw util::InvalidArgument("create module: actor is required");

    auto tx = repository_->Begin();
    if (repository_->GetModuleBySlug(*tx, args.slug)) {
      throw util::DuplicateSlug("slug '" + args.slug + "' is already taken");
    }

    auto branch = args.branch ? history::RequireBranch(*repository_, *tx, *args.branch)
                              : history::EnsureDefaultBranch(*repository_, *tx, default_branch_name_, args.actor);

    db::model::ModuleRecord module;
    module.slug        = args.slug;
    module.title       = args.title;
    module.description = args.description;
    module.type        = args.type;
    module.status      = args.status;
    module.created_by  = args.actor;
    auto inserted = repository_->InsertModule(*tx, module);
    if (inserted.code == db::ErrorCode::AlreadyExists) {
      throw util::DuplicateSlug("slug '" + args.slug + "' is already taken");
    }
    ThrowIfDbError(inserted, "create module");

    WriteCommitArgs commit_args;
    commit_args.module_id = module.id;
    commit_args.content   = args.content;
    commit_args.message   = args.message.value_or("Initial commit");
    commit_args.actor     = args.actor;
    auto commit  = WriteCommit(*tx, commit_args);
    auto version = AdvanceHead(*tx, module.id, branch.id, commit.id,
                               MakeHeadContent(args.content, module.title, module.description));

    auto result = ModuleRevision{module, version, history::ToCommit(*repository_, *tx, commit), branch};
    tx->Commit();

    ACTIVITY_LOG_INFO("module created", {StringField("module", module.slug), StringField("branch", branch.name),
                                         StringField("commit", commit.hash)});
    return result;
  });
}

Outcome<ModuleRevision> RevisionManager::UpdateModule(const std::string& slug, const UpdateModuleArgs& args) {
  return Guard("update_module", [&] {
    if (args.actor == 0) throw util::InvalidArgument("update module: actor is required");
    if (args.title && args.title->empty()) throw util::InvalidArgument("update module: title cannot be empty");

    auto tx     = repository_->Begin();
    auto module = history::RequireModule(*repository_, *tx, slug);
    auto branch = history::ResolveBranch(*repository_, *tx, args.branch);

    auto prior = history::FindHead(*repository_, *tx, module.id, branch.id);

    util::Content content;
    std::string   title       = module.title;
    std::string   description = module.description;
    std::optional<db::model::CommitRecord> parent;
    if (prior) {
      content     = util::ParseContent(prior->content);
      title       = prior->title;
      description = prior->description;
      parent      = history::RequireCommit(*repository_, *tx, prior->commit_id);
    }
    if (args.content) content = util::ShallowMerge(content, *args.content);
    if (args.title) title = *args.title;
    if (args.description) description = *args.description;

    // the module row mirrors the default branch only
    if (branch.is_default && (args.title || args.description || args.status)) {
      module.title       = title;
      module.description = description;
      if (args.status) module.status = *args.status;
      ThrowIfDbError(repository_->UpdateModule(*tx, module), "update module");
    }

    WriteCommitArgs commit_args;
    commit_args.module_id = module.id;
    commit_args.content   = content;
    commit_args.message   = args.message.value_or("Update activity module");
    commit_args.actor     = args.actor;
    commit_args.parent    = parent;
    auto commit  = WriteCommit(*tx, commit_args);
    auto version = AdvanceHead(*tx, module.id, branch.id, commit.id, MakeHeadContent(content, title, description));

    auto result = ModuleRevision{module, version, history::ToCommit(*repository_, *tx, commit), branch};
    tx->Commit();

    ACTIVITY_LOG_INFO("module updated", {StringField("module", module.slug), StringField("branch", branch.name),
                                         StringField("commit", commit.hash)});
    return result;
  });
}

Outcome<ModuleSnapshot> RevisionManager::GetModule(const GetModuleArgs& args) {
  return Guard("get_module", [&] {
    if (!args.slug && !args.id) throw util::InvalidArgument("get module: slug or id is required");

    auto tx     = repository_->Begin(db::TransactionMode::kReadOnly);
    auto module = args.slug ? history::RequireModule(*repository_, *tx, *args.slug)
                            : history::RequireModule(*repository_, *tx, *args.id);
    auto branch = history::ResolveBranch(*repository_, *tx, args.branch);

    std::optional<db::model::VersionRecord> version;
    if (args.commit_hash) {
      auto commits = repository_->FindCommitsByHash(*tx, *args.commit_hash);
      if (commits.empty()) throw util::NotFound("commit " + *args.commit_hash + " not found");

      for (const auto& commit : commits) {
        db::VersionFilter filter;
        filter.module_id = module.id;
        filter.branch_id = branch.id;
        filter.commit_id = commit.id;
        auto versions = repository_->ListVersions(*tx, filter);
        if (!versions.empty()) version = versions.back();
      }
      if (!version) {
        throw util::NotFound("commit " + *args.commit_hash + " is not on branch '" + branch.name + "' of '" +
                             module.slug + "'");
      }
    } else {
      version = history::FindHead(*repository_, *tx, module.id, branch.id);
      if (!version) {
        throw util::NotFound("module '" + module.slug + "' has no content on branch '" + branch.name + "'");
      }
    }

    tx->Commit();
    return ModuleSnapshot{module, *version, branch};
  });
}

Outcome<Page<SearchHit>> RevisionManager::SearchModules(const SearchModulesArgs& args) {
  return Guard("search_modules", [&] {
    if (args.page == 0) throw util::InvalidArgument("search modules: page starts at 1");

    auto tx = repository_->Begin(db::TransactionMode::kReadOnly);

    std::optional<db::model::BranchRecord> branch;
    if (args.branch) {
      branch = history::RequireBranch(*repository_, *tx, *args.branch);
    } else {
      branch = repository_->GetDefaultBranch(*tx);
    }

    db::ModuleFilter filter;
    filter.title_contains = args.title_contains;
    filter.type           = args.type;
    filter.status         = args.status;
    filter.created_by     = args.created_by;

    Page<SearchHit> page;
    page.page  = args.page;
    page.limit = args.limit.value_or(search_page_size_);
    if (page.limit == 0) throw util::InvalidArgument("search modules: limit must be positive");

    db::Pagination pagination;
    pagination.limit  = page.limit;
    pagination.offset = static_cast<std::size_t>(args.page - 1) * page.limit;

    page.total       = repository_->CountModules(*tx, filter);
    page.total_pages = static_cast<std::uint32_t>((page.total + page.limit - 1) / page.limit);
    page.has_prev    = args.page > 1;
    page.has_next    = args.page < page.total_pages;

    for (auto& module : repository_->ListModules(*tx, filter, pagination, db::SortOrder::kNewestFirst)) {
      SearchHit hit;
      if (branch) hit.version = history::FindHead(*repository_, *tx, module.id, branch->id);
      hit.module = std::move(module);
      page.items.push_back(std::move(hit));
    }

    tx->Commit();
    return page;
  });
}

Outcome<db::model::ModuleRecord> RevisionManager::DeleteModule(const std::string& slug) {
  return Guard("delete_module", [&] {
    auto tx     = repository_->Begin();
    auto module = history::RequireModule(*repository_, *tx, slug);

    db::VersionFilter filter;
    filter.module_id = module.id;
    for (const auto& version : repository_->ListVersions(*tx, filter)) {
      ThrowIfDbError(repository_->DeleteVersion(*tx, version.id), "delete module: version");
    }
    ThrowIfDbError(repository_->DeleteModule(*tx, module.id), "delete module");

    tx->Commit();
    ACTIVITY_LOG_INFO("module deleted", {StringField("module", slug)});
    return module;
  });
}

Outcome<model::Commit> RevisionManager::GetCommitByHash(const std::string& hash) {
  return Guard("get_commit", [&] {
    auto tx      = repository_->Begin(db::TransactionMode::kReadOnly);
    auto commits = repository_->FindCommitsByHash(*tx, hash);
    if (commits.empty()) throw util::NotFound("commit " + hash + " not found");

    auto commit = history::ToCommit(*repository_, *tx, commits.front());
    tx->Commit();
    return commit;
  });
}

Outcome<std::vector<model::Commit>> RevisionManager::GetHistory(const std::string& slug,
                                                                const std::optional<std::string>& branch_name,
                                                                std::optional<std::uint32_t> limit) {
  return Guard("get_history", [&] {
    const auto max = limit.value_or(history_limit_);

    auto tx     = repository_->Begin(db::TransactionMode::kReadOnly);
    auto module = history::RequireModule(*repository_, *tx, slug);
    auto branch = history::ResolveBranch(*repository_, *tx, branch_name);

    std::vector<model::Commit> commits;
    auto head = history::FindHead(*repository_, *tx, module.id, branch.id);
    std::optional<std::int64_t> next;
    if (head) next = head->commit_id;

    while (next && commits.size() < max) {
      auto record = history::RequireCommit(*repository_, *tx, *next);
      commits.push_back(history::ToCommit(*repository_, *tx, record));
      next = record.parent_commit_id;
    }

    tx->Commit();
    return commits;
  });
}

} // namespace activity::core
