#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/outcome.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/commit.hpp"
#include "internal/util/content.hpp"

namespace activity::core {

struct CreateModuleArgs {
  std::string                   slug;
  std::string                   title;
  std::string                   description;
  activity::model::ModuleType   type   = activity::model::ModuleType::kPage;
  activity::model::ModuleStatus status = activity::model::ModuleStatus::kDraft;
  util::Content                 content;
  std::int64_t                  actor = 0;
  // default branch (created on demand) when unset
  std::optional<std::string> branch;
  std::optional<std::string> message;
};

// Unset fields keep their previous value. content is merged over the
// previous head one top-level key at a time.
struct UpdateModuleArgs {
  std::optional<util::Content>                 content;
  std::optional<std::string>                   title;
  std::optional<std::string>                   description;
  std::optional<activity::model::ModuleStatus> status;
  std::int64_t                                 actor = 0;
  std::optional<std::string>                   branch;
  std::optional<std::string>                   message;
};

struct ModuleRevision {
  db::model::ModuleRecord  module;
  db::model::VersionRecord version;
  model::Commit            commit;
  db::model::BranchRecord  branch;
};

struct GetModuleArgs {
  std::optional<std::string>  slug;
  std::optional<std::int64_t> id;
  std::optional<std::string>  branch;
  std::optional<std::string>  commit_hash;
};

struct ModuleSnapshot {
  db::model::ModuleRecord  module;
  db::model::VersionRecord version;
  db::model::BranchRecord  branch;
};

struct SearchModulesArgs {
  std::optional<std::string>                   title_contains;
  std::optional<activity::model::ModuleType>   type;
  std::optional<activity::model::ModuleStatus> status;
  std::optional<std::int64_t>                  created_by;
  std::optional<std::string>                   branch;
  // 1-based
  std::uint32_t                page = 1;
  std::optional<std::uint32_t> limit;
};

struct SearchHit {
  db::model::ModuleRecord                 module;
  std::optional<db::model::VersionRecord> version;
};

template <typename T>
struct Page {
  std::vector<T> items;
  std::uint64_t  total       = 0;
  std::uint32_t  page        = 1;
  std::uint32_t  limit       = 0;
  std::uint32_t  total_pages = 0;
  bool           has_next    = false;
  bool           has_prev    = false;
};

// Content written as a head version.
struct HeadContent {
  std::string content;  // canonical JSON
  std::string content_hash;
  std::string title;
  std::string description;
};

struct WriteCommitArgs {
  std::int64_t                           module_id = 0;
  util::Content                          content;
  std::string                            message;
  std::int64_t                           actor = 0;
  std::optional<db::model::CommitRecord> parent;
  std::vector<std::int64_t>              extra_parents;
};

/*
  RevisionManager

  Owns module content history: every content change is a commit plus a
  new head version, and the previous head is demoted in the same
  transaction.
*/
class RevisionManager {
 public:
  RevisionManager(std::shared_ptr<db::Repository> repository, std::string default_branch_name,
                  std::uint32_t search_page_size = 20, std::uint32_t history_limit = 50);

  Outcome<ModuleRevision> CreateModule(const CreateModuleArgs& args);

  Outcome<ModuleRevision> UpdateModule(const std::string& slug, const UpdateModuleArgs& args);

  Outcome<ModuleSnapshot> GetModule(const GetModuleArgs& args);

  Outcome<Page<SearchHit>> SearchModules(const SearchModulesArgs& args);

  // Deletes every version of the module, then the module.
  Outcome<db::model::ModuleRecord> DeleteModule(const std::string& slug);

  // Oldest commit carrying the hash.
  Outcome<model::Commit> GetCommitByHash(const std::string& hash);

  // Primary-parent chain from the head on `branch`, newest first.
  Outcome<std::vector<model::Commit>> GetHistory(const std::string& slug, const std::optional<std::string>& branch,
                                                 std::optional<std::uint32_t> limit = std::nullopt);

  // Transactional primitives, also used by the merge engine. Both throw.

  // Commit hash is chained from the parent's hash. Extra parents become
  // commit_parents rows and mark the commit as a merge.
  db::model::CommitRecord WriteCommit(db::Transaction& tx, const WriteCommitArgs& args);

  // Demotes the current head of (module, branch), if any, and inserts
  // the new head version.
  db::model::VersionRecord AdvanceHead(db::Transaction& tx, std::int64_t module_id, std::int64_t branch_id,
                                       std::int64_t commit_id, const HeadContent& head);

 private:
  std::shared_ptr<db::Repository> repository_;
  std::string                     default_branch_name_;
  std::uint32_t                   search_page_size_;
  std::uint32_t                   history_limit_;
};

HeadContent MakeHeadContent(const util::Content& content, std::string title, std::string description);

} // namespace activity::core
