#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/content.hpp"

namespace activity::core {

class RevisionManager;

enum class MergeStrategy {
  kCopy,           // target has nothing on the branch
  kNoop,           // identical content
  kFastForward,    // target head is an ancestor of the source head
  kAlreadyMerged,  // source head is an ancestor of the target head
  kThreeWay,       // divergent histories
};

std::string_view ToString(MergeStrategy strategy);

struct MergeStep {
  MergeStrategy                           strategy = MergeStrategy::kNoop;
  db::model::BranchRecord                 branch;
  db::model::VersionRecord                source;
  db::model::CommitRecord                 source_commit;
  std::optional<db::model::VersionRecord> target;
  std::optional<db::model::CommitRecord>  target_commit;

  // kFastForward only: commits after the target head up to the source
  // head, oldest first.
  std::vector<std::int64_t> path;
};

struct MergePlan {
  db::model::ModuleRecord from;
  db::model::ModuleRecord to;
  std::vector<MergeStep>  steps;

  bool RequiresResolution() const;
};

struct MergeSummary {
  std::size_t copied         = 0;
  std::size_t fast_forwarded = 0;
  std::size_t merged         = 0;
  std::size_t unchanged      = 0;
  std::size_t skipped        = 0;

  std::vector<std::int64_t> commit_ids;
  std::vector<std::int64_t> version_ids;
};

/*
  MergeEngine

  Merges one module's heads into another module of the same lineage,
  one step per branch the source has a head on. Runs inside the
  caller's transaction and throws on failure; the caller's rollback
  undoes every commit and version written so far.
*/
class MergeEngine {
 public:
  MergeEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<RevisionManager> revisions);

  MergePlan Plan(db::Transaction& tx, std::int64_t from_module_id, std::int64_t to_module_id);

  // Three-way steps take `resolved` when given. Without it a step is
  // skipped when the source commit is older than the target commit and
  // otherwise takes the source content.
  MergeSummary Apply(db::Transaction& tx, const MergePlan& plan, std::int64_t actor,
                     const std::optional<util::Content>& resolved = std::nullopt);

 private:
  std::shared_ptr<db::Repository>  repository_;
  std::shared_ptr<RevisionManager> revisions_;
};

} // namespace activity::core
