#include "merge_engine.hpp"

#include <algorithm>

#include "internal/core/history_queries.hpp"
#include "internal/core/revision_manager.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace activity::core {

using observability::IntField;
using observability::StringField;

std::string_view ToString(MergeStrategy strategy) {
  switch (strategy) {
    case MergeStrategy::kCopy:
      return "copy";
    case MergeStrategy::kNoop:
      return "noop";
    case MergeStrategy::kFastForward:
      return "fast_forward";
    case MergeStrategy::kAlreadyMerged:
      return "already_merged";
    case MergeStrategy::kThreeWay:
      return "three_way";
  }
  return "unknown";
}

bool MergePlan::RequiresResolution() const {
  return std::any_of(steps.begin(), steps.end(),
                     [](const MergeStep& step) { return step.strategy == MergeStrategy::kThreeWay; });
}

MergeEngine::MergeEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<RevisionManager> revisions)
    : repository_(std::move(repository)), revisions_(std::move(revisions)) {
}

MergePlan MergeEngine::Plan(db::Transaction& tx, std::int64_t from_module_id, std::int64_t to_module_id) {
  auto& repo = *repository_;

  MergePlan plan;
  plan.from = history::RequireModule(repo, tx, from_module_id);
  plan.to   = history::RequireModule(repo, tx, to_module_id);

  for (const auto& source : history::ModuleHeads(repo, tx, plan.from.id)) {
    MergeStep step;
    step.source        = source;
    step.source_commit = history::RequireCommit(repo, tx, source.commit_id);

    auto branch = repo.GetBranch(tx, source.branch_id);
    if (!branch) throw util::NotFound("branch " + std::to_string(source.branch_id) + " not found");
    step.branch = *branch;

    step.target = history::FindHead(repo, tx, plan.to.id, source.branch_id);
    if (!step.target) {
      step.strategy = MergeStrategy::kCopy;
      plan.steps.push_back(std::move(step));
      continue;
    }
    step.target_commit = history::RequireCommit(repo, tx, step.target->commit_id);

    if (step.target->content_hash == source.content_hash) {
      step.strategy = MergeStrategy::kNoop;
    } else if (auto path = history::AncestryPath(repo, tx, step.target_commit->id, step.source_commit.id)) {
      step.strategy = MergeStrategy::kFastForward;
      step.path     = std::move(*path);
    } else if (history::IsAncestor(repo, tx, step.source_commit.id, step.target_commit->id)) {
      step.strategy = MergeStrategy::kAlreadyMerged;
    } else {
      step.strategy = MergeStrategy::kThreeWay;
    }
    plan.steps.push_back(std::move(step));
  }
  return plan;
}

MergeSummary MergeEngine::Apply(db::Transaction& tx, const MergePlan& plan, std::int64_t actor,
                                const std::optional<util::Content>& resolved) {
  auto& repo = *repository_;

  MergeSummary summary;
  for (const auto& step : plan.steps) {
    switch (step.strategy) {
      case MergeStrategy::kNoop:
        ++summary.unchanged;
        break;

      case MergeStrategy::kAlreadyMerged:
        ++summary.skipped;
        break;

      case MergeStrategy::kCopy: {
        WriteCommitArgs args;
        args.module_id = plan.to.id;
        args.content   = util::ParseContent(step.source.content);
        args.message   = "Copy from " + plan.from.slug;
        args.actor     = actor;
        args.parent    = step.source_commit;
        auto commit    = revisions_->WriteCommit(tx, args);
        auto version   = revisions_->AdvanceHead(tx, plan.to.id, step.branch.id, commit.id,
                                                 HeadContent{step.source.content, step.source.content_hash,
                                                             step.source.title, step.source.description});
        summary.commit_ids.push_back(commit.id);
        summary.version_ids.push_back(version.id);
        ++summary.copied;
        break;
      }

      case MergeStrategy::kFastForward: {
        // adopt every commit the source materialized on the way
        for (auto commit_id : step.path) {
          db::VersionFilter filter;
          filter.module_id = plan.from.id;
          filter.branch_id = step.branch.id;
          filter.commit_id = commit_id;
          auto versions = repo.ListVersions(tx, filter);
          if (versions.empty()) continue;

          const auto& source = versions.back();
          auto version = revisions_->AdvanceHead(tx, plan.to.id, step.branch.id, commit_id,
                                                 HeadContent{source.content, source.content_hash, source.title,
                                                             source.description});
          summary.version_ids.push_back(version.id);
        }
        ++summary.fast_forwarded;
        break;
      }

      case MergeStrategy::kThreeWay: {
        const auto& target_commit = *step.target_commit;
        if (!resolved && step.source_commit.committed_at_ms < target_commit.committed_at_ms) {
          ++summary.skipped;
          break;
        }

        WriteCommitArgs args;
        args.module_id     = plan.to.id;
        args.content       = resolved ? *resolved : util::ParseContent(step.source.content);
        args.message       = "Merge " + plan.from.slug + " into " + plan.to.slug;
        args.actor         = actor;
        args.parent        = target_commit;
        args.extra_parents = {step.source_commit.id};
        auto commit        = revisions_->WriteCommit(tx, args);

        auto head = resolved ? MakeHeadContent(*resolved, step.target->title, step.target->description)
                             : HeadContent{step.source.content, step.source.content_hash, step.source.title,
                                           step.source.description};
        auto version = revisions_->AdvanceHead(tx, plan.to.id, step.branch.id, commit.id, head);
        summary.commit_ids.push_back(commit.id);
        summary.version_ids.push_back(version.id);
        ++summary.merged;
        break;
      }
    }
  }

  ACTIVITY_LOG_INFO("merge applied", {StringField("from", plan.from.slug), StringField("to", plan.to.slug),
                                      IntField("copied", static_cast<std::int64_t>(summary.copied)),
                                      IntField("fast_forwarded", static_cast<std::int64_t>(summary.fast_forwarded)),
                                      IntField("merged", static_cast<std::int64_t>(summary.merged))});
  return summary;
}

} // namespace activity::core
