#include "merge_request_workflow.hpp"

#include "internal/core/error_mapping.hpp"
#include "internal/core/history_queries.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace activity::core {

using activity::model::MergeRequestStatus;
using observability::IntField;
using observability::StringField;

namespace {

void RequireOpen(const db::model::MergeRequestRecord& request, MergeRequestStatus next) {
  if (!activity::model::CanTransition(request.status, next)) {
    throw util::InvalidOperation("merge request " + std::to_string(request.id) + " is " +
                                 std::string(activity::model::ToString(request.status)) + ", cannot move to " +
                                 std::string(activity::model::ToString(next)));
  }
}

} // namespace

MergeRequestWorkflow::MergeRequestWorkflow(std::shared_ptr<db::Repository> repository, std::shared_ptr<MergeEngine> engine)
    : repository_(std::move(repository)), engine_(std::move(engine)) {
}

db::model::MergeRequestRecord MergeRequestWorkflow::RequireRequest(db::Transaction& tx, std::int64_t id) {
  auto request = repository_->GetMergeRequest(tx, id);
  if (!request) throw util::NotFound("merge request " + std::to_string(id) + " not found");
  return *request;
}

Outcome<db::model::MergeRequestRecord> MergeRequestWorkflow::Create(const CreateMergeRequestArgs& args) {
  return Guard("create_merge_request", [&] {
    if (args.title.empty()) throw util::InvalidArgument("merge request: title is required");
    if (args.actor == 0) throw util::InvalidArgument("merge request: actor is required");
    if (args.from_module_id == args.to_module_id) {
      throw util::InvalidArgument("merge request: cannot merge a module into itself");
    }

    auto tx   = repository_->Begin();
    auto from = history::RequireModule(*repository_, *tx, args.from_module_id);
    auto to   = history::RequireModule(*repository_, *tx, args.to_module_id);
    if (db::model::LineageRoot(from) != db::model::LineageRoot(to)) {
      throw util::InvalidArgument("merge request: '" + from.slug + "' and '" + to.slug + "' do not share an origin");
    }

    db::MergeRequestFilter filter;
    filter.from_module_id = from.id;
    filter.to_module_id   = to.id;
    filter.status         = MergeRequestStatus::kOpen;
    if (!repository_->ListMergeRequests(*tx, filter).empty()) {
      throw util::DuplicateRequest("an open merge request from '" + from.slug + "' to '" + to.slug + "' already exists");
    }

    db::model::MergeRequestRecord request;
    request.title          = args.title;
    request.description    = args.description;
    request.from_module_id = from.id;
    request.to_module_id   = to.id;
    request.status         = MergeRequestStatus::kOpen;
    request.created_by     = args.actor;
    request.allow_comments = true;
    ThrowIfDbError(repository_->InsertMergeRequest(*tx, request), "create merge request");

    tx->Commit();
    ACTIVITY_LOG_INFO("merge request opened", {IntField("id", request.id), StringField("from", from.slug),
                                               StringField("to", to.slug)});
    return request;
  });
}

Outcome<db::model::MergeRequestCommentRecord> MergeRequestWorkflow::Comment(std::int64_t id, const std::string& text,
                                                                            std::int64_t actor) {
  return Guard("comment_merge_request", [&] {
    if (text.empty()) throw util::InvalidArgument("comment: text is required");
    if (actor == 0) throw util::InvalidArgument("comment: actor is required");

    auto tx      = repository_->Begin();
    auto request = RequireRequest(*tx, id);
    if (!request.allow_comments) {
      throw util::CommentsDisabled("comments are disabled on merge request " + std::to_string(id));
    }

    db::model::MergeRequestCommentRecord comment;
    comment.merge_request_id = id;
    comment.author           = actor;
    comment.text             = text;
    ThrowIfDbError(repository_->InsertComment(*tx, comment), "comment merge request");

    tx->Commit();
    return comment;
  });
}

Outcome<std::vector<db::model::MergeRequestCommentRecord>> MergeRequestWorkflow::ListComments(std::int64_t id) {
  return Guard("list_merge_request_comments", [&] {
    auto tx = repository_->Begin(db::TransactionMode::kReadOnly);
    RequireRequest(*tx, id);
    auto comments = repository_->ListComments(*tx, id);
    tx->Commit();
    return comments;
  });
}

Outcome<AcceptResult> MergeRequestWorkflow::Accept(std::int64_t id, std::int64_t actor, const std::optional<std::string>& reason,
                                                   const std::optional<util::Content>& resolved_content) {
  return Guard("accept_merge_request", [&] {
    if (actor == 0) throw util::InvalidArgument("accept: actor is required");

    auto tx      = repository_->Begin();
    auto request = RequireRequest(*tx, id);
    RequireOpen(request, MergeRequestStatus::kMerged);

    auto plan = engine_->Plan(*tx, request.from_module_id, request.to_module_id);
    if (plan.RequiresResolution() && !resolved_content) {
      throw util::ConflictResolutionRequired("merge request " + std::to_string(id) + ": '" + plan.from.slug + "' and '" +
                                             plan.to.slug + "' have diverged; resolved content is required");
    }

    AcceptResult result;
    result.summary = engine_->Apply(*tx, plan, actor, resolved_content);

    request.status       = MergeRequestStatus::kMerged;
    request.merged_by    = actor;
    request.merged_at_ms = util::NowMillis();
    if (reason) request.reason = *reason;
    ThrowIfDbError(repository_->UpdateMergeRequest(*tx, request), "accept merge request");
    result.request = request;

    tx->Commit();
    ACTIVITY_LOG_INFO("merge request merged", {IntField("id", id), StringField("from", plan.from.slug),
                                               StringField("to", plan.to.slug)});
    return result;
  });
}

Outcome<db::model::MergeRequestRecord> MergeRequestWorkflow::Finish(std::int64_t id, std::int64_t actor,
                                                                    MergeRequestStatus status,
                                                                    const std::optional<std::string>& reason,
                                                                    bool stop_comments) {
  return Guard(status == MergeRequestStatus::kRejected ? "reject_merge_request" : "close_merge_request", [&] {
    if (actor == 0) throw util::InvalidArgument("merge request: actor is required");

    auto tx      = repository_->Begin();
    auto request = RequireRequest(*tx, id);
    RequireOpen(request, status);

    const auto now = util::NowMillis();
    request.status = status;
    if (status == MergeRequestStatus::kRejected) {
      request.rejected_by    = actor;
      request.rejected_at_ms = now;
    } else {
      request.closed_by    = actor;
      request.closed_at_ms = now;
    }
    if (reason) request.reason = *reason;
    if (stop_comments) request.allow_comments = false;
    ThrowIfDbError(repository_->UpdateMergeRequest(*tx, request), "finish merge request");

    tx->Commit();
    ACTIVITY_LOG_INFO("merge request finished", {IntField("id", id),
                                                 StringField("status", activity::model::ToString(status))});
    return request;
  });
}

Outcome<db::model::MergeRequestRecord> MergeRequestWorkflow::Reject(std::int64_t id, std::int64_t actor,
                                                                    const std::optional<std::string>& reason,
                                                                    bool stop_comments) {
  return Finish(id, actor, MergeRequestStatus::kRejected, reason, stop_comments);
}

Outcome<db::model::MergeRequestRecord> MergeRequestWorkflow::Close(std::int64_t id, std::int64_t actor,
                                                                   const std::optional<std::string>& reason,
                                                                   bool stop_comments) {
  return Finish(id, actor, MergeRequestStatus::kClosed, reason, stop_comments);
}

Outcome<db::model::MergeRequestRecord> MergeRequestWorkflow::GetById(std::int64_t id) {
  return Guard("get_merge_request", [&] {
    auto tx      = repository_->Begin(db::TransactionMode::kReadOnly);
    auto request = RequireRequest(*tx, id);
    tx->Commit();
    return request;
  });
}

Outcome<std::vector<db::model::MergeRequestRecord>> MergeRequestWorkflow::ListByModule(
    std::int64_t module_id, std::optional<MergeRequestStatus> status) {
  return Guard("list_merge_requests", [&] {
    db::MergeRequestFilter filter;
    filter.module_id = module_id;
    filter.status    = status;

    auto tx       = repository_->Begin(db::TransactionMode::kReadOnly);
    auto requests = repository_->ListMergeRequests(*tx, filter, db::SortOrder::kNewestFirst);
    tx->Commit();
    return requests;
  });
}

Outcome<db::model::MergeRequestRecord> MergeRequestWorkflow::Delete(std::int64_t id, std::int64_t actor) {
  return Guard("delete_merge_request", [&] {
    if (actor == 0) throw util::InvalidArgument("delete merge request: actor is required");

    auto tx      = repository_->Begin();
    auto request = RequireRequest(*tx, id);
    ThrowIfDbError(repository_->DeleteComments(*tx, id), "delete merge request comments");
    ThrowIfDbError(repository_->DeleteMergeRequest(*tx, id), "delete merge request");

    tx->Commit();
    ACTIVITY_LOG_INFO("merge request deleted", {IntField("id", id), IntField("actor", actor)});
    return request;
  });
}

} // namespace activity::core
