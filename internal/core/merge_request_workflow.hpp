#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/merge_engine.hpp"
#include "internal/core/outcome.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/content.hpp"

namespace activity::core {

struct CreateMergeRequestArgs {
  std::string  title;
  std::string  description;
  std::int64_t from_module_id = 0;
  std::int64_t to_module_id   = 0;
  std::int64_t actor          = 0;
};

struct AcceptResult {
  db::model::MergeRequestRecord request;
  MergeSummary                  summary;
};

/*
  MergeRequestWorkflow

  open -> merged | rejected | closed. Accepting runs the merge engine and
  stamps the request in the same transaction: either every step lands
  and the request is merged, or nothing changes.
*/
class MergeRequestWorkflow {
 public:
  MergeRequestWorkflow(std::shared_ptr<db::Repository> repository, std::shared_ptr<MergeEngine> engine);

  Outcome<db::model::MergeRequestRecord> Create(const CreateMergeRequestArgs& args);

  Outcome<db::model::MergeRequestCommentRecord> Comment(std::int64_t id, const std::string& text, std::int64_t actor);

  Outcome<std::vector<db::model::MergeRequestCommentRecord>> ListComments(std::int64_t id);

  // One resolved document is applied to every three-way step.
  Outcome<AcceptResult> Accept(std::int64_t id, std::int64_t actor, const std::optional<std::string>& reason = std::nullopt,
                               const std::optional<util::Content>& resolved_content = std::nullopt);

  Outcome<db::model::MergeRequestRecord> Reject(std::int64_t id, std::int64_t actor,
                                                const std::optional<std::string>& reason = std::nullopt,
                                                bool stop_comments = false);

  Outcome<db::model::MergeRequestRecord> Close(std::int64_t id, std::int64_t actor,
                                               const std::optional<std::string>& reason = std::nullopt,
                                               bool stop_comments = false);

  Outcome<db::model::MergeRequestRecord> GetById(std::int64_t id);

  // Requests where the module is either endpoint, newest first.
  Outcome<std::vector<db::model::MergeRequestRecord>> ListByModule(
      std::int64_t module_id, std::optional<activity::model::MergeRequestStatus> status = std::nullopt);

  // Deletes the comments, then the request.
  Outcome<db::model::MergeRequestRecord> Delete(std::int64_t id, std::int64_t actor);

 private:
  db::model::MergeRequestRecord RequireRequest(db::Transaction& tx, std::int64_t id);

  Outcome<db::model::MergeRequestRecord> Finish(std::int64_t id, std::int64_t actor,
                                                activity::model::MergeRequestStatus status,
                                                const std::optional<std::string>& reason, bool stop_comments);

  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<MergeEngine>    engine_;
};

} // namespace activity::core
