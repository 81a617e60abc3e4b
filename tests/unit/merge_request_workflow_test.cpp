#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/util/content.hpp"

namespace {

using activity::core::ErrorKind;
using activity::model::MergeRequestStatus;

constexpr std::int64_t kAuthor   = 21;
constexpr std::int64_t kReviewer = 22;

struct Fixture {
  activity::factory::RuntimeDependencies deps;
  activity::db::model::ModuleRecord      root;
  activity::db::model::ModuleRecord      fork;
};

Fixture BuildFixture() {
  activity::runtime::config::RuntimeConfig config;
  Fixture fx{activity::factory::BuildRuntime(config, std::make_shared<activity::db::memory::MemoryRepository>()), {}, {}};

  activity::core::CreateModuleArgs create;
  create.slug    = "lesson";
  create.title   = "Lesson";
  create.content = activity::util::ParseContent(R"({"body":"v1"})");
  create.actor   = kAuthor;
  auto created = fx.deps.revisions->CreateModule(create);
  assert(created.ok());
  fx.root = created.value().module;

  activity::core::ForkModuleArgs fork;
  fork.source_slug = "lesson";
  fork.new_slug    = "lesson-draft";
  fork.actor       = kReviewer;
  auto forked = fx.deps.branches->ForkModule(fork);
  assert(forked.ok());
  fx.fork = forked.value().module;
  return fx;
}

void Update(Fixture& fx, const std::string& slug, const std::string& json) {
  std::this_thread::sleep_for(std::chrono::milliseconds(5));
  activity::core::UpdateModuleArgs update;
  update.content = activity::util::ParseContent(json);
  update.actor   = kAuthor;
  assert(fx.deps.revisions->UpdateModule(slug, update).ok());
}

activity::core::CreateMergeRequestArgs RequestArgs(std::int64_t from, std::int64_t to) {
  activity::core::CreateMergeRequestArgs args;
  args.title          = "Bring draft back";
  args.description    = "edits from review";
  args.from_module_id = from;
  args.to_module_id   = to;
  args.actor          = kAuthor;
  return args;
}

std::string HeadContent(Fixture& fx, const std::string& slug) {
  activity::core::GetModuleArgs get;
  get.slug = slug;
  auto snapshot = fx.deps.revisions->GetModule(get);
  assert(snapshot.ok());
  return snapshot.value().version.content;
}

void TestCreateValidation() {
  auto fx = BuildFixture();

  assert(fx.deps.merge_requests->Create(RequestArgs(fx.root.id, fx.root.id)).kind() == ErrorKind::kInvalidArgument);
  assert(fx.deps.merge_requests->Create(RequestArgs(fx.fork.id, 999)).kind() == ErrorKind::kNotFound);

  auto untitled  = RequestArgs(fx.fork.id, fx.root.id);
  untitled.title = "";
  assert(fx.deps.merge_requests->Create(untitled).kind() == ErrorKind::kInvalidArgument);

  activity::core::CreateModuleArgs other;
  other.slug    = "unrelated";
  other.title   = "Unrelated";
  other.content = activity::util::ParseContent("{}");
  other.actor   = kAuthor;
  auto unrelated = fx.deps.revisions->CreateModule(other);
  assert(unrelated.ok());
  assert(fx.deps.merge_requests->Create(RequestArgs(unrelated.value().module.id, fx.root.id)).kind() ==
         ErrorKind::kInvalidArgument);

  auto opened = fx.deps.merge_requests->Create(RequestArgs(fx.fork.id, fx.root.id));
  assert(opened.ok());
  assert(opened.value().status == MergeRequestStatus::kOpen);
  assert(opened.value().allow_comments);
  assert(opened.value().created_by == kAuthor);

  assert(fx.deps.merge_requests->Create(RequestArgs(fx.fork.id, fx.root.id)).kind() == ErrorKind::kDuplicateRequest);

  // the reverse direction is a different pair
  assert(fx.deps.merge_requests->Create(RequestArgs(fx.root.id, fx.fork.id)).ok());

  // a finished request frees the pair
  assert(fx.deps.merge_requests->Close(opened.value().id, kReviewer).ok());
  assert(fx.deps.merge_requests->Create(RequestArgs(fx.fork.id, fx.root.id)).ok());
}

void TestCommentsAndStopComments() {
  auto fx      = BuildFixture();
  auto request = fx.deps.merge_requests->Create(RequestArgs(fx.fork.id, fx.root.id));
  assert(request.ok());
  const auto id = request.value().id;

  auto first = fx.deps.merge_requests->Comment(id, "looks good", kReviewer);
  assert(first.ok());
  assert(first.value().merge_request_id == id);
  assert(fx.deps.merge_requests->Comment(id, "", kReviewer).kind() == ErrorKind::kInvalidArgument);
  assert(fx.deps.merge_requests->Comment(999, "hello", kReviewer).kind() == ErrorKind::kNotFound);

  auto rejected = fx.deps.merge_requests->Reject(id, kReviewer, std::string("not yet"), true);
  assert(rejected.ok());
  assert(rejected.value().status == MergeRequestStatus::kRejected);
  assert(rejected.value().rejected_by == kReviewer);
  assert(rejected.value().rejected_at_ms);
  assert(rejected.value().reason == "not yet");
  assert(!rejected.value().allow_comments);

  assert(fx.deps.merge_requests->Comment(id, "but why", kAuthor).kind() == ErrorKind::kCommentsDisabled);

  auto comments = fx.deps.merge_requests->ListComments(id);
  assert(comments.ok());
  assert(comments.value().size() == 1);
  assert(comments.value()[0].text == "looks good");
}

void TestCommentsStayOpenAfterCloseWithoutStop() {
  auto fx      = BuildFixture();
  auto request = fx.deps.merge_requests->Create(RequestArgs(fx.fork.id, fx.root.id));
  assert(request.ok());

  auto closed = fx.deps.merge_requests->Close(request.value().id, kReviewer);
  assert(closed.ok());
  assert(closed.value().status == MergeRequestStatus::kClosed);
  assert(closed.value().closed_by == kReviewer);
  assert(closed.value().allow_comments);
  assert(fx.deps.merge_requests->Comment(request.value().id, "follow-up", kAuthor).ok());
}

void TestTerminalStatesAreFinal() {
  auto fx      = BuildFixture();
  auto request = fx.deps.merge_requests->Create(RequestArgs(fx.fork.id, fx.root.id));
  assert(request.ok());
  const auto id = request.value().id;

  assert(fx.deps.merge_requests->Close(id, kReviewer).ok());
  assert(fx.deps.merge_requests->Close(id, kReviewer).kind() == ErrorKind::kInvalidOperation);
  assert(fx.deps.merge_requests->Reject(id, kReviewer).kind() == ErrorKind::kInvalidOperation);
  assert(fx.deps.merge_requests->Accept(id, kReviewer).kind() == ErrorKind::kInvalidOperation);

  auto current = fx.deps.merge_requests->GetById(id);
  assert(current.ok());
  assert(current.value().status == MergeRequestStatus::kClosed);
}

void TestAcceptFastForward() {
  auto fx = BuildFixture();
  Update(fx, "lesson-draft", R"({"body":"v2"})");
  Update(fx, "lesson-draft", R"({"body":"v3"})");

  auto request = fx.deps.merge_requests->Create(RequestArgs(fx.fork.id, fx.root.id));
  assert(request.ok());

  auto accepted = fx.deps.merge_requests->Accept(request.value().id, kReviewer, std::string("ship it"));
  assert(accepted.ok());
  assert(accepted.value().request.status == MergeRequestStatus::kMerged);
  assert(accepted.value().request.merged_by == kReviewer);
  assert(accepted.value().request.merged_at_ms);
  assert(accepted.value().request.reason == "ship it");
  assert(accepted.value().summary.fast_forwarded == 1);
  assert(HeadContent(fx, "lesson") == R"({"body":"v3"})");

  auto history = fx.deps.revisions->GetHistory("lesson", std::nullopt);
  assert(history.ok());
  assert(history.value().size() == 3);

  assert(fx.deps.merge_requests->Accept(request.value().id, kReviewer).kind() == ErrorKind::kInvalidOperation);
}

void TestDivergedAcceptNeedsResolution() {
  auto fx = BuildFixture();
  Update(fx, "lesson", R"({"body":"root edit"})");
  Update(fx, "lesson-draft", R"({"body":"draft edit"})");

  auto request = fx.deps.merge_requests->Create(RequestArgs(fx.fork.id, fx.root.id));
  assert(request.ok());
  const auto id = request.value().id;

  auto refused = fx.deps.merge_requests->Accept(id, kReviewer);
  assert(refused.kind() == ErrorKind::kConflictResolutionRequired);

  auto still_open = fx.deps.merge_requests->GetById(id);
  assert(still_open.ok());
  assert(still_open.value().status == MergeRequestStatus::kOpen);
  assert(HeadContent(fx, "lesson") == R"({"body":"root edit"})");

  auto resolved = activity::util::ParseContent(R"({"body":"root edit + draft edit"})");
  auto accepted = fx.deps.merge_requests->Accept(id, kReviewer, std::nullopt, resolved);
  assert(accepted.ok());
  assert(accepted.value().summary.merged == 1);
  assert(accepted.value().request.status == MergeRequestStatus::kMerged);
  assert(HeadContent(fx, "lesson") == R"({"body":"root edit + draft edit"})");
}

void TestListAndDelete() {
  auto fx     = BuildFixture();
  auto first  = fx.deps.merge_requests->Create(RequestArgs(fx.fork.id, fx.root.id));
  std::this_thread::sleep_for(std::chrono::milliseconds(5));
  auto second = fx.deps.merge_requests->Create(RequestArgs(fx.root.id, fx.fork.id));
  assert(first.ok() && second.ok());
  assert(fx.deps.merge_requests->Close(first.value().id, kReviewer).ok());
  assert(fx.deps.merge_requests->Comment(first.value().id, "note", kReviewer).ok());

  auto all = fx.deps.merge_requests->ListByModule(fx.root.id);
  assert(all.ok());
  assert(all.value().size() == 2);
  assert(all.value()[0].id == second.value().id);

  auto open = fx.deps.merge_requests->ListByModule(fx.root.id, MergeRequestStatus::kOpen);
  assert(open.ok());
  assert(open.value().size() == 1);
  assert(open.value()[0].id == second.value().id);

  assert(fx.deps.merge_requests->Delete(first.value().id, 0).kind() == ErrorKind::kInvalidArgument);
  auto deleted = fx.deps.merge_requests->Delete(first.value().id, kReviewer);
  assert(deleted.ok());
  assert(fx.deps.merge_requests->GetById(first.value().id).kind() == ErrorKind::kNotFound);
  assert(fx.deps.merge_requests->ListComments(first.value().id).kind() == ErrorKind::kNotFound);

  {
    auto tx = fx.deps.repository->Begin(activity::db::TransactionMode::kReadOnly);
    assert(fx.deps.repository->ListComments(*tx, first.value().id).empty());
    tx->Commit();
  }

  assert(fx.deps.merge_requests->Delete(first.value().id, kReviewer).kind() == ErrorKind::kNotFound);
}

} // namespace

int main() {
  TestCreateValidation();
  TestCommentsAndStopComments();
  TestCommentsStayOpenAfterCloseWithoutStop();
  TestTerminalStatesAreFinal();
  TestAcceptFastForward();
  TestDivergedAcceptNeedsResolution();
  TestListAndDelete();

  std::cout << "activity_history_unit_merge_request_workflow: pass\n";
  return 0;
}
