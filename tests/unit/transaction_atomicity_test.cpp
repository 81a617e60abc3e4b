#include <cassert>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "internal/core/history_queries.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/util/content.hpp"
#include "tests/unit/fault_injecting_repository.hpp"

namespace {

using activity::core::ErrorKind;
using activity::testing::FaultInjectingRepository;

constexpr std::int64_t kAuthor   = 31;
constexpr std::int64_t kReviewer = 32;

struct StoreCounts {
  std::uint64_t commits  = 0;
  std::size_t   versions = 0;
};

StoreCounts Count(activity::db::Repository& repo) {
  auto        tx = repo.Begin(activity::db::TransactionMode::kReadOnly);
  StoreCounts counts;
  counts.commits  = repo.CountCommits(*tx);
  counts.versions = repo.ListVersions(*tx, activity::db::VersionFilter{}).size();
  tx->Commit();
  return counts;
}

void TestFailedAcceptLeavesNoTrace() {
  auto faulty = std::make_shared<FaultInjectingRepository>(std::make_shared<activity::db::memory::MemoryRepository>());
  activity::runtime::config::RuntimeConfig config;
  auto deps = activity::factory::BuildRuntime(config, faulty);

  // "review" exists before the module, so only the root gets a head there
  activity::core::CreateBranchArgs review;
  review.name  = "review";
  review.actor = kAuthor;
  assert(deps.branches->CreateBranch(review).ok());

  activity::core::CreateModuleArgs create;
  create.slug    = "root";
  create.title   = "Root";
  create.content = activity::util::ParseContent(R"({"body":"v1"})");
  create.actor   = kAuthor;
  auto root = deps.revisions->CreateModule(create);
  assert(root.ok());

  activity::core::ForkModuleArgs fork;
  fork.source_slug = "root";
  fork.new_slug    = "target";
  fork.actor       = kReviewer;
  auto target = deps.branches->ForkModule(fork);
  assert(target.ok());

  activity::core::UpdateModuleArgs on_main;
  on_main.content = activity::util::ParseContent(R"({"body":"v2"})");
  on_main.actor   = kAuthor;
  assert(deps.revisions->UpdateModule("root", on_main).ok());

  activity::core::UpdateModuleArgs on_review = on_main;
  on_review.content = activity::util::ParseContent(R"({"body":"review"})");
  on_review.branch  = "review";
  assert(deps.revisions->UpdateModule("root", on_review).ok());

  activity::core::CreateMergeRequestArgs request;
  request.title          = "Sync";
  request.from_module_id = root.value().module.id;
  request.to_module_id   = target.value().module.id;
  request.actor          = kAuthor;
  auto opened = deps.merge_requests->Create(request);
  assert(opened.ok());

  {
    auto tx   = deps.repository->Begin(activity::db::TransactionMode::kReadOnly);
    auto plan = deps.merge_engine->Plan(*tx, root.value().module.id, target.value().module.id);
    tx->Commit();
    assert(plan.steps.size() == 2);
    assert(plan.steps[0].strategy == activity::core::MergeStrategy::kFastForward);
    assert(plan.steps[1].strategy == activity::core::MergeStrategy::kCopy);
  }

  const auto before = Count(*faulty);

  // the fast-forward lands, the copy's version insert fails
  faulty->FailVersionInsertsAfter(1);
  auto failed = deps.merge_requests->Accept(opened.value().id, kReviewer);
  assert(!failed.ok());
  assert(failed.kind() == ErrorKind::kUnknown);

  const auto after = Count(*faulty);
  assert(after.commits == before.commits);
  assert(after.versions == before.versions);

  auto still_open = deps.merge_requests->GetById(opened.value().id);
  assert(still_open.ok());
  assert(still_open.value().status == activity::model::MergeRequestStatus::kOpen);

  activity::core::GetModuleArgs get;
  get.slug  = "target";
  auto head = deps.revisions->GetModule(get);
  assert(head.ok());
  assert(head.value().version.content == R"({"body":"v1"})");

  get.branch = "review";
  assert(deps.revisions->GetModule(get).kind() == ErrorKind::kNotFound);

  // with the fault cleared the same request goes through
  faulty->FailVersionInsertsAfter(std::nullopt);
  auto accepted = deps.merge_requests->Accept(opened.value().id, kReviewer);
  assert(accepted.ok());
  assert(accepted.value().summary.fast_forwarded == 1);
  assert(accepted.value().summary.copied == 1);

  const auto merged = Count(*faulty);
  assert(merged.commits == before.commits + 1);
  assert(merged.versions == before.versions + 2);
  assert(deps.revisions->GetModule(get).ok());
}

void TestFailedUpdateKeepsPreviousHead() {
  auto faulty = std::make_shared<FaultInjectingRepository>(std::make_shared<activity::db::memory::MemoryRepository>());
  activity::runtime::config::RuntimeConfig config;
  auto deps = activity::factory::BuildRuntime(config, faulty);

  activity::core::CreateModuleArgs create;
  create.slug    = "solo";
  create.title   = "Solo";
  create.content = activity::util::ParseContent(R"({"body":"v1"})");
  create.actor   = kAuthor;
  auto created = deps.revisions->CreateModule(create);
  assert(created.ok());

  const auto before = Count(*faulty);

  faulty->FailVersionInsertsAfter(0);
  activity::core::UpdateModuleArgs update;
  update.content = activity::util::ParseContent(R"({"body":"v2"})");
  update.actor   = kAuthor;
  assert(!deps.revisions->UpdateModule("solo", update).ok());
  faulty->FailVersionInsertsAfter(std::nullopt);

  const auto after = Count(*faulty);
  assert(after.commits == before.commits);
  assert(after.versions == before.versions);

  activity::core::GetModuleArgs get;
  get.slug  = "solo";
  auto head = deps.revisions->GetModule(get);
  assert(head.ok());
  assert(head.value().version.id == created.value().version.id);
  assert(head.value().version.is_current_head);
}

void CreatePlainModule(activity::factory::RuntimeDependencies& deps, const std::string& slug) {
  activity::core::CreateModuleArgs create;
  create.slug    = slug;
  create.title   = "Module " + slug;
  create.content = activity::util::ParseContent(R"({"body":")" + slug + R"("})");
  create.actor   = kAuthor;
  assert(deps.revisions->CreateModule(create).ok());
}

void TestFailedCreateBranchLeavesNoBranch() {
  auto faulty = std::make_shared<FaultInjectingRepository>(std::make_shared<activity::db::memory::MemoryRepository>());
  activity::runtime::config::RuntimeConfig config;
  auto deps = activity::factory::BuildRuntime(config, faulty);

  CreatePlainModule(deps, "alpha");
  CreatePlainModule(deps, "beta");
  const auto before = Count(*faulty);

  // the first head copy lands, the second fails
  faulty->FailVersionInsertsAfter(1);
  activity::core::CreateBranchArgs review;
  review.name  = "review";
  review.actor = kAuthor;
  auto failed = deps.branches->CreateBranch(review);
  assert(!failed.ok());
  assert(failed.kind() == ErrorKind::kUnknown);
  faulty->FailVersionInsertsAfter(std::nullopt);

  assert(deps.branches->GetBranchByName("review").kind() == ErrorKind::kNotFound);
  const auto after = Count(*faulty);
  assert(after.commits == before.commits);
  assert(after.versions == before.versions);

  auto created = deps.branches->CreateBranch(review);
  assert(created.ok());
  assert(created.value().copied_version_count == 2);
  assert(Count(*faulty).versions == before.versions + 2);
}

void TestFailedDeleteBranchKeepsBranch() {
  auto faulty = std::make_shared<FaultInjectingRepository>(std::make_shared<activity::db::memory::MemoryRepository>());
  activity::runtime::config::RuntimeConfig config;
  auto deps = activity::factory::BuildRuntime(config, faulty);

  CreatePlainModule(deps, "alpha");
  CreatePlainModule(deps, "beta");
  activity::core::CreateBranchArgs review;
  review.name  = "review";
  review.actor = kAuthor;
  auto created = deps.branches->CreateBranch(review);
  assert(created.ok());
  const auto before = Count(*faulty);

  faulty->FailVersionDeletesAfter(1);
  assert(deps.branches->DeleteBranch("review").kind() == ErrorKind::kUnknown);
  faulty->FailVersionDeletesAfter(std::nullopt);

  auto branch = deps.branches->GetBranchByName("review");
  assert(branch.ok());
  assert(branch.value().id == created.value().branch.id);
  assert(Count(*faulty).versions == before.versions);

  activity::core::GetModuleArgs get;
  get.slug   = "alpha";
  get.branch = "review";
  assert(deps.revisions->GetModule(get).ok());
  get.slug = "beta";
  assert(deps.revisions->GetModule(get).ok());
}

void TestFailedDeleteModuleKeepsModule() {
  auto faulty = std::make_shared<FaultInjectingRepository>(std::make_shared<activity::db::memory::MemoryRepository>());
  activity::runtime::config::RuntimeConfig config;
  auto deps = activity::factory::BuildRuntime(config, faulty);

  CreatePlainModule(deps, "alpha");
  activity::core::UpdateModuleArgs update;
  update.content = activity::util::ParseContent(R"({"body":"alpha v2"})");
  update.actor   = kAuthor;
  assert(deps.revisions->UpdateModule("alpha", update).ok());
  const auto before = Count(*faulty);
  assert(before.versions == 2);

  faulty->FailVersionDeletesAfter(1);
  assert(deps.revisions->DeleteModule("alpha").kind() == ErrorKind::kUnknown);
  faulty->FailVersionDeletesAfter(std::nullopt);

  assert(Count(*faulty).versions == before.versions);
  activity::core::GetModuleArgs get;
  get.slug  = "alpha";
  auto head = deps.revisions->GetModule(get);
  assert(head.ok());
  assert(head.value().version.content == R"({"body":"alpha v2"})");

  assert(deps.revisions->DeleteModule("alpha").ok());
  assert(deps.revisions->GetModule(get).kind() == ErrorKind::kNotFound);
  assert(Count(*faulty).versions == 0);
}

} // namespace

int main() {
  TestFailedAcceptLeavesNoTrace();
  TestFailedUpdateKeepsPreviousHead();
  TestFailedCreateBranchLeavesNoBranch();
  TestFailedDeleteBranchKeepsBranch();
  TestFailedDeleteModuleKeepsModule();

  std::cout << "activity_history_unit_transaction_atomicity: pass\n";
  return 0;
}
