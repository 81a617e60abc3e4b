#include "internal/model/merge_request_state.hpp"
#include "internal/model/module.hpp"

namespace activity::model {

std::string_view ToString(ModuleType type) {
  switch (type) {
    case ModuleType::kPage:
      return "page";
    case ModuleType::kWhiteboard:
      return "whiteboard";
    case ModuleType::kAssignment:
      return "assignment";
    case ModuleType::kQuiz:
      return "quiz";
    case ModuleType::kDiscussion:
      return "discussion";
  }
  return "unknown";
}

std::string_view ToString(ModuleStatus status) {
  switch (status) {
    case ModuleStatus::kDraft:
      return "draft";
    case ModuleStatus::kPublished:
      return "published";
    case ModuleStatus::kArchived:
      return "archived";
  }
  return "unknown";
}

std::string_view ToString(MergeRequestStatus status) {
  switch (status) {
    case MergeRequestStatus::kOpen:
      return "open";
    case MergeRequestStatus::kMerged:
      return "merged";
    case MergeRequestStatus::kRejected:
      return "rejected";
    case MergeRequestStatus::kClosed:
      return "closed";
  }
  return "unknown";
}

std::optional<ModuleType> ParseModuleType(std::string_view value) {
  if (value == "page") return ModuleType::kPage;
  if (value == "whiteboard") return ModuleType::kWhiteboard;
  if (value == "assignment") return ModuleType::kAssignment;
  if (value == "quiz") return ModuleType::kQuiz;
  if (value == "discussion") return ModuleType::kDiscussion;
  return std::nullopt;
}

std::optional<ModuleStatus> ParseModuleStatus(std::string_view value) {
  if (value == "draft") return ModuleStatus::kDraft;
  if (value == "published") return ModuleStatus::kPublished;
  if (value == "archived") return ModuleStatus::kArchived;
  return std::nullopt;
}

std::optional<MergeRequestStatus> ParseMergeRequestStatus(std::string_view value) {
  if (value == "open") return MergeRequestStatus::kOpen;
  if (value == "merged") return MergeRequestStatus::kMerged;
  if (value == "rejected") return MergeRequestStatus::kRejected;
  if (value == "closed") return MergeRequestStatus::kClosed;
  return std::nullopt;
}

} // namespace activity::model
