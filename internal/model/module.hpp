#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace activity::model {

enum class ModuleType : std::uint8_t {
  kPage       = 1,
  kWhiteboard = 2,
  kAssignment = 3,
  kQuiz       = 4,
  kDiscussion = 5,
};

enum class ModuleStatus : std::uint8_t {
  kDraft     = 1,
  kPublished = 2,
  kArchived  = 3,
};

std::string_view ToString(ModuleType type);
std::string_view ToString(ModuleStatus status);

std::optional<ModuleType>   ParseModuleType(std::string_view value);
std::optional<ModuleStatus> ParseModuleStatus(std::string_view value);

} // namespace activity::model
