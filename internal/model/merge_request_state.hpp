#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace activity::model {

enum class MergeRequestStatus : std::uint8_t {
  kOpen     = 1,
  kMerged   = 2,
  kRejected = 3,
  kClosed   = 4,
};

constexpr bool IsTerminal(MergeRequestStatus status) {
  return status != MergeRequestStatus::kOpen;
}

// open -> merged | rejected | closed. Nothing leaves a terminal state.
constexpr bool CanTransition(MergeRequestStatus from, MergeRequestStatus to) {
  return from == MergeRequestStatus::kOpen && IsTerminal(to);
}

std::string_view                  ToString(MergeRequestStatus status);
std::optional<MergeRequestStatus> ParseMergeRequestStatus(std::string_view value);

} // namespace activity::model
