#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/util/content.hpp"

namespace activity::util {

/*
  Content-addressing helpers.

  SHA-256, lowercase hex. Used for change detection and integrity,
  not for security.
*/

std::string Sha256Hex(std::string_view data);

std::string ContentHash(const Content& content);

// Every field takes part in the digest; identical inputs (timestamp
// included) produce identical hashes.
std::string CommitHash(const Content& content, std::string_view message, std::int64_t author, uint64_t timestamp_ms,
                       const std::optional<std::string>& parent_hash = std::nullopt);

} // namespace activity::util
