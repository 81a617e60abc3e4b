#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace activity::util {

/*
  Clock access for the whole engine.

  Persistent timestamps are unix epoch milliseconds.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

uint64_t NowMillis();

// RFC 3339 UTC with millisecond precision, e.g. 2024-05-01T10:00:00.123Z
std::string ToIso8601(uint64_t unix_ms);

} // namespace activity::util
