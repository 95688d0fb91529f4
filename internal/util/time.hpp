#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace causal::util {

// Event timestamps are wall-clock milliseconds since the Unix epoch.

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);
uint64_t NowMillis();

// ISO-8601 UTC, millisecond precision ("2024-01-31T12:00:00.000Z").
std::string FormatIso8601(TimePoint tp);

} // namespace causal::util
