// VALSET - Time Utilities
// Copyright (c) 2024 VALSET Developers
// MIT License
//
// Wall-clock access for the managers. Every timestamp a manager records
// (validator start/end, churn window, registration expiry) comes from
// GetTime(), so tests can pin or advance it with the mock-time controls.

#ifndef VALSET_UTIL_TIME_H
#define VALSET_UTIL_TIME_H

#include <chrono>
#include <cstdint>
#include <string>

namespace valset {
namespace util {

using Seconds = std::chrono::seconds;
using Milliseconds = std::chrono::milliseconds;
using SystemClock = std::chrono::system_clock;
using SystemTimePoint = std::chrono::system_clock::time_point;

// ============================================================================
// Unix Timestamps
// ============================================================================

/// Get current Unix timestamp in seconds (mock time when enabled)
int64_t GetTime();

/// Current time as a time point; follows mock time like GetTime()
SystemTimePoint GetSystemTime();

SystemTimePoint FromUnixTime(int64_t timestamp);

// ============================================================================
// Time Formatting
// ============================================================================

/// Format time point for logging (e.g., "2024-01-15 10:30:00.123")
std::string FormatLog(SystemTimePoint tp);

// ============================================================================
// Mock Time (for testing)
// ============================================================================

void DisableMockTime();

bool IsMockTimeEnabled();

/// Set the mocked Unix timestamp and turn mock time on
void SetMockTime(int64_t timestamp);

void AdvanceMockTime(Seconds duration);

int64_t GetMockTime();

} // namespace util
} // namespace valset

#endif // VALSET_UTIL_TIME_H
