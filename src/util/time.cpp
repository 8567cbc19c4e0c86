// VALSET - Time Utilities Implementation
// Copyright (c) 2024 VALSET Developers
// MIT License

#include <valset/util/time.h>

#include <atomic>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace valset {
namespace util {

// ============================================================================
// Mock Time State
// ============================================================================

namespace {
    std::atomic<bool> g_mockTimeEnabled{false};
    std::atomic<int64_t> g_mockTime{0};
    std::mutex g_mockTimeMutex;

    int64_t WallClockSeconds() {
        return std::chrono::duration_cast<Seconds>(
            SystemClock::now().time_since_epoch()).count();
    }
}

// ============================================================================
// Unix Timestamps
// ============================================================================

int64_t GetTime() {
    if (g_mockTimeEnabled.load()) {
        return g_mockTime.load();
    }
    return WallClockSeconds();
}

SystemTimePoint GetSystemTime() {
    if (g_mockTimeEnabled.load()) {
        return FromUnixTime(g_mockTime.load());
    }
    return SystemClock::now();
}

SystemTimePoint FromUnixTime(int64_t timestamp) {
    return SystemTimePoint{Seconds{timestamp}};
}

// ============================================================================
// Time Formatting
// ============================================================================

std::string FormatLog(SystemTimePoint tp) {
    auto time = SystemClock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<Milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm tm_buf;
    localtime_r(&time, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

// ============================================================================
// Mock Time
// ============================================================================

void DisableMockTime() {
    std::lock_guard<std::mutex> lock(g_mockTimeMutex);
    g_mockTimeEnabled.store(false);
    g_mockTime.store(0);
}

bool IsMockTimeEnabled() {
    return g_mockTimeEnabled.load();
}

void SetMockTime(int64_t timestamp) {
    std::lock_guard<std::mutex> lock(g_mockTimeMutex);
    g_mockTime.store(timestamp);
    g_mockTimeEnabled.store(true);
}

void AdvanceMockTime(Seconds duration) {
    g_mockTime.fetch_add(duration.count());
}

int64_t GetMockTime() {
    return g_mockTime.load();
}

} // namespace util
} // namespace valset
