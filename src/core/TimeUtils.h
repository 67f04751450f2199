#pragma once

#include <chrono>
#include <cstdint>

namespace core {

namespace TimeUtils {
constexpr std::int64_t kMillisPerSecond = 1000;
constexpr std::int64_t kSecondsPerMinute = 60;
constexpr std::int64_t kMillisPerMinute = kMillisPerSecond * kSecondsPerMinute;
constexpr std::int64_t kMinutesPerDay = 24 * 60;
constexpr std::int64_t kMillisPerDay = kMillisPerMinute * kMinutesPerDay;
}  // namespace TimeUtils

inline std::int64_t nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

}  // namespace core

namespace domain {
inline std::int64_t minutesToMillis(std::int64_t m) { return m * core::TimeUtils::kMillisPerMinute; }
inline std::int64_t floorToBucketMs(std::int64_t ms, std::int64_t bucketMs) {
    const auto rem = ms % bucketMs;
    return rem < 0 ? ms - rem - bucketMs : ms - rem;
}
// Day index since the epoch, UTC.
inline std::int64_t utcDay(std::int64_t ms) {
    return floorToBucketMs(ms, core::TimeUtils::kMillisPerDay) / core::TimeUtils::kMillisPerDay;
}
inline std::int64_t utcMinuteOfDay(std::int64_t ms) {
    return (ms - floorToBucketMs(ms, core::TimeUtils::kMillisPerDay)) / core::TimeUtils::kMillisPerMinute;
}
}  // namespace domain
