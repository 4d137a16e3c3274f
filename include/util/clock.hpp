#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace updater {

using TimePoint = std::chrono::system_clock::time_point;
using Clock = std::function<TimePoint()>;

inline Clock SystemClock() {
    return [] { return std::chrono::system_clock::now(); };
}

inline std::int64_t ToUnixSeconds(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

inline TimePoint FromUnixSeconds(std::int64_t secs) {
    return TimePoint(std::chrono::seconds(secs));
}

} // namespace updater
