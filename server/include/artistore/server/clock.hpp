#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace artistore::server
{

    using TimePoint = std::chrono::system_clock::time_point;

    // Injected wherever expiry or throughput depends on wall time.
    using Clock = std::function<TimePoint()>;

    inline Clock system_clock()
    {
        return []
        { return std::chrono::system_clock::now(); };
    }

    inline std::int64_t to_unix_seconds(TimePoint time)
    {
        return std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
    }

    inline TimePoint from_unix_seconds(std::int64_t seconds)
    {
        return TimePoint{std::chrono::seconds{seconds}};
    }

} // namespace artistore::server
