#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <utility>

#include "artistore/result.hpp"
#include "artistore/server/clock.hpp"
#include "artistore/server/upload_session.hpp"

namespace artistore::server
{

    class SessionStore;

    // Rolling (time, bytes) samples over a fixed span.
    class ThroughputWindow
    {
    public:
        explicit ThroughputWindow(std::chrono::seconds span = std::chrono::seconds{30});

        void add(TimePoint at, std::uint64_t bytes);

        // Bytes per second across the retained samples, 0 when none remain.
        double bytes_per_second(TimePoint now);

        bool empty() const noexcept { return samples_.empty(); }

    private:
        void prune(TimePoint now);

        std::chrono::seconds span_;
        std::deque<std::pair<TimePoint, std::uint64_t>> samples_;
    };

    struct UploadProgress
    {
        std::uint64_t bytes_received{};
        std::uint64_t bytes_remaining{};
        std::uint64_t chunks_received{};
        std::uint64_t total_chunks{};
        double percent_complete{};
        std::optional<double> eta_seconds{};
        double speed_mbps{};
    };

    UploadProgress compute_progress(const UploadSession &session, ThroughputWindow &window, TimePoint now);

    class ProgressTracker
    {
    public:
        ProgressTracker(SessionStore &store, Clock clock);

        Result<UploadProgress> progress(const std::string &session_id) const;

    private:
        SessionStore &store_;
        Clock clock_;
    };

} // namespace artistore::server
