#include "artistore/server/progress_tracker.hpp"

#include <algorithm>
#include <cmath>

#include "artistore/server/session_store.hpp"

namespace artistore::server
{

    namespace
    {
        constexpr double kBytesPerMegabyte = 1'000'000.0;
    } // namespace

    ThroughputWindow::ThroughputWindow(std::chrono::seconds span) : span_(span) {}

    void ThroughputWindow::add(TimePoint at, std::uint64_t bytes)
    {
        samples_.emplace_back(at, bytes);
        prune(at);
    }

    double ThroughputWindow::bytes_per_second(TimePoint now)
    {
        prune(now);
        if (samples_.empty())
        {
            return 0.0;
        }
        std::uint64_t total = 0;
        for (const auto &[at, bytes] : samples_)
        {
            total += bytes;
        }
        const auto elapsed = std::chrono::duration<double>(now - samples_.front().first).count();
        return static_cast<double>(total) / std::max(elapsed, 1.0);
    }

    void ThroughputWindow::prune(TimePoint now)
    {
        while (!samples_.empty() && now - samples_.front().first > span_)
        {
            samples_.pop_front();
        }
    }

    UploadProgress compute_progress(const UploadSession &session, ThroughputWindow &window, TimePoint now)
    {
        UploadProgress progress{};
        progress.bytes_received = session.bytes_received;
        progress.bytes_remaining = session.declared_total_size > session.bytes_received
                                       ? session.declared_total_size - session.bytes_received
                                       : 0;
        progress.chunks_received = session.received_chunks.size();
        progress.total_chunks = session.declared_total_chunks;

        if (session.declared_total_size > 0)
        {
            progress.percent_complete =
                static_cast<double>(session.bytes_received) / static_cast<double>(session.declared_total_size);
            // Rounding must not report completion early on very large objects.
            if (progress.bytes_remaining > 0 && progress.percent_complete >= 1.0)
            {
                progress.percent_complete = std::nextafter(1.0, 0.0);
            }
        }

        progress.speed_mbps = window.bytes_per_second(now) / kBytesPerMegabyte;
        if (progress.speed_mbps > 0.0)
        {
            progress.eta_seconds = static_cast<double>(progress.bytes_remaining) / (progress.speed_mbps * kBytesPerMegabyte);
        }
        return progress;
    }

    ProgressTracker::ProgressTracker(SessionStore &store, Clock clock) : store_(store), clock_(std::move(clock)) {}

    Result<UploadProgress> ProgressTracker::progress(const std::string &session_id) const
    {
        auto handle = store_.open(session_id);
        if (!handle)
        {
            return handle.error();
        }
        return compute_progress(handle->state(), handle->throughput(), clock_());
    }

} // namespace artistore::server
