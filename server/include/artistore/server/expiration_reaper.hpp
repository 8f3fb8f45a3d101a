#pragma once

#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <mutex>

#include "artistore/server/chunk_staging.hpp"
#include "artistore/server/session_store.hpp"

namespace artistore::server
{

    struct SweepReport
    {
        std::size_t expired{};
        std::size_t purged{};
        std::size_t skipped{};
    };

    // Periodically retires sessions past their deadline and frees their staged
    // chunks. Sessions whose lock is held by a request are skipped until the
    // next sweep. start() and stop() may be called from any thread.
    class ExpirationReaper
    {
    public:
        ExpirationReaper(asio::io_context &io_context, SessionStore &store, ChunkStaging &staging,
                         std::chrono::seconds interval, std::chrono::seconds finalize_grace);
        ~ExpirationReaper();

        ExpirationReaper(const ExpirationReaper &) = delete;
        ExpirationReaper &operator=(const ExpirationReaper &) = delete;

        void start();
        void stop();

        SweepReport sweep_now();

    private:
        void schedule_next();

        // Guards timer_; the sweep handler and stop() run on different threads.
        std::mutex timer_mutex_;
        asio::steady_timer timer_;
        SessionStore &store_;
        ChunkStaging &staging_;
        std::chrono::seconds interval_;
        std::chrono::seconds finalize_grace_;
        std::atomic<bool> running_{false};
    };

    // One pass over the store; used by the reaper loop and directly by tests.
    SweepReport sweep_sessions(SessionStore &store, ChunkStaging &staging, std::chrono::seconds finalize_grace);

} // namespace artistore::server
