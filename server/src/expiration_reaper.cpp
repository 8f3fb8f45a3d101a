#include "artistore/server/expiration_reaper.hpp"

#include <spdlog/spdlog.h>

namespace artistore::server
{

    SweepReport sweep_sessions(SessionStore &store, ChunkStaging &staging, std::chrono::seconds finalize_grace)
    {
        SweepReport report;
        const auto now = store.now();
        const auto tombstone_ttl = store.limits().session_ttl;

        for (const auto &session_id : store.session_ids())
        {
            auto handle = store.try_open(session_id);
            if (!handle)
            {
                ++report.skipped;
                continue;
            }
            auto &session = handle->state();

            if (is_terminal(session.status))
            {
                if (now > session.expires_at + tombstone_ttl)
                {
                    staging.release(session_id);
                    store.purge(*handle);
                    ++report.purged;
                }
                continue;
            }

            const bool stuck_finalizing =
                session.status == SessionStatus::Finalizing && now > session.expires_at + finalize_grace;
            const bool expired_active = session.status == SessionStatus::Active && session.is_expired(now);
            if (!stuck_finalizing && !expired_active)
            {
                continue;
            }

            if (stuck_finalizing)
            {
                if (auto status = handle->transition(SessionStatus::Active); !status)
                {
                    spdlog::error("Reaper could not roll back session {}: {}", session_id, status.error().message);
                    continue;
                }
            }
            if (auto status = handle->transition(SessionStatus::Expired); !status)
            {
                spdlog::error("Reaper could not expire session {}: {}", session_id, status.error().message);
                continue;
            }
            staging.release(session_id);
            ++report.expired;
        }

        if (report.expired > 0 || report.purged > 0)
        {
            spdlog::info("Reaper expired {} and purged {} sessions ({} busy)", report.expired, report.purged,
                         report.skipped);
        }
        else
        {
            spdlog::debug("Reaper sweep found nothing to retire ({} busy)", report.skipped);
        }
        return report;
    }

    ExpirationReaper::ExpirationReaper(asio::io_context &io_context, SessionStore &store, ChunkStaging &staging,
                                       std::chrono::seconds interval, std::chrono::seconds finalize_grace)
        : timer_(io_context), store_(store), staging_(staging), interval_(interval), finalize_grace_(finalize_grace)
    {
    }

    ExpirationReaper::~ExpirationReaper()
    {
        stop();
    }

    void ExpirationReaper::start()
    {
        if (running_.exchange(true))
        {
            return;
        }
        spdlog::info("Expiration reaper running every {}s", interval_.count());
        schedule_next();
    }

    void ExpirationReaper::stop()
    {
        if (!running_.exchange(false))
        {
            return;
        }
        {
            std::lock_guard lock(timer_mutex_);
            timer_.cancel();
        }
        spdlog::info("Expiration reaper stopped");
    }

    SweepReport ExpirationReaper::sweep_now()
    {
        return sweep_sessions(store_, staging_, finalize_grace_);
    }

    void ExpirationReaper::schedule_next()
    {
        std::lock_guard lock(timer_mutex_);
        if (!running_)
        {
            return;
        }
        timer_.expires_after(interval_);
        timer_.async_wait([this](const std::error_code &ec)
                          {
            if (ec || !running_)
            {
                return;
            }
            try
            {
                sweep_now();
            }
            catch (const std::exception &ex)
            {
                spdlog::error("Reaper sweep failed: {}", ex.what());
            }
            schedule_next(); });
    }

} // namespace artistore::server
