/**
 * artistore - Process-wide table of upload sessions.
 *
 * Each session lives in its own entry guarded by its own mutex. The table
 * lock is only held while looking an entry up, so work on one session never
 * blocks another. Callers mutate a session through a SessionHandle, which
 * keeps the entry locked for as long as it is alive.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "artistore/result.hpp"
#include "artistore/server/clock.hpp"
#include "artistore/server/config.hpp"
#include "artistore/server/progress_tracker.hpp"
#include "artistore/server/upload_session.hpp"

namespace artistore::server
{

    class SessionStore;

    struct SessionEntry
    {
        SessionEntry(UploadSession initial, std::chrono::seconds window)
            : session(std::move(initial)), throughput(window) {}

        std::mutex mutex;
        UploadSession session;
        ThroughputWindow throughput;
        bool removed{false};
    };

    enum class ChunkRecordOutcome : std::uint8_t
    {
        Added,
        Replaced,
        Unchanged
    };

    class SessionHandle
    {
    public:
        SessionHandle(SessionStore &store, std::shared_ptr<SessionEntry> entry, std::unique_lock<std::mutex> lock);

        UploadSession &state() noexcept { return entry_->session; }
        const UploadSession &state() const noexcept { return entry_->session; }

        ThroughputWindow &throughput() noexcept { return entry_->throughput; }

        // Adds or replaces the record for chunk_number and adjusts bytes_received
        // by the size delta against any prior record.
        ChunkRecordOutcome record_chunk(std::uint64_t chunk_number, std::uint64_t size_bytes,
                                        const std::string &strong_digest);

        Status transition(SessionStatus next);

        void persist();

    private:
        friend class SessionStore;

        SessionStore *store_;
        std::shared_ptr<SessionEntry> entry_;
        std::unique_lock<std::mutex> lock_;
    };

    class SessionStore
    {
    public:
        SessionStore(std::filesystem::path root, UploadLimits limits, Clock clock);

        Result<UploadSession> create(const std::string &artifact_id, const std::string &filename,
                                     std::uint64_t total_size, std::uint64_t chunk_size,
                                     std::string content_type = {});

        // Copy of the session taken under its lock.
        Result<UploadSession> get(const std::string &session_id);

        Result<ChunkRecordOutcome> record_chunk(const std::string &session_id, std::uint64_t chunk_number,
                                                std::uint64_t size_bytes, const std::string &strong_digest);

        Status mark_status(const std::string &session_id, SessionStatus status);

        // Blocks until the session's lock is free.
        Result<SessionHandle> open(const std::string &session_id);

        // Returns std::nullopt when the session is unknown or currently locked.
        std::optional<SessionHandle> try_open(const std::string &session_id);

        // Drops the session from the table and deletes its record.
        void purge(SessionHandle &handle);

        std::vector<std::string> session_ids() const;

        std::size_t size() const;

        const UploadLimits &limits() const noexcept { return limits_; }

        TimePoint now() const { return clock_(); }

    private:
        friend class SessionHandle;

        std::shared_ptr<SessionEntry> find_entry(const std::string &session_id) const;

        std::filesystem::path record_path(const std::string &session_id) const;
        void persist_locked(const UploadSession &session) const;
        void load_existing();

        std::filesystem::path sessions_dir_;
        UploadLimits limits_;
        Clock clock_;

        mutable std::mutex mutex_;
        std::unordered_map<std::string, std::shared_ptr<SessionEntry>> sessions_;
    };

} // namespace artistore::server
