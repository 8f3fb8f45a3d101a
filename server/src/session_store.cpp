#include "artistore/server/session_store.hpp"

#include <fstream>
#include <stdexcept>
#include <system_error>

#include <spdlog/spdlog.h>

#include "artistore/identifiers.hpp"

namespace artistore::server
{

    namespace
    {
        constexpr auto kSessionsDir = ".artistore/sessions";
    } // namespace

    SessionHandle::SessionHandle(SessionStore &store, std::shared_ptr<SessionEntry> entry,
                                 std::unique_lock<std::mutex> lock)
        : store_(&store), entry_(std::move(entry)), lock_(std::move(lock))
    {
    }

    ChunkRecordOutcome SessionHandle::record_chunk(std::uint64_t chunk_number, std::uint64_t size_bytes,
                                                   const std::string &strong_digest)
    {
        auto &session = entry_->session;
        const auto now = store_->now();
        auto outcome = ChunkRecordOutcome::Added;

        auto it = session.received_chunks.find(chunk_number);
        if (it != session.received_chunks.end())
        {
            if (it->second.strong_digest == strong_digest)
            {
                return ChunkRecordOutcome::Unchanged;
            }
            session.bytes_received -= it->second.size_bytes;
            outcome = ChunkRecordOutcome::Replaced;
        }

        session.received_chunks[chunk_number] = ChunkRecord{
            .chunk_number = chunk_number,
            .size_bytes = size_bytes,
            .strong_digest = strong_digest,
            .received_at = now,
        };
        session.bytes_received += size_bytes;
        session.updated_at = now;
        entry_->throughput.add(now, size_bytes);
        return outcome;
    }

    Status SessionHandle::transition(SessionStatus next)
    {
        auto &session = entry_->session;
        if (!is_legal_transition(session.status, next))
        {
            return make_error(ErrorCode::InvalidState, "Illegal session transition " +
                                                           std::string(to_string(session.status)) + " -> " +
                                                           std::string(to_string(next)));
        }
        session.status = next;
        session.updated_at = store_->now();
        persist();
        return {};
    }

    void SessionHandle::persist()
    {
        store_->persist_locked(entry_->session);
    }

    SessionStore::SessionStore(std::filesystem::path root, UploadLimits limits, Clock clock)
        : sessions_dir_(std::move(root) / kSessionsDir), limits_(limits), clock_(std::move(clock))
    {
        std::filesystem::create_directories(sessions_dir_);
        load_existing();
    }

    Result<UploadSession> SessionStore::create(const std::string &artifact_id, const std::string &filename,
                                               std::uint64_t total_size, std::uint64_t chunk_size,
                                               std::string content_type)
    {
        if (artifact_id.empty())
        {
            return make_error(ErrorCode::InvalidParameters, "artifact_id is required");
        }
        if (filename.empty())
        {
            return make_error(ErrorCode::InvalidParameters, "filename is required");
        }
        if (chunk_size < limits_.min_chunk_size || chunk_size > limits_.max_chunk_size)
        {
            return make_error(ErrorCode::InvalidParameters,
                              "chunk_size_bytes must be between " + std::to_string(limits_.min_chunk_size) + " and " +
                                  std::to_string(limits_.max_chunk_size));
        }
        if (total_size == 0 || total_size > limits_.max_object_size)
        {
            return make_error(ErrorCode::InvalidParameters,
                              "total_size_bytes must be between 1 and " + std::to_string(limits_.max_object_size));
        }
        const auto total_chunks = chunk_count_for(total_size, chunk_size);
        if (total_chunks == 0 || total_chunks > limits_.max_chunks)
        {
            return make_error(ErrorCode::InvalidParameters,
                              "total chunks must be between 1 and " + std::to_string(limits_.max_chunks));
        }

        const auto now = clock_();
        UploadSession session{};
        session.session_id = generate_ulid(now);
        session.artifact_id = artifact_id;
        session.filename = filename;
        session.content_type = std::move(content_type);
        session.declared_total_size = total_size;
        session.declared_total_chunks = total_chunks;
        session.chunk_size_bytes = chunk_size;
        session.created_at = now;
        session.expires_at = now + limits_.session_ttl;
        session.updated_at = now;
        session.status = SessionStatus::Active;

        auto entry = std::make_shared<SessionEntry>(session, limits_.throughput_window);
        {
            std::lock_guard entry_lock(entry->mutex);
            persist_locked(entry->session);
        }
        {
            std::lock_guard lock(mutex_);
            sessions_.emplace(session.session_id, std::move(entry));
        }
        spdlog::info("Created upload session {} for artifact {} ({} bytes in {} chunks)", session.session_id,
                     artifact_id, total_size, total_chunks);
        return session;
    }

    Result<UploadSession> SessionStore::get(const std::string &session_id)
    {
        auto handle = open(session_id);
        if (!handle)
        {
            return handle.error();
        }
        return handle->state();
    }

    Result<ChunkRecordOutcome> SessionStore::record_chunk(const std::string &session_id, std::uint64_t chunk_number,
                                                          std::uint64_t size_bytes, const std::string &strong_digest)
    {
        auto handle = open(session_id);
        if (!handle)
        {
            return handle.error();
        }
        auto outcome = handle->record_chunk(chunk_number, size_bytes, strong_digest);
        if (outcome != ChunkRecordOutcome::Unchanged)
        {
            handle->persist();
        }
        return outcome;
    }

    Status SessionStore::mark_status(const std::string &session_id, SessionStatus status)
    {
        auto handle = open(session_id);
        if (!handle)
        {
            return handle.error();
        }
        return handle->transition(status);
    }

    Result<SessionHandle> SessionStore::open(const std::string &session_id)
    {
        auto entry = find_entry(session_id);
        if (!entry)
        {
            return make_error(ErrorCode::NotFound, "Unknown upload session: " + session_id);
        }
        std::unique_lock lock(entry->mutex);
        if (entry->removed)
        {
            return make_error(ErrorCode::NotFound, "Unknown upload session: " + session_id);
        }
        return SessionHandle(*this, std::move(entry), std::move(lock));
    }

    std::optional<SessionHandle> SessionStore::try_open(const std::string &session_id)
    {
        auto entry = find_entry(session_id);
        if (!entry)
        {
            return std::nullopt;
        }
        std::unique_lock lock(entry->mutex, std::try_to_lock);
        if (!lock.owns_lock() || entry->removed)
        {
            return std::nullopt;
        }
        return SessionHandle(*this, std::move(entry), std::move(lock));
    }

    void SessionStore::purge(SessionHandle &handle)
    {
        const auto session_id = handle.state().session_id;
        handle.entry_->removed = true;
        {
            std::lock_guard lock(mutex_);
            sessions_.erase(session_id);
        }
        std::error_code ec;
        std::filesystem::remove(record_path(session_id), ec);
        if (ec)
        {
            spdlog::error("Failed to remove session record {}: {}", session_id, ec.message());
        }
    }

    std::vector<std::string> SessionStore::session_ids() const
    {
        std::lock_guard lock(mutex_);
        std::vector<std::string> ids;
        ids.reserve(sessions_.size());
        for (const auto &[id, entry] : sessions_)
        {
            ids.push_back(id);
        }
        return ids;
    }

    std::size_t SessionStore::size() const
    {
        std::lock_guard lock(mutex_);
        return sessions_.size();
    }

    std::shared_ptr<SessionEntry> SessionStore::find_entry(const std::string &session_id) const
    {
        std::lock_guard lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end())
        {
            return nullptr;
        }
        return it->second;
    }

    std::filesystem::path SessionStore::record_path(const std::string &session_id) const
    {
        return sessions_dir_ / (session_id + ".json");
    }

    void SessionStore::persist_locked(const UploadSession &session) const
    {
        const auto path = record_path(session.session_id);
        auto temp_path = path;
        temp_path += ".tmp";
        {
            std::ofstream out(temp_path, std::ios::trunc);
            if (!out.is_open())
            {
                spdlog::error("Failed to write session record {}", temp_path.string());
                throw std::runtime_error("Failed to write session record: " + temp_path.string());
            }
            out << to_json(session).dump(2);
        }
        std::filesystem::rename(temp_path, path);
    }

    void SessionStore::load_existing()
    {
        for (const auto &entry : std::filesystem::directory_iterator(sessions_dir_))
        {
            if (!entry.is_regular_file() || entry.path().extension() != ".json")
            {
                continue;
            }
            std::ifstream in(entry.path());
            if (!in.is_open())
            {
                continue;
            }
            UploadSession session;
            try
            {
                nlohmann::json json;
                in >> json;
                session = upload_session_from_json(json);
            }
            catch (const std::exception &ex)
            {
                spdlog::warn("Ignoring unreadable session record {}: {}", entry.path().string(), ex.what());
                continue;
            }
            if (session.status == SessionStatus::Finalizing)
            {
                // No assembly survives a restart.
                session.status = SessionStatus::Active;
                persist_locked(session);
            }
            const auto id = session.session_id;
            sessions_.emplace(id, std::make_shared<SessionEntry>(std::move(session), limits_.throughput_window));
        }
        if (!sessions_.empty())
        {
            spdlog::info("Restored {} upload sessions", sessions_.size());
        }
    }

} // namespace artistore::server
