/**
 * artistore - Upload session model: one declared, in-progress chunked upload,
 * its accepted chunks and, once assembled, the finalized file it produced.
 */
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "artistore/server/clock.hpp"

namespace artistore::server
{

    enum class SessionStatus : std::uint8_t
    {
        Active,
        Finalizing,
        Complete,
        Expired,
        Aborted
    };

    std::string_view to_string(SessionStatus status) noexcept;
    std::optional<SessionStatus> session_status_from_string(std::string_view value) noexcept;

    // ACTIVE -> {FINALIZING, EXPIRED, ABORTED}; FINALIZING -> {COMPLETE, ACTIVE}.
    bool is_legal_transition(SessionStatus from, SessionStatus to) noexcept;

    bool is_terminal(SessionStatus status) noexcept;

    struct ChunkRecord
    {
        std::uint64_t chunk_number{};
        std::uint64_t size_bytes{};
        std::string strong_digest;
        TimePoint received_at{};
    };

    struct FinalizedFile
    {
        std::string file_id;
        std::string artifact_id;
        std::string filename;
        std::uint64_t size_bytes{};
        std::string strong_digest;
        std::string fast_checksum;
        std::uint64_t version{};
        std::string download_location;
        TimePoint created_at{};
    };

    struct UploadSession
    {
        std::string session_id;
        std::string artifact_id;
        std::string filename;
        std::string content_type;
        std::uint64_t declared_total_size{};
        std::uint64_t declared_total_chunks{};
        std::uint64_t chunk_size_bytes{};
        std::map<std::uint64_t, ChunkRecord> received_chunks;
        std::uint64_t bytes_received{};
        TimePoint created_at{};
        TimePoint expires_at{};
        TimePoint updated_at{};
        SessionStatus status{SessionStatus::Active};
        std::optional<FinalizedFile> result;
        bool deduplicated{false};

        std::uint64_t last_chunk_size() const noexcept;

        // Size every chunk must have; only the last index may be short.
        std::uint64_t expected_chunk_size(std::uint64_t chunk_number) const noexcept;

        bool all_chunks_received() const noexcept { return received_chunks.size() == declared_total_chunks; }

        bool is_expired(TimePoint now) const noexcept { return now > expires_at; }
    };

    std::uint64_t chunk_count_for(std::uint64_t total_size, std::uint64_t chunk_size) noexcept;

    nlohmann::json to_json(const ChunkRecord &record);
    ChunkRecord chunk_record_from_json(const nlohmann::json &json);

    nlohmann::json to_json(const FinalizedFile &file);
    FinalizedFile finalized_file_from_json(const nlohmann::json &json);

    nlohmann::json to_json(const UploadSession &session);
    UploadSession upload_session_from_json(const nlohmann::json &json);

} // namespace artistore::server
