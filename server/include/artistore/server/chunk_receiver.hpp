#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

#include "artistore/result.hpp"
#include "artistore/server/chunk_staging.hpp"
#include "artistore/server/session_store.hpp"
#include "artistore/server/validation.hpp"

namespace artistore::server
{

    struct ChunkUploadResult
    {
        std::uint64_t chunk_number{};
        std::uint64_t bytes_received{};
        bool checksum_verified{};
        ChunkRecordOutcome outcome{ChunkRecordOutcome::Added};
        SessionStatus status{SessionStatus::Active};
    };

    std::string_view to_string(ChunkRecordOutcome outcome) noexcept;

    // Accepts one chunk for a session. Safe to retry: resending a chunk with
    // the digest already on record changes nothing.
    class ChunkReceiver
    {
    public:
        ChunkReceiver(SessionStore &store, ChunkStaging &staging, const ValidationPipeline &pipeline);

        Result<ChunkUploadResult> accept_chunk(const std::string &session_id, std::uint64_t chunk_number,
                                               const std::string &declared_digest, std::span<const std::byte> bytes);

    private:
        SessionStore &store_;
        ChunkStaging &staging_;
        const ValidationPipeline &pipeline_;
    };

} // namespace artistore::server
