#include "artistore/server/chunk_receiver.hpp"

#include <spdlog/spdlog.h>

#include "artistore/crypto.hpp"

namespace artistore::server
{

    std::string_view to_string(ChunkRecordOutcome outcome) noexcept
    {
        switch (outcome)
        {
        case ChunkRecordOutcome::Added:
            return "received";
        case ChunkRecordOutcome::Replaced:
            return "replaced";
        case ChunkRecordOutcome::Unchanged:
            return "unchanged";
        }
        return "unknown";
    }

    ChunkReceiver::ChunkReceiver(SessionStore &store, ChunkStaging &staging, const ValidationPipeline &pipeline)
        : store_(store), staging_(staging), pipeline_(pipeline)
    {
    }

    Result<ChunkUploadResult> ChunkReceiver::accept_chunk(const std::string &session_id, std::uint64_t chunk_number,
                                                          const std::string &declared_digest,
                                                          std::span<const std::byte> bytes)
    {
        if (!crypto::is_sha256_hex(declared_digest))
        {
            return make_error(ErrorCode::InvalidParameters, "chunk_hash must be a 64-character SHA-256 hex digest");
        }
        const auto expected_digest = crypto::normalize_digest(declared_digest);
        // Hashing happens before the session lock is taken.
        const auto actual_digest = crypto::sha256_hex(bytes);

        auto opened = store_.open(session_id);
        if (!opened)
        {
            return opened.error();
        }
        auto &handle = opened.value();
        auto &session = handle.state();

        if (session.status == SessionStatus::Expired)
        {
            return make_error(ErrorCode::SessionExpired, "Upload session " + session_id + " has expired");
        }
        if (session.status == SessionStatus::Active && session.is_expired(store_.now()))
        {
            if (auto status = handle.transition(SessionStatus::Expired); !status)
            {
                return status.error();
            }
            staging_.release(session_id);
            spdlog::info("Upload session {} expired before chunk {}", session_id, chunk_number);
            return make_error(ErrorCode::SessionExpired, "Upload session " + session_id + " has expired");
        }
        if (session.status != SessionStatus::Active)
        {
            return make_error(ErrorCode::SessionClosed, "Upload session " + session_id + " is " +
                                                            std::string(to_string(session.status)));
        }
        if (chunk_number >= session.declared_total_chunks)
        {
            return make_error(ErrorCode::OutOfRange, "chunk_number " + std::to_string(chunk_number) +
                                                         " outside 0.." +
                                                         std::to_string(session.declared_total_chunks - 1));
        }
        const auto expected_size = session.expected_chunk_size(chunk_number);
        if (bytes.size() != expected_size)
        {
            return make_error(ErrorCode::SizeMismatch, "Chunk " + std::to_string(chunk_number) + " has " +
                                                           std::to_string(bytes.size()) + " bytes, expected " +
                                                           std::to_string(expected_size));
        }

        const auto previous = session.received_chunks.find(chunk_number);
        ValidationCandidate candidate{
            .filename = session.filename,
            .content_type = session.content_type,
            .size_bytes = bytes.size(),
            .declared_total = session.declared_total_size,
            .bytes_already_received = session.bytes_received,
            .replaced_bytes = previous != session.received_chunks.end() ? previous->second.size_bytes : 0,
            .content = bytes,
            .is_chunk = true,
        };
        const auto report = pipeline_.run(candidate);
        if (!report.passed)
        {
            return report.status().error();
        }

        if (actual_digest != expected_digest)
        {
            spdlog::warn("Checksum mismatch on chunk {} of session {}: expected {}, got {}", chunk_number, session_id,
                         expected_digest, actual_digest);
            return make_error(ErrorCode::ChecksumMismatch, "Chunk " + std::to_string(chunk_number) +
                                                               " digest does not match chunk_hash");
        }

        ChunkUploadResult result{
            .chunk_number = chunk_number,
            .bytes_received = session.bytes_received,
            .checksum_verified = true,
            .outcome = ChunkRecordOutcome::Unchanged,
            .status = session.status,
        };
        if (previous != session.received_chunks.end() && previous->second.strong_digest == actual_digest)
        {
            spdlog::debug("Chunk {} of session {} already received", chunk_number, session_id);
            return result;
        }

        try
        {
            staging_.write(session_id, chunk_number, bytes);
            result.outcome = handle.record_chunk(chunk_number, bytes.size(), actual_digest);
            handle.persist();
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Failed to store chunk {} of session {}: {}", chunk_number, session_id, ex.what());
            return make_error(ErrorCode::InternalError, "Failed to store chunk: " + std::string(ex.what()));
        }
        result.bytes_received = session.bytes_received;
        spdlog::debug("Accepted chunk {} of session {} ({} of {} bytes)", chunk_number, session_id,
                      session.bytes_received, session.declared_total_size);
        return result;
    }

} // namespace artistore::server
