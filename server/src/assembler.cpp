#include "artistore/server/assembler.hpp"

#include <fstream>
#include <span>
#include <stdexcept>
#include <system_error>
#include <vector>

#include <spdlog/spdlog.h>

#include "artistore/crypto.hpp"
#include "artistore/identifiers.hpp"

namespace artistore::server
{

    namespace
    {
        constexpr std::size_t kCopyBufferSize = 1 << 20;

        void remove_quietly(const std::filesystem::path &path)
        {
            std::error_code ec;
            std::filesystem::remove(path, ec);
        }
    } // namespace

    Assembler::Assembler(SessionStore &store, ChunkStaging &staging, DuplicateIndex &index, StorageSink &sink)
        : store_(store), staging_(staging), index_(index), sink_(sink)
    {
    }

    Result<FinalizeOutcome> Assembler::finalize(const std::string &session_id, const std::string &asserted_digest)
    {
        if (!crypto::is_sha256_hex(asserted_digest))
        {
            return make_error(ErrorCode::InvalidParameters, "final_sha256 must be a 64-character SHA-256 hex digest");
        }

        auto opened = store_.open(session_id);
        if (!opened)
        {
            return opened.error();
        }
        auto &handle = opened.value();
        auto &session = handle.state();

        switch (session.status)
        {
        case SessionStatus::Complete:
            if (!session.result)
            {
                return make_error(ErrorCode::InternalError, "Completed session " + session_id + " has no result");
            }
            return FinalizeOutcome{.artifact_id = session.artifact_id,
                                   .file = *session.result,
                                   .deduplicated = session.deduplicated};
        case SessionStatus::Aborted:
            return make_error(ErrorCode::InvalidState, "Upload session " + session_id + " was aborted");
        case SessionStatus::Expired:
            return make_error(ErrorCode::SessionExpired, "Upload session " + session_id + " has expired");
        default:
            break;
        }

        if (session.is_expired(store_.now()))
        {
            if (session.status == SessionStatus::Finalizing)
            {
                if (auto status = handle.transition(SessionStatus::Active); !status)
                {
                    return status.error();
                }
            }
            if (auto status = handle.transition(SessionStatus::Expired); !status)
            {
                return status.error();
            }
            staging_.release(session_id);
            spdlog::info("Upload session {} expired before finalize", session_id);
            return make_error(ErrorCode::SessionExpired, "Upload session " + session_id + " has expired");
        }

        if (!session.all_chunks_received())
        {
            const auto missing = session.declared_total_chunks - session.received_chunks.size();
            return make_error(ErrorCode::IncompleteUpload, std::to_string(missing) + " of " +
                                                               std::to_string(session.declared_total_chunks) +
                                                               " chunks missing");
        }

        if (session.status == SessionStatus::Active)
        {
            if (auto status = handle.transition(SessionStatus::Finalizing); !status)
            {
                return status.error();
            }
        }

        try
        {
            return assemble(handle, crypto::normalize_digest(asserted_digest));
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Finalize of session {} failed: {}", session_id, ex.what());
            remove_quietly(staging_.assembly_path(session_id));
            if (session.status == SessionStatus::Finalizing)
            {
                if (auto status = handle.transition(SessionStatus::Active); !status)
                {
                    spdlog::error("Rollback of session {} failed: {}", session_id, status.error().message);
                }
            }
            return make_error(ErrorCode::InternalError, "Finalize failed: " + std::string(ex.what()));
        }
    }

    Result<FinalizeOutcome> Assembler::assemble(SessionHandle &handle, const std::string &asserted_digest)
    {
        auto &session = handle.state();
        const auto &session_id = session.session_id;
        const auto assembly_path = staging_.assembly_path(session_id);

        crypto::DualHasher hasher;
        {
            std::ofstream out(assembly_path, std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                throw std::runtime_error("Failed to open assembly file: " + assembly_path.string());
            }
            std::vector<char> buffer(kCopyBufferSize);
            for (std::uint64_t chunk = 0; chunk < session.declared_total_chunks; ++chunk)
            {
                auto in = staging_.open(session_id, chunk);
                while (in)
                {
                    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                    const auto count = static_cast<std::size_t>(in.gcount());
                    if (count == 0)
                    {
                        break;
                    }
                    const std::span<const std::byte> block(reinterpret_cast<const std::byte *>(buffer.data()), count);
                    hasher.update(block);
                    out.write(buffer.data(), static_cast<std::streamsize>(count));
                }
            }
            out.flush();
            if (!out)
            {
                throw std::runtime_error("Failed to write assembly file: " + assembly_path.string());
            }
        }
        const auto digests = hasher.finish();

        if (digests.bytes != session.declared_total_size || digests.sha256 != asserted_digest)
        {
            remove_quietly(assembly_path);
            if (auto status = handle.transition(SessionStatus::Active); !status)
            {
                return status.error();
            }
            spdlog::warn("Integrity check failed for session {}: asserted {}, assembled {} ({} bytes)", session_id,
                         asserted_digest, digests.sha256, digests.bytes);
            return make_error(ErrorCode::IntegrityCheckFailed,
                              "Assembled object digest " + digests.sha256 + " does not match final_sha256");
        }

        FinalizeOutcome outcome{.artifact_id = session.artifact_id};
        if (auto existing = index_.find(digests.sha256))
        {
            outcome.file = std::move(*existing);
            outcome.deduplicated = true;
            spdlog::info("Session {} deduplicated against file {}", session_id, outcome.file.file_id);
        }
        else
        {
            const auto now = store_.now();
            FinalizedFile file{
                .file_id = generate_ulid(now),
                .artifact_id = session.artifact_id,
                .filename = session.filename,
                .size_bytes = digests.bytes,
                .strong_digest = digests.sha256,
                .fast_checksum = digests.fast,
                .created_at = now,
            };
            std::ifstream assembled(assembly_path, std::ios::binary);
            if (!assembled.is_open())
            {
                throw std::runtime_error("Failed to reopen assembly file: " + assembly_path.string());
            }
            file.download_location = sink_.store(assembled, StoredObject{
                                                                .file_id = file.file_id,
                                                                .artifact_id = file.artifact_id,
                                                                .filename = file.filename,
                                                                .size_bytes = file.size_bytes,
                                                                .strong_digest = file.strong_digest,
                                                            });
            auto [indexed, inserted] = index_.insert(file);
            if (!inserted)
            {
                // Another session indexed the same bytes first.
                sink_.discard(file.download_location);
                outcome.deduplicated = true;
            }
            outcome.file = std::move(indexed);
        }

        session.result = outcome.file;
        session.deduplicated = outcome.deduplicated;
        if (auto status = handle.transition(SessionStatus::Complete); !status)
        {
            return status.error();
        }
        staging_.release(session_id);
        spdlog::info("Finalized session {} as file {} ({} bytes{})", session_id, outcome.file.file_id,
                     outcome.file.size_bytes, outcome.deduplicated ? ", deduplicated" : "");
        return outcome;
    }

} // namespace artistore::server
