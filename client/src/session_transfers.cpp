#include "artistore/client/session.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <span>
#include <thread>
#include <vector>

#include "artistore/crypto.hpp"
#include "artistore/encoding/base64.hpp"
#include "artistore/error_codes.hpp"
#include "artistore/protocol.hpp"

namespace artistore::client
{

    namespace
    {

        void apply_rate_limit(const std::optional<std::size_t> &rate, std::size_t bytes,
                              const std::chrono::steady_clock::time_point &start_time)
        {
            if (!rate || *rate == 0 || bytes == 0)
            {
                return;
            }
            const double expected_seconds = static_cast<double>(bytes) / static_cast<double>(*rate);
            const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time).count();
            if (elapsed < expected_seconds)
            {
                std::this_thread::sleep_for(std::chrono::duration<double>(expected_seconds - elapsed));
            }
        }

        // Errors after which the server session can never complete.
        bool is_terminal_failure(artistore::ErrorCode code)
        {
            return code == artistore::ErrorCode::SessionExpired || code == artistore::ErrorCode::SessionClosed ||
                   code == artistore::ErrorCode::NotFound || code == artistore::ErrorCode::ValidationFailed ||
                   code == artistore::ErrorCode::InvalidState;
        }

    } // namespace

    bool ClientSession::handle_upload(const std::vector<std::string> &args)
    {
        if (args.size() < 2 || args.size() > 3)
        {
            std::cout << "ERROR: invalid_usage" << std::endl;
            std::cout << "Usage: UPLOAD <artifact_id> <local_path> [content_type]" << std::endl;
            return true;
        }
        std::optional<std::string> content_type;
        if (args.size() == 3)
        {
            content_type = args[2];
        }
        return perform_upload(args[0], std::filesystem::path(args[1]), content_type);
    }

    bool ClientSession::perform_upload(const std::string &artifact_id, const std::filesystem::path &local_path_input,
                                       const std::optional<std::string> &content_type)
    {
        const auto absolute_local = std::filesystem::absolute(local_path_input);
        if (!std::filesystem::is_regular_file(absolute_local))
        {
            std::cout << "ERROR: file_not_found" << std::endl;
            std::cout << "Local path is not a readable file." << std::endl;
            return true;
        }

        const auto file_size = std::filesystem::file_size(absolute_local);
        if (file_size == 0)
        {
            std::cout << "ERROR: invalid_parameters" << std::endl;
            std::cout << "Empty files cannot be uploaded." << std::endl;
            return true;
        }
        const auto digests = artistore::crypto::hash_file(absolute_local);

        std::optional<TransferStateStore::Entry> entry =
            state_store_.find_upload(identity_, artifact_id, absolute_local, file_size, digests.sha256);
        if (entry && session_still_active(entry->session_id))
        {
            std::cout << "Resuming session " << entry->session_id << " (" << entry->acked_chunks.size()
                      << " chunks already stored)" << std::endl;
        }
        else
        {
            if (entry)
            {
                state_store_.remove_session(entry->session_id);
            }
            entry = open_session(artifact_id, absolute_local, file_size, digests.sha256, content_type);
            if (!entry)
            {
                return true;
            }
        }

        std::ifstream in(absolute_local, std::ios::binary);
        if (!in.is_open())
        {
            std::cout << "ERROR: file_io" << std::endl;
            std::cout << "Could not open local file for reading." << std::endl;
            return true;
        }

        const auto chunk_size = entry->chunk_size;
        const auto total_chunks = (file_size + chunk_size - 1) / chunk_size;
        std::vector<char> buffer(static_cast<std::size_t>(chunk_size));

        for (std::uint64_t chunk_number = 0; chunk_number < total_chunks; ++chunk_number)
        {
            if (entry->acked_chunks.contains(chunk_number))
            {
                continue;
            }
            const auto offset = chunk_number * chunk_size;
            const auto length = static_cast<std::size_t>(std::min<std::uint64_t>(chunk_size, file_size - offset));
            in.seekg(static_cast<std::streamoff>(offset));
            in.read(buffer.data(), static_cast<std::streamsize>(length));
            if (static_cast<std::size_t>(in.gcount()) != length)
            {
                std::cout << std::endl
                          << "ERROR: file_io" << std::endl;
                std::cout << "Local file changed while uploading." << std::endl;
                return true;
            }

            const auto bytes = std::as_bytes(std::span(buffer.data(), length));
            artistore::protocol::UploadChunkRequest chunk{
                .session_id = entry->session_id,
                .chunk_number = chunk_number,
                .chunk_hash = artistore::crypto::sha256_hex(bytes),
                .data_base64 = artistore::encoding::encode_base64(bytes),
            };
            const auto send_start = std::chrono::steady_clock::now();
            auto chunk_response = rpc(artistore::protocol::Command::UploadChunk, chunk);
            if (chunk_response.kind == artistore::protocol::ResponseKind::Error)
            {
                std::cout << std::endl;
                print_error(chunk_response);
                if (is_terminal_failure(chunk_response.error))
                {
                    state_store_.remove_session(entry->session_id);
                }
                return true;
            }
            apply_rate_limit(config_.max_upload_rate, length, send_start);
            state_store_.mark_chunk_acked(entry->session_id, chunk_number);
            entry->acked_chunks.insert(chunk_number);

            const auto received = chunk_response.payload.get<artistore::protocol::UploadChunkResponse>();
            std::cout << "\rUploaded " << received.bytes_received << " / " << file_size << " bytes" << std::flush;
        }
        std::cout << std::endl;

        artistore::protocol::FinalizeRequest finalize{
            .session_id = entry->session_id,
            .final_sha256 = digests.sha256,
        };
        auto finalize_response = rpc(artistore::protocol::Command::UploadFinalize, finalize);
        if (finalize_response.kind == artistore::protocol::ResponseKind::Error)
        {
            print_error(finalize_response);
            if (is_terminal_failure(finalize_response.error))
            {
                state_store_.remove_session(entry->session_id);
            }
            return true;
        }

        const auto result = finalize_response.payload.get<artistore::protocol::FinalizeResponse>();
        state_store_.remove_session(entry->session_id);
        std::cout << "OK file_id=" << result.file_id << " size=" << result.file_size_bytes
                  << " sha256=" << result.sha256_checksum << (result.deduplicated ? " (deduplicated)" : "")
                  << std::endl;
        logger_.log("upload", "stored ", absolute_local.generic_string(), " as ", result.file_id);
        return true;
    }

    std::optional<TransferStateStore::Entry> ClientSession::open_session(const std::string &artifact_id,
                                                                         const std::filesystem::path &local_path,
                                                                         std::uint64_t file_size,
                                                                         const std::string &sha256,
                                                                         const std::optional<std::string> &content_type)
    {
        const auto chunk_size = std::max<std::uint64_t>(1, config_.chunk_size);
        artistore::protocol::UploadInitRequest init{
            .artifact_id = artifact_id,
            .filename = local_path.filename().string(),
            .total_size_bytes = file_size,
            .total_chunks = (file_size + chunk_size - 1) / chunk_size,
            .chunk_size_bytes = chunk_size,
            .content_type = content_type,
        };
        auto init_response = rpc(artistore::protocol::Command::UploadInit, init);
        if (init_response.kind == artistore::protocol::ResponseKind::Error)
        {
            print_error(init_response);
            return std::nullopt;
        }
        const auto created = init_response.payload.get<artistore::protocol::UploadInitResponse>();

        TransferStateStore::Entry entry{
            .identity = identity_,
            .artifact_id = artifact_id,
            .local_path = local_path,
            .total_size = file_size,
            .sha256 = sha256,
            .session_id = created.session_id,
            .chunk_size = created.chunk_size_bytes,
        };
        state_store_.upsert_upload(entry);
        std::cout << "Session " << created.session_id << " opened" << std::endl;
        return entry;
    }

    bool ClientSession::session_still_active(const std::string &session_id)
    {
        artistore::protocol::SessionRequest request{.session_id = session_id};
        const auto response = rpc(artistore::protocol::Command::UploadProgress, request);
        return response.kind == artistore::protocol::ResponseKind::Ok;
    }

} // namespace artistore::client
