/**
 * artistore - Upload service: owns every upload-core module for the lifetime
 * of the server process and exposes the upload-lifecycle operations in wire
 * terms.
 */
#pragma once

#include <asio/io_context.hpp>

#include <memory>
#include <mutex>
#include <string>

#include "artistore/protocol.hpp"
#include "artistore/result.hpp"
#include "artistore/server/artifact_directory.hpp"
#include "artistore/server/assembler.hpp"
#include "artistore/server/chunk_receiver.hpp"
#include "artistore/server/chunk_staging.hpp"
#include "artistore/server/clock.hpp"
#include "artistore/server/config.hpp"
#include "artistore/server/duplicate_index.hpp"
#include "artistore/server/expiration_reaper.hpp"
#include "artistore/server/progress_tracker.hpp"
#include "artistore/server/session_store.hpp"
#include "artistore/server/storage_sink.hpp"
#include "artistore/server/validation.hpp"

namespace artistore::server
{

    struct ServiceCollaborators
    {
        std::unique_ptr<StorageSink> sink;
        std::unique_ptr<ArtifactDirectory> artifacts;
        std::shared_ptr<const MalwareScanner> scanner;
        Clock clock;
    };

    // Local sink and artifact directory under config.root, the heuristic
    // scanner unless scanning is disabled, and the system clock.
    ServiceCollaborators default_collaborators(const ServerConfig &config);

    class UploadService
    {
    public:
        explicit UploadService(ServerConfig config);
        UploadService(ServerConfig config, ServiceCollaborators collaborators);
        ~UploadService();

        UploadService(const UploadService &) = delete;
        UploadService &operator=(const UploadService &) = delete;

        Result<protocol::UploadInitResponse> init_session(const protocol::UploadInitRequest &request);

        Result<protocol::UploadChunkResponse> upload_chunk(const protocol::UploadChunkRequest &request);

        Result<protocol::FinalizeResponse> finalize(const protocol::FinalizeRequest &request);

        Result<protocol::ProgressResponse> progress(const protocol::SessionRequest &request);

        Result<protocol::AbortResponse> abort(const protocol::SessionRequest &request);

        Result<protocol::DuplicateCheckResponse> check_duplicate(const protocol::DuplicateCheckRequest &request);

        Result<protocol::ValidateFileResponse> validate_file(const protocol::ValidateFileRequest &request);

        Result<protocol::BatchUploadResponse> upload_batch(const protocol::BatchUploadRequest &request);

        void start_reaper(asio::io_context &io_context);

        SweepReport sweep_expired();

        // Cancels the reaper loop. Idempotent.
        void shutdown();

        SessionStore &sessions() noexcept { return sessions_; }
        DuplicateIndex &index() noexcept { return index_; }
        ChunkStaging &staging() noexcept { return staging_; }
        const ServerConfig &config() const noexcept { return config_; }

    private:
        Status check_artifact(const std::string &artifact_id) const;

        protocol::BatchFileResult store_batch_file(const std::string &artifact_id, const protocol::BatchFile &file,
                                                   bool skip_duplicates);

        ServerConfig config_;
        ServiceCollaborators collaborators_;

        SessionStore sessions_;
        ChunkStaging staging_;
        DuplicateIndex index_;

        ValidationPipeline chunk_pipeline_;
        ValidationPipeline declaration_pipeline_;
        ValidationPipeline file_pipeline_;
        ValidationPipeline batch_pipeline_;

        ChunkReceiver receiver_;
        ProgressTracker tracker_;
        Assembler assembler_;

        std::mutex reaper_mutex_;
        std::unique_ptr<ExpirationReaper> reaper_;
    };

} // namespace artistore::server
