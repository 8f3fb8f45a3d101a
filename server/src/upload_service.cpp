#include "artistore/server/upload_service.hpp"

#include <sstream>

#include <spdlog/spdlog.h>

#include "artistore/crypto.hpp"
#include "artistore/encoding/base64.hpp"
#include "artistore/identifiers.hpp"

namespace artistore::server
{

    namespace
    {
        constexpr auto kUploadTargetPrefix = "UPLOAD_CHUNK:";

        ServiceCollaborators complete(const ServerConfig &config, ServiceCollaborators collaborators)
        {
            auto defaults = default_collaborators(config);
            if (!collaborators.sink)
            {
                collaborators.sink = std::move(defaults.sink);
            }
            if (!collaborators.artifacts)
            {
                collaborators.artifacts = std::move(defaults.artifacts);
            }
            if (!collaborators.clock)
            {
                collaborators.clock = std::move(defaults.clock);
            }
            if (!config.malware_scan)
            {
                collaborators.scanner.reset();
            }
            else if (!collaborators.scanner)
            {
                collaborators.scanner = std::move(defaults.scanner);
            }
            return collaborators;
        }

        std::vector<protocol::CheckResultEntry> to_entries(const ValidationReport &report)
        {
            std::vector<protocol::CheckResultEntry> entries;
            entries.reserve(report.results.size());
            for (const auto &result : report.results)
            {
                entries.push_back(protocol::CheckResultEntry{
                    .check = result.check,
                    .passed = result.outcome.passed,
                    .warning = result.outcome.warning,
                    .message = result.outcome.message,
                    .details = result.outcome.details,
                });
            }
            return entries;
        }

        Result<std::vector<std::byte>> decode_payload(const std::string &data_base64, std::string_view what)
        {
            auto decoded = encoding::decode_base64(data_base64);
            if (!decoded)
            {
                return make_error(ErrorCode::InvalidPayload, std::string(what) + " is not valid base64");
            }
            return std::move(*decoded);
        }

        template <typename Operation>
        auto guarded(std::string_view name, Operation &&operation) -> decltype(operation())
        {
            try
            {
                return operation();
            }
            catch (const std::exception &ex)
            {
                spdlog::error("{} failed: {}", name, ex.what());
                return make_error(ErrorCode::InternalError, std::string(name) + " failed: " + ex.what());
            }
        }
    } // namespace

    ServiceCollaborators default_collaborators(const ServerConfig &config)
    {
        ServiceCollaborators collaborators;
        collaborators.sink = std::make_unique<LocalStorageSink>(config.root);
        collaborators.artifacts = std::make_unique<FileArtifactDirectory>(config.root);
        if (config.malware_scan)
        {
            collaborators.scanner = std::make_shared<HeuristicScanner>();
        }
        collaborators.clock = system_clock();
        return collaborators;
    }

    UploadService::UploadService(ServerConfig config)
        : UploadService(config, ServiceCollaborators{})
    {
    }

    UploadService::UploadService(ServerConfig config, ServiceCollaborators collaborators)
        : config_(std::move(config)),
          collaborators_(complete(config_, std::move(collaborators))),
          sessions_(config_.root, config_.limits, collaborators_.clock),
          staging_(config_.root),
          index_(config_.root),
          chunk_pipeline_(make_chunk_pipeline(config_.limits)),
          declaration_pipeline_(make_declaration_pipeline(config_.limits)),
          file_pipeline_(make_file_pipeline(config_.limits, config_.limits.max_object_size, collaborators_.scanner)),
          batch_pipeline_(make_file_pipeline(config_.limits, config_.limits.batch_max_file_size, collaborators_.scanner)),
          receiver_(sessions_, staging_, chunk_pipeline_),
          tracker_(sessions_, collaborators_.clock),
          assembler_(sessions_, staging_, index_, *collaborators_.sink)
    {
    }

    UploadService::~UploadService()
    {
        shutdown();
    }

    Result<protocol::UploadInitResponse> UploadService::init_session(const protocol::UploadInitRequest &request)
    {
        return guarded("init_session", [&]() -> Result<protocol::UploadInitResponse>
                       {
            if (auto status = check_artifact(request.artifact_id); !status)
            {
                return status.error();
            }

            ValidationCandidate candidate{
                .filename = request.filename,
                .content_type = request.content_type.value_or(std::string{}),
                .size_bytes = request.total_size_bytes,
            };
            const auto report = declaration_pipeline_.run(candidate);
            if (!report.passed)
            {
                const auto code = report.code == ErrorCode::PayloadTooLarge ? ErrorCode::PayloadTooLarge
                                                                            : ErrorCode::InvalidParameters;
                return make_error(code, report.failed_check.value_or("validation") + ": " + report.reason);
            }

            if (request.chunk_size_bytes > 0 &&
                request.total_chunks != chunk_count_for(request.total_size_bytes, request.chunk_size_bytes))
            {
                return make_error(ErrorCode::InvalidParameters,
                                  "total_chunks must equal ceil(total_size_bytes / chunk_size_bytes) = " +
                                      std::to_string(chunk_count_for(request.total_size_bytes, request.chunk_size_bytes)));
            }

            auto created = sessions_.create(request.artifact_id, request.filename, request.total_size_bytes,
                                            request.chunk_size_bytes,
                                            effective_content_type(request.filename, candidate.content_type));
            if (!created)
            {
                return created.error();
            }
            return protocol::UploadInitResponse{
                .session_id = created->session_id,
                .upload_target = kUploadTargetPrefix + created->session_id,
                .expires_at = to_unix_seconds(created->expires_at),
                .chunk_size_bytes = created->chunk_size_bytes,
            }; });
    }

    Result<protocol::UploadChunkResponse> UploadService::upload_chunk(const protocol::UploadChunkRequest &request)
    {
        return guarded("upload_chunk", [&]() -> Result<protocol::UploadChunkResponse>
                       {
            auto bytes = decode_payload(request.data_base64, "Chunk data");
            if (!bytes)
            {
                return bytes.error();
            }
            auto accepted = receiver_.accept_chunk(request.session_id, request.chunk_number, request.chunk_hash,
                                                   bytes.value());
            if (!accepted)
            {
                return accepted.error();
            }
            return protocol::UploadChunkResponse{
                .chunk_number = accepted->chunk_number,
                .bytes_received = accepted->bytes_received,
                .checksum_verified = accepted->checksum_verified,
                .status = std::string(to_string(accepted->outcome)),
            }; });
    }

    Result<protocol::FinalizeResponse> UploadService::finalize(const protocol::FinalizeRequest &request)
    {
        return guarded("finalize", [&]() -> Result<protocol::FinalizeResponse>
                       {
            auto outcome = assembler_.finalize(request.session_id, request.final_sha256);
            if (!outcome)
            {
                return outcome.error();
            }
            return protocol::FinalizeResponse{
                .artifact_id = outcome->artifact_id,
                .file_id = outcome->file.file_id,
                .file_size_bytes = outcome->file.size_bytes,
                .sha256_checksum = outcome->file.strong_digest,
                .deduplicated = outcome->deduplicated,
            }; });
    }

    Result<protocol::ProgressResponse> UploadService::progress(const protocol::SessionRequest &request)
    {
        return guarded("progress", [&]() -> Result<protocol::ProgressResponse>
                       {
            auto progress = tracker_.progress(request.session_id);
            if (!progress)
            {
                return progress.error();
            }
            return protocol::ProgressResponse{
                .bytes_received = progress->bytes_received,
                .bytes_remaining = progress->bytes_remaining,
                .chunks_received = progress->chunks_received,
                .total_chunks = progress->total_chunks,
                .percent_complete = progress->percent_complete,
                .eta_seconds = progress->eta_seconds,
                .speed_mbps = progress->speed_mbps,
            }; });
    }

    Result<protocol::AbortResponse> UploadService::abort(const protocol::SessionRequest &request)
    {
        return guarded("abort", [&]() -> Result<protocol::AbortResponse>
                       {
            auto opened = sessions_.open(request.session_id);
            if (!opened)
            {
                return opened.error();
            }
            auto &handle = opened.value();
            auto &session = handle.state();
            switch (session.status)
            {
            case SessionStatus::Active:
                if (auto status = handle.transition(SessionStatus::Aborted); !status)
                {
                    return status.error();
                }
                staging_.release(session.session_id);
                spdlog::info("Upload session {} aborted", session.session_id);
                break;
            case SessionStatus::Aborted:
                break;
            case SessionStatus::Expired:
                return make_error(ErrorCode::SessionExpired, "Upload session " + session.session_id + " has expired");
            default:
                return make_error(ErrorCode::InvalidState, "Upload session " + session.session_id + " is " +
                                                               std::string(to_string(session.status)));
            }
            return protocol::AbortResponse{
                .session_id = session.session_id,
                .status = std::string(to_string(session.status)),
            }; });
    }

    Result<protocol::DuplicateCheckResponse>
    UploadService::check_duplicate(const protocol::DuplicateCheckRequest &request)
    {
        if (!crypto::is_sha256_hex(request.sha256_checksum))
        {
            return make_error(ErrorCode::InvalidParameters, "sha256_checksum must be a 64-character SHA-256 hex digest");
        }
        const auto digest = crypto::normalize_digest(request.sha256_checksum);
        const auto existing = request.artifact_id ? index_.find_excluding(digest, *request.artifact_id)
                                                  : index_.find(digest);
        protocol::DuplicateCheckResponse response{.is_duplicate = existing.has_value()};
        if (existing)
        {
            response.existing_file_id = existing->file_id;
        }
        return response;
    }

    Result<protocol::ValidateFileResponse> UploadService::validate_file(const protocol::ValidateFileRequest &request)
    {
        return guarded("validate_file", [&]() -> Result<protocol::ValidateFileResponse>
                       {
            auto bytes = decode_payload(request.data_base64, "File data");
            if (!bytes)
            {
                return bytes.error();
            }
            ValidationCandidate candidate{
                .filename = request.filename,
                .content_type = request.content_type.value_or(std::string{}),
                .size_bytes = bytes->size(),
                .content = bytes.value(),
            };
            const auto report = file_pipeline_.run(candidate);
            return protocol::ValidateFileResponse{
                .passed = report.passed,
                .failed_check = report.failed_check,
                .reason = report.passed ? std::nullopt : std::optional<std::string>(report.reason),
                .results = to_entries(report),
                .warnings = report.warnings,
            }; });
    }

    Result<protocol::BatchUploadResponse> UploadService::upload_batch(const protocol::BatchUploadRequest &request)
    {
        return guarded("upload_batch", [&]() -> Result<protocol::BatchUploadResponse>
                       {
            if (auto status = check_artifact(request.artifact_id); !status)
            {
                return status.error();
            }
            if (request.files.empty() || request.files.size() > config_.limits.batch_max_files)
            {
                return make_error(ErrorCode::InvalidParameters,
                                  "Batch must contain 1-" + std::to_string(config_.limits.batch_max_files) + " files");
            }

            protocol::BatchUploadResponse response{
                .batch_id = generate_ulid(collaborators_.clock()),
                .artifact_id = request.artifact_id,
                .total_files = request.files.size(),
            };
            for (const auto &file : request.files)
            {
                auto result = store_batch_file(request.artifact_id, file, request.skip_duplicates);
                const bool failed = !result.success;
                if (failed)
                {
                    ++response.failed_count;
                }
                else
                {
                    ++response.successful_count;
                }
                response.results.push_back(std::move(result));
                if (failed && request.stop_on_error)
                {
                    break;
                }
            }
            spdlog::info("Batch {} for artifact {}: {} stored, {} failed", response.batch_id, request.artifact_id,
                         response.successful_count, response.failed_count);
            return response; });
    }

    void UploadService::start_reaper(asio::io_context &io_context)
    {
        std::lock_guard lock(reaper_mutex_);
        if (reaper_)
        {
            return;
        }
        reaper_ = std::make_unique<ExpirationReaper>(io_context, sessions_, staging_, config_.reap_interval,
                                                     config_.finalize_grace);
        reaper_->start();
    }

    SweepReport UploadService::sweep_expired()
    {
        return sweep_sessions(sessions_, staging_, config_.finalize_grace);
    }

    void UploadService::shutdown()
    {
        std::lock_guard lock(reaper_mutex_);
        if (reaper_)
        {
            reaper_->stop();
        }
    }

    Status UploadService::check_artifact(const std::string &artifact_id) const
    {
        if (!is_valid_artifact_id(artifact_id))
        {
            return make_error(ErrorCode::InvalidParameters, "artifact_id must be 1-128 characters of [A-Za-z0-9._-]");
        }
        if (!collaborators_.artifacts->exists(artifact_id))
        {
            return make_error(ErrorCode::NotFound, "Artifact " + artifact_id + " not found");
        }
        return {};
    }

    protocol::BatchFileResult UploadService::store_batch_file(const std::string &artifact_id,
                                                              const protocol::BatchFile &file, bool skip_duplicates)
    {
        protocol::BatchFileResult result{.filename = file.filename.empty() ? std::string{"unnamed"} : file.filename};
        try
        {
            auto bytes = encoding::decode_base64(file.data_base64);
            if (!bytes)
            {
                result.error_message = "File data is not valid base64";
                return result;
            }

            ValidationCandidate candidate{
                .filename = file.filename,
                .content_type = file.content_type.value_or(std::string{}),
                .size_bytes = bytes->size(),
                .content = *bytes,
            };
            const auto report = batch_pipeline_.run(candidate);
            if (!report.passed)
            {
                result.error_message = report.failed_check.value_or("validation") + ": " + report.reason;
                return result;
            }

            crypto::DualHasher hasher;
            hasher.update(*bytes);
            const auto digests = hasher.finish();

            if (skip_duplicates && index_.find(digests.sha256))
            {
                result.sha256_checksum = digests.sha256;
                result.error_message = "Duplicate file skipped";
                return result;
            }

            const auto now = collaborators_.clock();
            FinalizedFile stored{
                .file_id = generate_ulid(now),
                .artifact_id = artifact_id,
                .filename = file.filename,
                .size_bytes = digests.bytes,
                .strong_digest = digests.sha256,
                .fast_checksum = digests.fast,
                .created_at = now,
            };
            std::istringstream input(std::string(reinterpret_cast<const char *>(bytes->data()), bytes->size()));
            stored.download_location = collaborators_.sink->store(input, StoredObject{
                                                                             .file_id = stored.file_id,
                                                                             .artifact_id = artifact_id,
                                                                             .filename = stored.filename,
                                                                             .size_bytes = stored.size_bytes,
                                                                             .strong_digest = stored.strong_digest,
                                                                         });
            auto [indexed, inserted] = index_.insert(stored);
            if (!inserted)
            {
                collaborators_.sink->discard(stored.download_location);
            }
            result.success = true;
            result.file_id = indexed.file_id;
            result.sha256_checksum = indexed.strong_digest;
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Batch file {} failed: {}", result.filename, ex.what());
            result.error_message = ex.what();
        }
        return result;
    }

} // namespace artistore::server
