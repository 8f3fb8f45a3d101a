/**
 * artistore - Wire schema for the upload-lifecycle commands and its JSON
 * serialization helpers.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "artistore/error_codes.hpp"

namespace artistore::protocol
{

    enum class Command : std::uint8_t
    {
        Authenticate,
        UploadInit,
        UploadChunk,
        UploadFinalize,
        UploadProgress,
        UploadAbort,
        CheckDuplicate,
        ValidateFile,
        UploadBatch,
        Ping
    };

    std::string_view to_string(Command command) noexcept;
    std::optional<Command> command_from_string(std::string_view value) noexcept;

    enum class ResponseKind : std::uint8_t
    {
        Ok = 0,
        Error = 1
    };

    std::string_view to_string(ResponseKind kind) noexcept;
    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept;

    struct RequestEnvelope
    {
        Command command{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope);
    void from_json(const nlohmann::json &json, RequestEnvelope &envelope);

    struct ResponseEnvelope
    {
        ResponseKind kind{ResponseKind::Ok};
        std::uint16_t status_code{200};
        ErrorCode error{ErrorCode::Ok};
        std::string message{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope);
    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope);

    struct AuthenticateRequest
    {
        std::string username{};
        std::string password{};
        bool register_user{};
    };

    void to_json(nlohmann::json &json, const AuthenticateRequest &request);
    void from_json(const nlohmann::json &json, AuthenticateRequest &request);

    struct AuthenticateResponse
    {
        bool success{};
        bool newly_registered{};
        std::string identity{};
    };

    void to_json(nlohmann::json &json, const AuthenticateResponse &response);
    void from_json(const nlohmann::json &json, AuthenticateResponse &response);

    struct UploadInitRequest
    {
        std::string artifact_id;
        std::string filename;
        std::uint64_t total_size_bytes{};
        std::uint64_t total_chunks{};
        std::uint64_t chunk_size_bytes{};
        std::optional<std::string> content_type{};
    };

    void to_json(nlohmann::json &json, const UploadInitRequest &request);
    void from_json(const nlohmann::json &json, UploadInitRequest &request);

    struct UploadInitResponse
    {
        std::string session_id;
        std::string upload_target;
        std::int64_t expires_at{};
        std::uint64_t chunk_size_bytes{};
    };

    void to_json(nlohmann::json &json, const UploadInitResponse &response);
    void from_json(const nlohmann::json &json, UploadInitResponse &response);

    struct UploadChunkRequest
    {
        std::string session_id;
        std::uint64_t chunk_number{};
        std::string chunk_hash;
        std::string data_base64;
    };

    void to_json(nlohmann::json &json, const UploadChunkRequest &request);
    void from_json(const nlohmann::json &json, UploadChunkRequest &request);

    struct UploadChunkResponse
    {
        std::uint64_t chunk_number{};
        std::uint64_t bytes_received{};
        bool checksum_verified{};
        std::string status;
    };

    void to_json(nlohmann::json &json, const UploadChunkResponse &response);
    void from_json(const nlohmann::json &json, UploadChunkResponse &response);

    struct FinalizeRequest
    {
        std::string session_id;
        std::string final_sha256;
    };

    void to_json(nlohmann::json &json, const FinalizeRequest &request);
    void from_json(const nlohmann::json &json, FinalizeRequest &request);

    struct FinalizeResponse
    {
        std::string artifact_id;
        std::string file_id;
        std::uint64_t file_size_bytes{};
        std::string sha256_checksum;
        bool deduplicated{};
    };

    void to_json(nlohmann::json &json, const FinalizeResponse &response);
    void from_json(const nlohmann::json &json, FinalizeResponse &response);

    // Payload of UPLOAD_PROGRESS and UPLOAD_ABORT.
    struct SessionRequest
    {
        std::string session_id;
    };

    void to_json(nlohmann::json &json, const SessionRequest &request);
    void from_json(const nlohmann::json &json, SessionRequest &request);

    struct ProgressResponse
    {
        std::uint64_t bytes_received{};
        std::uint64_t bytes_remaining{};
        std::uint64_t chunks_received{};
        std::uint64_t total_chunks{};
        double percent_complete{};
        std::optional<double> eta_seconds{};
        double speed_mbps{};
    };

    void to_json(nlohmann::json &json, const ProgressResponse &response);
    void from_json(const nlohmann::json &json, ProgressResponse &response);

    struct AbortResponse
    {
        std::string session_id;
        std::string status;
    };

    void to_json(nlohmann::json &json, const AbortResponse &response);
    void from_json(const nlohmann::json &json, AbortResponse &response);

    struct DuplicateCheckRequest
    {
        std::optional<std::string> artifact_id{};
        std::string sha256_checksum;
    };

    void to_json(nlohmann::json &json, const DuplicateCheckRequest &request);
    void from_json(const nlohmann::json &json, DuplicateCheckRequest &request);

    struct DuplicateCheckResponse
    {
        bool is_duplicate{};
        std::optional<std::string> existing_file_id{};
    };

    void to_json(nlohmann::json &json, const DuplicateCheckResponse &response);
    void from_json(const nlohmann::json &json, DuplicateCheckResponse &response);

    struct ValidateFileRequest
    {
        std::string filename;
        std::optional<std::string> content_type{};
        std::string data_base64;
    };

    void to_json(nlohmann::json &json, const ValidateFileRequest &request);
    void from_json(const nlohmann::json &json, ValidateFileRequest &request);

    struct CheckResultEntry
    {
        std::string check;
        bool passed{};
        bool warning{};
        std::string message;
        nlohmann::json details{nlohmann::json::object()};
    };

    void to_json(nlohmann::json &json, const CheckResultEntry &entry);
    void from_json(const nlohmann::json &json, CheckResultEntry &entry);

    struct ValidateFileResponse
    {
        bool passed{};
        std::optional<std::string> failed_check{};
        std::optional<std::string> reason{};
        std::vector<CheckResultEntry> results;
        std::vector<std::string> warnings;
    };

    void to_json(nlohmann::json &json, const ValidateFileResponse &response);
    void from_json(const nlohmann::json &json, ValidateFileResponse &response);

    struct BatchFile
    {
        std::string filename;
        std::optional<std::string> content_type{};
        std::string data_base64;
    };

    void to_json(nlohmann::json &json, const BatchFile &file);
    void from_json(const nlohmann::json &json, BatchFile &file);

    struct BatchUploadRequest
    {
        std::string artifact_id;
        std::vector<BatchFile> files;
        bool skip_duplicates{};
        bool stop_on_error{};
    };

    void to_json(nlohmann::json &json, const BatchUploadRequest &request);
    void from_json(const nlohmann::json &json, BatchUploadRequest &request);

    struct BatchFileResult
    {
        std::string filename;
        bool success{};
        std::optional<std::string> file_id{};
        std::optional<std::string> sha256_checksum{};
        std::optional<std::string> error_message{};
    };

    void to_json(nlohmann::json &json, const BatchFileResult &result);
    void from_json(const nlohmann::json &json, BatchFileResult &result);

    struct BatchUploadResponse
    {
        std::string batch_id;
        std::string artifact_id;
        std::uint64_t total_files{};
        std::uint64_t successful_count{};
        std::uint64_t failed_count{};
        std::vector<BatchFileResult> results;
    };

    void to_json(nlohmann::json &json, const BatchUploadResponse &response);
    void from_json(const nlohmann::json &json, BatchUploadResponse &response);

} // namespace artistore::protocol
