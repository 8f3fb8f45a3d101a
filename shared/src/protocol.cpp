#include "artistore/protocol.hpp"

#include <array>
#include <stdexcept>

namespace artistore::protocol
{

    namespace
    {

        struct CommandMapping
        {
            Command command;
            std::string_view label;
        };

        constexpr std::array<CommandMapping, 10> kCommandMappings{{
            {Command::Authenticate, "AUTHENTICATE"},
            {Command::UploadInit, "UPLOAD_INIT"},
            {Command::UploadChunk, "UPLOAD_CHUNK"},
            {Command::UploadFinalize, "UPLOAD_FINALIZE"},
            {Command::UploadProgress, "UPLOAD_PROGRESS"},
            {Command::UploadAbort, "UPLOAD_ABORT"},
            {Command::CheckDuplicate, "CHECK_DUPLICATE"},
            {Command::ValidateFile, "VALIDATE_FILE"},
            {Command::UploadBatch, "UPLOAD_BATCH"},
            {Command::Ping, "PING"},
        }};

        struct ResponseKindMapping
        {
            ResponseKind kind;
            std::string_view label;
        };

        constexpr std::array<ResponseKindMapping, 2> kResponseMappings{{
            {ResponseKind::Ok, "OK"},
            {ResponseKind::Error, "ERROR"},
        }};

        template <typename T>
        void put_optional(nlohmann::json &json, const char *key, const std::optional<T> &value)
        {
            if (value)
            {
                json[key] = *value;
            }
        }

        template <typename T>
        std::optional<T> read_optional(const nlohmann::json &json, const char *key)
        {
            if (auto it = json.find(key); it != json.end() && !it->is_null())
            {
                return it->get<T>();
            }
            return std::nullopt;
        }

    } // namespace

    std::string_view to_string(Command command) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.command == command)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<Command> command_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.label == value)
            {
                return mapping.command;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(ResponseKind kind) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.label == value)
            {
                return mapping.kind;
            }
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope)
    {
        json = {
            {"cmd", to_string(envelope.command)},
            {"payload", envelope.payload},
        };
        put_optional(json, "id", envelope.request_id);
    }

    void from_json(const nlohmann::json &json, RequestEnvelope &envelope)
    {
        const auto cmd_label = json.at("cmd").get<std::string>();
        auto cmd = command_from_string(cmd_label);
        if (!cmd)
        {
            throw std::runtime_error("Unknown command: " + cmd_label);
        }
        envelope.command = *cmd;
        envelope.payload = json.value("payload", nlohmann::json::object());
        envelope.request_id = read_optional<std::string>(json, "id");
    }

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope)
    {
        json = {
            {"status", to_string(envelope.kind)},
            {"code", envelope.status_code},
            {"error", to_int(envelope.error)},
            {"message", envelope.message},
            {"payload", envelope.payload},
        };
        put_optional(json, "id", envelope.request_id);
    }

    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope)
    {
        const auto status_label = json.at("status").get<std::string>();
        auto kind = response_kind_from_string(status_label);
        if (!kind)
        {
            throw std::runtime_error("Unknown response status: " + status_label);
        }
        envelope.kind = *kind;
        const auto error_value = json.value("error", 0u);
        envelope.error = error_code_from_int(static_cast<std::uint16_t>(error_value));
        envelope.status_code = json.value("code", status_code(envelope.error));
        envelope.message = json.value("message", std::string{});
        envelope.payload = json.value("payload", nlohmann::json::object());
        envelope.request_id = read_optional<std::string>(json, "id");
    }

    void to_json(nlohmann::json &json, const AuthenticateRequest &request)
    {
        json = {
            {"username", request.username},
            {"password", request.password},
            {"register", request.register_user},
        };
    }

    void from_json(const nlohmann::json &json, AuthenticateRequest &request)
    {
        request.username = json.value("username", std::string{});
        request.password = json.value("password", std::string{});
        request.register_user = json.value("register", false);
    }

    void to_json(nlohmann::json &json, const AuthenticateResponse &response)
    {
        json = {
            {"success", response.success},
            {"newly_registered", response.newly_registered},
            {"identity", response.identity},
        };
    }

    void from_json(const nlohmann::json &json, AuthenticateResponse &response)
    {
        response.success = json.value("success", false);
        response.newly_registered = json.value("newly_registered", false);
        response.identity = json.value("identity", std::string{});
    }

    void to_json(nlohmann::json &json, const UploadInitRequest &request)
    {
        json = {
            {"artifact_id", request.artifact_id},
            {"filename", request.filename},
            {"total_size_bytes", request.total_size_bytes},
            {"total_chunks", request.total_chunks},
            {"chunk_size_bytes", request.chunk_size_bytes},
        };
        put_optional(json, "content_type", request.content_type);
    }

    void from_json(const nlohmann::json &json, UploadInitRequest &request)
    {
        request.artifact_id = json.at("artifact_id").get<std::string>();
        request.filename = json.at("filename").get<std::string>();
        request.total_size_bytes = json.at("total_size_bytes").get<std::uint64_t>();
        request.total_chunks = json.at("total_chunks").get<std::uint64_t>();
        request.chunk_size_bytes = json.at("chunk_size_bytes").get<std::uint64_t>();
        request.content_type = read_optional<std::string>(json, "content_type");
    }

    void to_json(nlohmann::json &json, const UploadInitResponse &response)
    {
        json = {
            {"session_id", response.session_id},
            {"upload_target", response.upload_target},
            {"expires_at", response.expires_at},
            {"chunk_size_bytes", response.chunk_size_bytes},
        };
    }

    void from_json(const nlohmann::json &json, UploadInitResponse &response)
    {
        response.session_id = json.at("session_id").get<std::string>();
        response.upload_target = json.value("upload_target", std::string{});
        response.expires_at = json.value("expires_at", std::int64_t{0});
        response.chunk_size_bytes = json.value("chunk_size_bytes", 0ULL);
    }

    void to_json(nlohmann::json &json, const UploadChunkRequest &request)
    {
        json = {
            {"session_id", request.session_id},
            {"chunk_number", request.chunk_number},
            {"chunk_hash", request.chunk_hash},
            {"data", request.data_base64},
        };
    }

    void from_json(const nlohmann::json &json, UploadChunkRequest &request)
    {
        request.session_id = json.at("session_id").get<std::string>();
        request.chunk_number = json.at("chunk_number").get<std::uint64_t>();
        request.chunk_hash = json.at("chunk_hash").get<std::string>();
        request.data_base64 = json.at("data").get<std::string>();
    }

    void to_json(nlohmann::json &json, const UploadChunkResponse &response)
    {
        json = {
            {"chunk_number", response.chunk_number},
            {"bytes_received", response.bytes_received},
            {"checksum_verified", response.checksum_verified},
            {"status", response.status},
        };
    }

    void from_json(const nlohmann::json &json, UploadChunkResponse &response)
    {
        response.chunk_number = json.value("chunk_number", 0ULL);
        response.bytes_received = json.value("bytes_received", 0ULL);
        response.checksum_verified = json.value("checksum_verified", false);
        response.status = json.value("status", std::string{});
    }

    void to_json(nlohmann::json &json, const FinalizeRequest &request)
    {
        json = {
            {"session_id", request.session_id},
            {"final_sha256", request.final_sha256},
        };
    }

    void from_json(const nlohmann::json &json, FinalizeRequest &request)
    {
        request.session_id = json.at("session_id").get<std::string>();
        request.final_sha256 = json.at("final_sha256").get<std::string>();
    }

    void to_json(nlohmann::json &json, const FinalizeResponse &response)
    {
        json = {
            {"artifact_id", response.artifact_id},
            {"file_id", response.file_id},
            {"file_size_bytes", response.file_size_bytes},
            {"sha256_checksum", response.sha256_checksum},
            {"deduplicated", response.deduplicated},
        };
    }

    void from_json(const nlohmann::json &json, FinalizeResponse &response)
    {
        response.artifact_id = json.value("artifact_id", std::string{});
        response.file_id = json.at("file_id").get<std::string>();
        response.file_size_bytes = json.value("file_size_bytes", 0ULL);
        response.sha256_checksum = json.value("sha256_checksum", std::string{});
        response.deduplicated = json.value("deduplicated", false);
    }

    void to_json(nlohmann::json &json, const SessionRequest &request)
    {
        json = {{"session_id", request.session_id}};
    }

    void from_json(const nlohmann::json &json, SessionRequest &request)
    {
        request.session_id = json.at("session_id").get<std::string>();
    }

    void to_json(nlohmann::json &json, const ProgressResponse &response)
    {
        json = {
            {"bytes_received", response.bytes_received},
            {"bytes_remaining", response.bytes_remaining},
            {"chunks_received", response.chunks_received},
            {"total_chunks", response.total_chunks},
            {"percent_complete", response.percent_complete},
            {"speed_mbps", response.speed_mbps},
        };
        put_optional(json, "eta_seconds", response.eta_seconds);
    }

    void from_json(const nlohmann::json &json, ProgressResponse &response)
    {
        response.bytes_received = json.value("bytes_received", 0ULL);
        response.bytes_remaining = json.value("bytes_remaining", 0ULL);
        response.chunks_received = json.value("chunks_received", 0ULL);
        response.total_chunks = json.value("total_chunks", 0ULL);
        response.percent_complete = json.value("percent_complete", 0.0);
        response.speed_mbps = json.value("speed_mbps", 0.0);
        response.eta_seconds = read_optional<double>(json, "eta_seconds");
    }

    void to_json(nlohmann::json &json, const AbortResponse &response)
    {
        json = {
            {"session_id", response.session_id},
            {"status", response.status},
        };
    }

    void from_json(const nlohmann::json &json, AbortResponse &response)
    {
        response.session_id = json.value("session_id", std::string{});
        response.status = json.value("status", std::string{});
    }

    void to_json(nlohmann::json &json, const DuplicateCheckRequest &request)
    {
        json = {{"sha256_checksum", request.sha256_checksum}};
        put_optional(json, "artifact_id", request.artifact_id);
    }

    void from_json(const nlohmann::json &json, DuplicateCheckRequest &request)
    {
        request.sha256_checksum = json.at("sha256_checksum").get<std::string>();
        request.artifact_id = read_optional<std::string>(json, "artifact_id");
    }

    void to_json(nlohmann::json &json, const DuplicateCheckResponse &response)
    {
        json = {{"is_duplicate", response.is_duplicate}};
        put_optional(json, "existing_file_id", response.existing_file_id);
    }

    void from_json(const nlohmann::json &json, DuplicateCheckResponse &response)
    {
        response.is_duplicate = json.value("is_duplicate", false);
        response.existing_file_id = read_optional<std::string>(json, "existing_file_id");
    }

    void to_json(nlohmann::json &json, const ValidateFileRequest &request)
    {
        json = {
            {"filename", request.filename},
            {"data", request.data_base64},
        };
        put_optional(json, "content_type", request.content_type);
    }

    void from_json(const nlohmann::json &json, ValidateFileRequest &request)
    {
        request.filename = json.at("filename").get<std::string>();
        request.data_base64 = json.value("data", std::string{});
        request.content_type = read_optional<std::string>(json, "content_type");
    }

    void to_json(nlohmann::json &json, const CheckResultEntry &entry)
    {
        json = {
            {"check", entry.check},
            {"passed", entry.passed},
            {"warning", entry.warning},
            {"message", entry.message},
            {"details", entry.details},
        };
    }

    void from_json(const nlohmann::json &json, CheckResultEntry &entry)
    {
        entry.check = json.at("check").get<std::string>();
        entry.passed = json.value("passed", false);
        entry.warning = json.value("warning", false);
        entry.message = json.value("message", std::string{});
        entry.details = json.value("details", nlohmann::json::object());
    }

    void to_json(nlohmann::json &json, const ValidateFileResponse &response)
    {
        json = {
            {"passed", response.passed},
            {"results", response.results},
            {"warnings", response.warnings},
        };
        put_optional(json, "failed_check", response.failed_check);
        put_optional(json, "reason", response.reason);
    }

    void from_json(const nlohmann::json &json, ValidateFileResponse &response)
    {
        response.passed = json.value("passed", false);
        response.results = json.value("results", std::vector<CheckResultEntry>{});
        response.warnings = json.value("warnings", std::vector<std::string>{});
        response.failed_check = read_optional<std::string>(json, "failed_check");
        response.reason = read_optional<std::string>(json, "reason");
    }

    void to_json(nlohmann::json &json, const BatchFile &file)
    {
        json = {
            {"filename", file.filename},
            {"data", file.data_base64},
        };
        put_optional(json, "content_type", file.content_type);
    }

    void from_json(const nlohmann::json &json, BatchFile &file)
    {
        file.filename = json.at("filename").get<std::string>();
        file.data_base64 = json.value("data", std::string{});
        file.content_type = read_optional<std::string>(json, "content_type");
    }

    void to_json(nlohmann::json &json, const BatchUploadRequest &request)
    {
        json = {
            {"artifact_id", request.artifact_id},
            {"files", request.files},
            {"skip_duplicates", request.skip_duplicates},
            {"stop_on_error", request.stop_on_error},
        };
    }

    void from_json(const nlohmann::json &json, BatchUploadRequest &request)
    {
        request.artifact_id = json.at("artifact_id").get<std::string>();
        request.files = json.value("files", std::vector<BatchFile>{});
        request.skip_duplicates = json.value("skip_duplicates", false);
        request.stop_on_error = json.value("stop_on_error", false);
    }

    void to_json(nlohmann::json &json, const BatchFileResult &result)
    {
        json = {
            {"filename", result.filename},
            {"success", result.success},
        };
        put_optional(json, "file_id", result.file_id);
        put_optional(json, "sha256_checksum", result.sha256_checksum);
        put_optional(json, "error_message", result.error_message);
    }

    void from_json(const nlohmann::json &json, BatchFileResult &result)
    {
        result.filename = json.value("filename", std::string{});
        result.success = json.value("success", false);
        result.file_id = read_optional<std::string>(json, "file_id");
        result.sha256_checksum = read_optional<std::string>(json, "sha256_checksum");
        result.error_message = read_optional<std::string>(json, "error_message");
    }

    void to_json(nlohmann::json &json, const BatchUploadResponse &response)
    {
        json = {
            {"batch_id", response.batch_id},
            {"artifact_id", response.artifact_id},
            {"total_files", response.total_files},
            {"successful_count", response.successful_count},
            {"failed_count", response.failed_count},
            {"results", response.results},
        };
    }

    void from_json(const nlohmann::json &json, BatchUploadResponse &response)
    {
        response.batch_id = json.value("batch_id", std::string{});
        response.artifact_id = json.value("artifact_id", std::string{});
        response.total_files = json.value("total_files", 0ULL);
        response.successful_count = json.value("successful_count", 0ULL);
        response.failed_count = json.value("failed_count", 0ULL);
        response.results = json.value("results", std::vector<BatchFileResult>{});
    }

} // namespace artistore::protocol
