#include "artistore/server/upload_session.hpp"

#include <array>
#include <stdexcept>

namespace artistore::server
{

    namespace
    {

        struct StatusMapping
        {
            SessionStatus status;
            std::string_view label;
        };

        constexpr std::array<StatusMapping, 5> kStatusMappings{{
            {SessionStatus::Active, "ACTIVE"},
            {SessionStatus::Finalizing, "FINALIZING"},
            {SessionStatus::Complete, "COMPLETE"},
            {SessionStatus::Expired, "EXPIRED"},
            {SessionStatus::Aborted, "ABORTED"},
        }};

    } // namespace

    std::string_view to_string(SessionStatus status) noexcept
    {
        for (const auto &mapping : kStatusMappings)
        {
            if (mapping.status == status)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<SessionStatus> session_status_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kStatusMappings)
        {
            if (mapping.label == value)
            {
                return mapping.status;
            }
        }
        return std::nullopt;
    }

    bool is_legal_transition(SessionStatus from, SessionStatus to) noexcept
    {
        switch (from)
        {
        case SessionStatus::Active:
            return to == SessionStatus::Finalizing || to == SessionStatus::Expired || to == SessionStatus::Aborted;
        case SessionStatus::Finalizing:
            return to == SessionStatus::Complete || to == SessionStatus::Active;
        default:
            return false;
        }
    }

    bool is_terminal(SessionStatus status) noexcept
    {
        return status == SessionStatus::Complete || status == SessionStatus::Expired ||
               status == SessionStatus::Aborted;
    }

    std::uint64_t UploadSession::last_chunk_size() const noexcept
    {
        if (declared_total_chunks == 0)
        {
            return 0;
        }
        return declared_total_size - chunk_size_bytes * (declared_total_chunks - 1);
    }

    std::uint64_t UploadSession::expected_chunk_size(std::uint64_t chunk_number) const noexcept
    {
        return chunk_number + 1 == declared_total_chunks ? last_chunk_size() : chunk_size_bytes;
    }

    std::uint64_t chunk_count_for(std::uint64_t total_size, std::uint64_t chunk_size) noexcept
    {
        if (chunk_size == 0)
        {
            return 0;
        }
        return total_size / chunk_size + (total_size % chunk_size == 0 ? 0 : 1);
    }

    nlohmann::json to_json(const ChunkRecord &record)
    {
        return {
            {"chunk_number", record.chunk_number},
            {"size_bytes", record.size_bytes},
            {"strong_digest", record.strong_digest},
            {"received_at", to_unix_seconds(record.received_at)},
        };
    }

    ChunkRecord chunk_record_from_json(const nlohmann::json &json)
    {
        ChunkRecord record{};
        record.chunk_number = json.at("chunk_number").get<std::uint64_t>();
        record.size_bytes = json.at("size_bytes").get<std::uint64_t>();
        record.strong_digest = json.at("strong_digest").get<std::string>();
        record.received_at = from_unix_seconds(json.value("received_at", 0LL));
        return record;
    }

    nlohmann::json to_json(const FinalizedFile &file)
    {
        return {
            {"file_id", file.file_id},
            {"artifact_id", file.artifact_id},
            {"filename", file.filename},
            {"size_bytes", file.size_bytes},
            {"strong_digest", file.strong_digest},
            {"fast_checksum", file.fast_checksum},
            {"version", file.version},
            {"download_location", file.download_location},
            {"created_at", to_unix_seconds(file.created_at)},
        };
    }

    FinalizedFile finalized_file_from_json(const nlohmann::json &json)
    {
        FinalizedFile file{};
        file.file_id = json.at("file_id").get<std::string>();
        file.artifact_id = json.at("artifact_id").get<std::string>();
        file.filename = json.value("filename", std::string{});
        file.size_bytes = json.value("size_bytes", 0ULL);
        file.strong_digest = json.at("strong_digest").get<std::string>();
        file.fast_checksum = json.value("fast_checksum", std::string{});
        file.version = json.value("version", 0ULL);
        file.download_location = json.value("download_location", std::string{});
        file.created_at = from_unix_seconds(json.value("created_at", 0LL));
        return file;
    }

    nlohmann::json to_json(const UploadSession &session)
    {
        auto chunks = nlohmann::json::array();
        for (const auto &[number, record] : session.received_chunks)
        {
            chunks.push_back(to_json(record));
        }
        nlohmann::json json = {
            {"session_id", session.session_id},
            {"artifact_id", session.artifact_id},
            {"filename", session.filename},
            {"content_type", session.content_type},
            {"declared_total_size", session.declared_total_size},
            {"declared_total_chunks", session.declared_total_chunks},
            {"chunk_size_bytes", session.chunk_size_bytes},
            {"received_chunks", std::move(chunks)},
            {"bytes_received", session.bytes_received},
            {"created_at", to_unix_seconds(session.created_at)},
            {"expires_at", to_unix_seconds(session.expires_at)},
            {"updated_at", to_unix_seconds(session.updated_at)},
            {"status", to_string(session.status)},
            {"deduplicated", session.deduplicated},
        };
        if (session.result)
        {
            json["result"] = to_json(*session.result);
        }
        return json;
    }

    UploadSession upload_session_from_json(const nlohmann::json &json)
    {
        UploadSession session{};
        session.session_id = json.at("session_id").get<std::string>();
        session.artifact_id = json.at("artifact_id").get<std::string>();
        session.filename = json.at("filename").get<std::string>();
        session.content_type = json.value("content_type", std::string{});
        session.declared_total_size = json.at("declared_total_size").get<std::uint64_t>();
        session.declared_total_chunks = json.at("declared_total_chunks").get<std::uint64_t>();
        session.chunk_size_bytes = json.at("chunk_size_bytes").get<std::uint64_t>();
        for (const auto &item : json.value("received_chunks", nlohmann::json::array()))
        {
            auto record = chunk_record_from_json(item);
            session.received_chunks.emplace(record.chunk_number, std::move(record));
        }
        session.bytes_received = json.value("bytes_received", 0ULL);
        session.created_at = from_unix_seconds(json.value("created_at", 0LL));
        session.expires_at = from_unix_seconds(json.value("expires_at", 0LL));
        session.updated_at = from_unix_seconds(json.value("updated_at", 0LL));
        const auto status_label = json.value("status", std::string{"ACTIVE"});
        const auto status = session_status_from_string(status_label);
        if (!status)
        {
            throw std::runtime_error("Unknown session status: " + status_label);
        }
        session.status = *status;
        session.deduplicated = json.value("deduplicated", false);
        if (auto it = json.find("result"); it != json.end() && it->is_object())
        {
            session.result = finalized_file_from_json(*it);
        }
        return session;
    }

} // namespace artistore::server
