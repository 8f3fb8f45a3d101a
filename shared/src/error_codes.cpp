#include "artistore/error_codes.hpp"

#include <array>

namespace artistore
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
            std::uint16_t status;
        };

        constexpr std::array<ErrorCodeDescription, 19> kDescriptions{{
            {ErrorCode::Ok, "ok", 200},
            {ErrorCode::InvalidParameters, "invalid_parameters", 400},
            {ErrorCode::NotFound, "not_found", 404},
            {ErrorCode::SessionExpired, "session_expired", 410},
            {ErrorCode::OutOfRange, "out_of_range", 400},
            {ErrorCode::SizeMismatch, "size_mismatch", 400},
            {ErrorCode::ChecksumMismatch, "checksum_mismatch", 422},
            {ErrorCode::PayloadTooLarge, "payload_too_large", 413},
            {ErrorCode::IncompleteUpload, "incomplete_upload", 409},
            {ErrorCode::IntegrityCheckFailed, "integrity_check_failed", 422},
            {ErrorCode::ValidationFailed, "validation_failed", 422},
            {ErrorCode::InvalidState, "invalid_state", 409},
            {ErrorCode::AuthenticationRequired, "authentication_required", 403},
            {ErrorCode::AuthenticationFailed, "authentication_failed", 403},
            {ErrorCode::InvalidCommand, "invalid_command", 400},
            {ErrorCode::InvalidPayload, "invalid_payload", 400},
            {ErrorCode::Unsupported, "unsupported", 501},
            {ErrorCode::InternalError, "internal_error", 500},
            {ErrorCode::SessionClosed, "session_closed", 410},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (static_cast<std::uint16_t>(entry.code) == value)
            {
                return entry.code;
            }
        }
        return ErrorCode::InternalError;
    }

    std::uint16_t status_code(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.status;
            }
        }
        return 500;
    }

} // namespace artistore
