/**
 * artistore - Error codes shared by the upload core, the server and the client.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace artistore
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidParameters = 1,
        NotFound = 2,
        SessionExpired = 3,
        OutOfRange = 4,
        SizeMismatch = 5,
        ChecksumMismatch = 6,
        PayloadTooLarge = 7,
        IncompleteUpload = 8,
        IntegrityCheckFailed = 9,
        ValidationFailed = 10,
        InvalidState = 11,
        AuthenticationRequired = 12,
        AuthenticationFailed = 13,
        InvalidCommand = 14,
        InvalidPayload = 15,
        Unsupported = 16,
        InternalError = 17,
        SessionClosed = 18
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

    // HTTP-style status reported next to the code so callers can branch on the
    // failure class without knowing every code.
    std::uint16_t status_code(ErrorCode code) noexcept;

} // namespace artistore
