#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace artistore
{

    // 26-character Crockford base32 ULID: 48-bit millisecond timestamp followed
    // by 80 random bits. Identifiers sort by creation time.
    std::string generate_ulid(std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    bool is_ulid(std::string_view value) noexcept;

} // namespace artistore
