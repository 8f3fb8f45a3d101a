#include "artistore/identifiers.hpp"

#include <array>
#include <cstdint>

#include <sodium.h>

#include "artistore/crypto.hpp"

namespace artistore
{

    namespace
    {
        constexpr std::string_view kCrockford = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";
        constexpr std::size_t kUlidLength = 26;
    } // namespace

    std::string generate_ulid(std::chrono::system_clock::time_point now)
    {
        crypto::ensure_sodium_init();

        const auto millis = static_cast<std::uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count());

        // 6 timestamp bytes + 10 random bytes, big endian
        std::array<unsigned char, 16> raw{};
        for (int i = 0; i < 6; ++i)
        {
            raw[static_cast<std::size_t>(i)] = static_cast<unsigned char>((millis >> (8 * (5 - i))) & 0xFF);
        }
        randombytes_buf(raw.data() + 6, 10);

        // 128 bits encode to 26 symbols; the first symbol carries the top 3 bits.
        std::string result(kUlidLength, '0');
        std::uint32_t buffer = 0;
        int bits = 2; // pad so the total (130) is a multiple of 5
        std::size_t out = 0;
        for (const auto byte : raw)
        {
            buffer = (buffer << 8) | byte;
            bits += 8;
            while (bits >= 5)
            {
                bits -= 5;
                result[out++] = kCrockford[(buffer >> bits) & 0x1F];
            }
        }
        return result;
    }

    bool is_ulid(std::string_view value) noexcept
    {
        if (value.size() != kUlidLength)
        {
            return false;
        }
        if (value.front() > '7')
        {
            return false;
        }
        for (const char ch : value)
        {
            if (kCrockford.find(ch) == std::string_view::npos)
            {
                return false;
            }
        }
        return true;
    }

} // namespace artistore
