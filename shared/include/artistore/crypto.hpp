/**
 * artistore - Hash engine and credential helpers built on libsodium.
 *
 * Two digests are produced for every object: the strong digest (SHA-256),
 * which clients assert and the duplicate index is keyed by, and a fast
 * checksum (BLAKE2b-128) kept alongside finalized files for cheap re-checks.
 * All digests are lowercase hex.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <span>
#include <string>
#include <string_view>

#include <sodium.h>

namespace artistore::crypto
{

    inline constexpr std::size_t kSha256HexLength = 64;
    inline constexpr std::size_t kFastChecksumBytes = 16;

    struct Digests
    {
        std::string sha256;
        std::string fast;
        std::uint64_t bytes{};
    };

    void ensure_sodium_init();

    std::string hash_password(std::string_view password);

    bool verify_password(std::string_view password, std::string_view password_hash);

    std::string sha256_hex(std::span<const std::byte> data);

    std::string fast_checksum(std::span<const std::byte> data);

    Digests hash_stream(std::istream &input);

    Digests hash_file(const std::filesystem::path &path);

    // Lowercases a client-supplied digest; the comparison side of every check.
    std::string normalize_digest(std::string_view digest);

    bool is_sha256_hex(std::string_view digest) noexcept;

    std::string to_hex(std::span<const unsigned char> data);

    // Incremental SHA-256 + BLAKE2b over a stream of buffers.
    class DualHasher
    {
    public:
        DualHasher();

        void update(std::span<const std::byte> data);

        std::uint64_t bytes() const noexcept { return bytes_; }

        Digests finish();

    private:
        crypto_hash_sha256_state sha256_{};
        crypto_generichash_state fast_{};
        std::uint64_t bytes_{};
        bool finished_{false};
    };

} // namespace artistore::crypto
