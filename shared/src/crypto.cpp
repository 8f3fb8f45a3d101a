#include "artistore/crypto.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstring>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace artistore::crypto
{

    namespace
    {

        void throw_if_sodium_init_failed(int status)
        {
            if (status < 0)
            {
                throw std::runtime_error("libsodium initialization failed");
            }
        }

        std::once_flag &sodium_once_flag()
        {
            static std::once_flag flag;
            return flag;
        }

        void ensure_initialized_once()
        {
            std::call_once(sodium_once_flag(), []()
                           { throw_if_sodium_init_failed(sodium_init()); });
        }

        const unsigned char *as_uchar(std::span<const std::byte> data)
        {
            return reinterpret_cast<const unsigned char *>(data.data());
        }

    } // namespace

    void ensure_sodium_init()
    {
        ensure_initialized_once();
    }

    std::string to_hex(std::span<const unsigned char> data)
    {
        static constexpr char kHexDigits[] = "0123456789abcdef";
        std::string result;
        result.resize(data.size() * 2);
        for (std::size_t i = 0; i < data.size(); ++i)
        {
            const auto byte = data[i];
            result[2 * i] = kHexDigits[(byte >> 4) & 0x0F];
            result[2 * i + 1] = kHexDigits[byte & 0x0F];
        }
        return result;
    }

    std::string hash_password(std::string_view password)
    {
        ensure_initialized_once();
        std::string hash;
        hash.resize(crypto_pwhash_STRBYTES);
        if (crypto_pwhash_str(hash.data(), password.data(), password.size(), crypto_pwhash_OPSLIMIT_INTERACTIVE,
                              crypto_pwhash_MEMLIMIT_INTERACTIVE) != 0)
        {
            throw std::runtime_error("crypto_pwhash_str failed");
        }
        hash.resize(std::strlen(hash.c_str()));
        return hash;
    }

    bool verify_password(std::string_view password, std::string_view password_hash)
    {
        ensure_initialized_once();
        const std::string hash_string(password_hash);
        return crypto_pwhash_str_verify(hash_string.c_str(), password.data(), password.size()) == 0;
    }

    std::string sha256_hex(std::span<const std::byte> data)
    {
        ensure_initialized_once();
        std::array<unsigned char, crypto_hash_sha256_BYTES> digest{};
        if (crypto_hash_sha256(digest.data(), as_uchar(data), data.size()) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256 failed");
        }
        return to_hex(digest);
    }

    std::string fast_checksum(std::span<const std::byte> data)
    {
        ensure_initialized_once();
        std::array<unsigned char, kFastChecksumBytes> digest{};
        if (crypto_generichash(digest.data(), digest.size(), as_uchar(data), data.size(), nullptr, 0) != 0)
        {
            throw std::runtime_error("crypto_generichash failed");
        }
        return to_hex(digest);
    }

    Digests hash_stream(std::istream &input)
    {
        DualHasher hasher;
        std::vector<std::byte> buffer(64 * 1024);
        while (input)
        {
            input.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
            const auto read_count = static_cast<std::size_t>(input.gcount());
            if (read_count > 0)
            {
                hasher.update(std::span<const std::byte>(buffer.data(), read_count));
            }
        }
        return hasher.finish();
    }

    Digests hash_file(const std::filesystem::path &path)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
        {
            throw std::runtime_error("Failed to open file for hashing: " + path.string());
        }
        return hash_stream(file);
    }

    std::string normalize_digest(std::string_view digest)
    {
        std::string result(digest);
        std::transform(result.begin(), result.end(), result.begin(), [](unsigned char ch)
                       { return static_cast<char>(std::tolower(ch)); });
        return result;
    }

    bool is_sha256_hex(std::string_view digest) noexcept
    {
        if (digest.size() != kSha256HexLength)
        {
            return false;
        }
        return std::all_of(digest.begin(), digest.end(), [](unsigned char ch)
                           { return std::isxdigit(ch) != 0; });
    }

    DualHasher::DualHasher()
    {
        ensure_initialized_once();
        if (crypto_hash_sha256_init(&sha256_) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256_init failed");
        }
        if (crypto_generichash_init(&fast_, nullptr, 0, kFastChecksumBytes) != 0)
        {
            throw std::runtime_error("crypto_generichash_init failed");
        }
    }

    void DualHasher::update(std::span<const std::byte> data)
    {
        if (finished_)
        {
            throw std::logic_error("DualHasher updated after finish");
        }
        if (data.empty())
        {
            return;
        }
        if (crypto_hash_sha256_update(&sha256_, as_uchar(data), data.size()) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256_update failed");
        }
        if (crypto_generichash_update(&fast_, as_uchar(data), data.size()) != 0)
        {
            throw std::runtime_error("crypto_generichash_update failed");
        }
        bytes_ += static_cast<std::uint64_t>(data.size());
    }

    Digests DualHasher::finish()
    {
        if (finished_)
        {
            throw std::logic_error("DualHasher finished twice");
        }
        finished_ = true;

        std::array<unsigned char, crypto_hash_sha256_BYTES> strong{};
        if (crypto_hash_sha256_final(&sha256_, strong.data()) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256_final failed");
        }
        std::array<unsigned char, kFastChecksumBytes> fast{};
        if (crypto_generichash_final(&fast_, fast.data(), fast.size()) != 0)
        {
            throw std::runtime_error("crypto_generichash_final failed");
        }
        return Digests{.sha256 = to_hex(strong), .fast = to_hex(fast), .bytes = bytes_};
    }

} // namespace artistore::crypto
