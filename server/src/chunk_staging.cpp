#include "artistore/server/chunk_staging.hpp"

#include <stdexcept>
#include <system_error>

#include <spdlog/spdlog.h>

namespace artistore::server
{

    namespace
    {
        constexpr auto kStagingDir = ".artistore/staging";
        constexpr auto kAssemblyName = "assembled.bin";
    } // namespace

    ChunkStaging::ChunkStaging(std::filesystem::path root)
        : staging_root_(std::move(root) / kStagingDir)
    {
        std::filesystem::create_directories(staging_root_);
    }

    void ChunkStaging::write(const std::string &session_id, std::uint64_t chunk_number,
                             std::span<const std::byte> data)
    {
        const auto directory = session_dir(session_id);
        std::filesystem::create_directories(directory);

        const auto final_path = chunk_path(session_id, chunk_number);
        auto temp_path = final_path;
        temp_path += ".tmp";
        {
            std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                throw std::runtime_error("Failed to open staging file: " + temp_path.string());
            }
            out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
            out.flush();
            if (!out)
            {
                throw std::runtime_error("Failed to write staging file: " + temp_path.string());
            }
        }
        std::filesystem::rename(temp_path, final_path);
    }

    std::ifstream ChunkStaging::open(const std::string &session_id, std::uint64_t chunk_number) const
    {
        const auto path = chunk_path(session_id, chunk_number);
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open())
        {
            throw std::runtime_error("Missing staged chunk: " + path.string());
        }
        return in;
    }

    std::optional<std::uint64_t> ChunkStaging::size(const std::string &session_id, std::uint64_t chunk_number) const
    {
        std::error_code ec;
        const auto bytes = std::filesystem::file_size(chunk_path(session_id, chunk_number), ec);
        if (ec)
        {
            return std::nullopt;
        }
        return static_cast<std::uint64_t>(bytes);
    }

    std::filesystem::path ChunkStaging::chunk_path(const std::string &session_id, std::uint64_t chunk_number) const
    {
        return session_dir(session_id) / (std::to_string(chunk_number) + ".part");
    }

    std::filesystem::path ChunkStaging::assembly_path(const std::string &session_id) const
    {
        return session_dir(session_id) / kAssemblyName;
    }

    bool ChunkStaging::contains(const std::string &session_id) const
    {
        std::error_code ec;
        return std::filesystem::exists(session_dir(session_id), ec);
    }

    void ChunkStaging::release(const std::string &session_id)
    {
        std::error_code ec;
        const auto removed = std::filesystem::remove_all(session_dir(session_id), ec);
        if (ec)
        {
            spdlog::error("Failed to release staging for session {}: {}", session_id, ec.message());
            return;
        }
        if (removed > 0)
        {
            spdlog::debug("Released {} staged entries for session {}", removed, session_id);
        }
    }

    std::filesystem::path ChunkStaging::session_dir(const std::string &session_id) const
    {
        return staging_root_ / session_id;
    }

} // namespace artistore::server
