#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <span>
#include <string>

namespace artistore::server
{

    // Per-session scratch directory holding accepted chunk payloads until the
    // session is assembled, aborted or expired.
    class ChunkStaging
    {
    public:
        explicit ChunkStaging(std::filesystem::path root);

        // Replaces any earlier payload for the same chunk atomically.
        void write(const std::string &session_id, std::uint64_t chunk_number, std::span<const std::byte> data);

        std::ifstream open(const std::string &session_id, std::uint64_t chunk_number) const;

        std::optional<std::uint64_t> size(const std::string &session_id, std::uint64_t chunk_number) const;

        std::filesystem::path chunk_path(const std::string &session_id, std::uint64_t chunk_number) const;

        std::filesystem::path assembly_path(const std::string &session_id) const;

        bool contains(const std::string &session_id) const;

        void release(const std::string &session_id);

        const std::filesystem::path &root() const noexcept { return staging_root_; }

    private:
        std::filesystem::path session_dir(const std::string &session_id) const;

        std::filesystem::path staging_root_;
    };

} // namespace artistore::server
