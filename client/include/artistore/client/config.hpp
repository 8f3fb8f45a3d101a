#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace artistore::client
{

    struct ClientConfig
    {
        std::string username;
        std::string host;
        std::uint16_t port{};
        std::optional<std::filesystem::path> log_path;
        std::uint64_t chunk_size{5'000'000};
        std::optional<std::size_t> max_upload_rate;
    };

    ClientConfig parse_arguments(int argc, char *argv[]);

} // namespace artistore::client
