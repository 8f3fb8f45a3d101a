#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace artistore::server
{

    struct UploadLimits
    {
        std::uint64_t min_chunk_size{262'144};
        std::uint64_t max_chunk_size{104'857'600};
        std::uint64_t max_chunks{10'000};
        std::uint64_t max_object_size{100'000'000'000ULL};
        std::chrono::seconds session_ttl{std::chrono::hours{24}};
        std::chrono::seconds throughput_window{30};
        std::size_t batch_max_files{50};
        std::uint64_t batch_max_file_size{1'000'000'000ULL};
        std::size_t max_filename_length{255};
    };

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{0};
        std::filesystem::path root;
        std::size_t worker_threads{0};
        std::optional<std::filesystem::path> log_file;
        bool verbose{false};
        UploadLimits limits{};
        std::chrono::seconds reap_interval{60};
        std::chrono::seconds finalize_grace{std::chrono::hours{1}};
        std::size_t max_frame_size{160u * 1024u * 1024u};
        bool malware_scan{true};
    };

} // namespace artistore::server
