#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "artistore/server/server.hpp"
#include "artistore/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    void print_usage(const char *program_name)
    {
        std::cout << "artistore upload server " << artistore::version() << "\n"
                  << "Usage: " << program_name
                  << " --port <PORT> --root <ROOT> [--address <ADDRESS>] [--threads <N>] [--log <FILE>]\n"
                     "       [--session-ttl <seconds>] [--reap-interval <seconds>] [--finalize-grace <seconds>]\n"
                     "       [--max-object-size <bytes>] [--max-frame <bytes>] [--no-malware-scan] [--verbose]\n";
    }

    std::optional<std::string> read_option(int &index, int argc, char *argv[])
    {
        if (index + 1 >= argc)
        {
            return std::nullopt;
        }
        ++index;
        return std::string(argv[index]);
    }

    std::optional<std::uint64_t> parse_unsigned(const std::string &value)
    {
        try
        {
            std::size_t consumed = 0;
            const auto parsed = std::stoull(value, &consumed);
            if (consumed != value.size())
            {
                return std::nullopt;
            }
            return parsed;
        }
        catch (const std::exception &)
        {
            return std::nullopt;
        }
    }

} // namespace

int main(int argc, char *argv[])
{
    using artistore::server::Server;
    using artistore::server::ServerConfig;

    ServerConfig config;

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        }
        if (arg == "--no-malware-scan")
        {
            config.malware_scan = false;
            continue;
        }
        if (arg == "--verbose")
        {
            config.verbose = true;
            continue;
        }

        auto value = read_option(i, argc, argv);
        if (!value)
        {
            std::cerr << "Missing value for " << arg << std::endl;
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }

        if (arg == "--root")
        {
            config.root = std::filesystem::path(*value);
            continue;
        }
        if (arg == "--address")
        {
            config.address = *value;
            continue;
        }
        if (arg == "--log")
        {
            config.log_file = std::filesystem::path(*value);
            continue;
        }

        const auto number = parse_unsigned(*value);
        if (!number)
        {
            std::cerr << "Invalid value for " << arg << ": " << *value << std::endl;
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }

        if (arg == "--port")
        {
            config.port = static_cast<std::uint16_t>(*number);
        }
        else if (arg == "--threads")
        {
            config.worker_threads = static_cast<std::size_t>(*number);
        }
        else if (arg == "--session-ttl")
        {
            config.limits.session_ttl = std::chrono::seconds(*number);
        }
        else if (arg == "--reap-interval")
        {
            config.reap_interval = std::chrono::seconds(*number);
        }
        else if (arg == "--finalize-grace")
        {
            config.finalize_grace = std::chrono::seconds(*number);
        }
        else if (arg == "--max-object-size")
        {
            config.limits.max_object_size = *number;
        }
        else if (arg == "--max-frame")
        {
            config.max_frame_size = static_cast<std::size_t>(*number);
        }
        else
        {
            std::cerr << "Unknown argument: " << arg << std::endl;
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }
    }

    if (config.port == 0 || config.root.empty())
    {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }
    if (config.reap_interval.count() == 0)
    {
        std::cerr << "--reap-interval must be positive" << std::endl;
        return EXIT_FAILURE;
    }

    try
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), true));
        }
        auto logger = std::make_shared<spdlog::logger>("server", sinks.begin(), sinks.end());
        logger->set_level(config.verbose ? spdlog::level::debug : spdlog::level::info);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
        spdlog::info("Starting artistore upload server {} on {}:{}", artistore::version(), config.address, config.port);

        Server server(std::move(config));
        server.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Server failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
