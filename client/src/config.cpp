#include "artistore/client/config.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>

namespace artistore::client
{

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        if (argc < 2)
        {
            throw std::runtime_error(
                "Usage: artistore-client <username>@<server>:<port> [--log <file>] [--chunk-size <bytes>] "
                "[--max-upload-rate <bps>]");
        }

        ClientConfig config;
        int index = 1;
        const std::string endpoint = argv[index++];

        const auto at_pos = endpoint.find('@');
        if (at_pos == std::string::npos || at_pos == 0)
        {
            throw std::runtime_error("Expected endpoint format username@host:port");
        }
        config.username = endpoint.substr(0, at_pos);
        const std::string host_part = endpoint.substr(at_pos + 1);

        const auto colon_pos = host_part.rfind(':');
        if (colon_pos == std::string::npos)
        {
            throw std::runtime_error("Expected endpoint format username@host:port");
        }
        config.host = host_part.substr(0, colon_pos);
        config.port = static_cast<std::uint16_t>(std::stoi(host_part.substr(colon_pos + 1)));

        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (index >= argc)
            {
                throw std::runtime_error(arg + " requires a value");
            }
            if (arg == "--log")
            {
                config.log_path = std::filesystem::path(argv[index++]);
            }
            else if (arg == "--chunk-size")
            {
                config.chunk_size = std::stoull(argv[index++]);
            }
            else if (arg == "--max-upload-rate")
            {
                config.max_upload_rate = static_cast<std::size_t>(std::stoull(argv[index++]));
            }
            else
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
        }

        return config;
    }

} // namespace artistore::client
