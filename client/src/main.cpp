#include <cstdlib>
#include <iostream>

#include "artistore/client/config.hpp"
#include "artistore/client/logger.hpp"
#include "artistore/client/session.hpp"
#include "artistore/version.hpp"

int main(int argc, char *argv[])
{
    using artistore::client::ClientSession;
    using artistore::client::Logger;

    try
    {
        const auto config = artistore::client::parse_arguments(argc, argv);
        Logger logger(config.log_path);
        logger.log("info", "artistore client ", artistore::version());
        ClientSession session(config, std::move(logger));
        return session.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
}
