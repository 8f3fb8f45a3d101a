#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>
#include <memory>
#include <thread>
#include <vector>

#include "artistore/server/config.hpp"
#include "artistore/server/credential_store.hpp"
#include "artistore/server/upload_service.hpp"

namespace artistore::server
{

    class Server
    {
    public:
        explicit Server(ServerConfig config);

        void run();

    private:
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);
        void handle_signal();

        ServerConfig config_;
        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;

        CredentialStore credentials_;
        UploadService uploads_;

        std::vector<std::thread> workers_;
    };

} // namespace artistore::server
