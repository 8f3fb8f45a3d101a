#pragma once

#include <asio.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "artistore/client/config.hpp"
#include "artistore/client/logger.hpp"
#include "artistore/client/transfer_state_store.hpp"
#include "artistore/protocol.hpp"

namespace artistore::client
{

    class ClientSession
    {
    public:
        ClientSession(ClientConfig config, Logger logger);

        int run();

    private:
        void connect();
        static std::string prompt_password(const std::string &username);
        bool ask_yes_no(const std::string &question) const;
        void authenticate();
        void interactive_shell();
        void resume_pending_uploads();
        bool dispatch(const std::string &command, const std::vector<std::string> &args);

        bool handle_upload(const std::vector<std::string> &args);
        bool handle_progress(const std::vector<std::string> &args);
        bool handle_abort(const std::vector<std::string> &args);
        bool handle_check(const std::vector<std::string> &args);
        bool handle_validate(const std::vector<std::string> &args);
        bool handle_batch(const std::vector<std::string> &args);
        bool handle_ping();

        bool perform_upload(const std::string &artifact_id, const std::filesystem::path &local_path,
                            const std::optional<std::string> &content_type);
        std::optional<TransferStateStore::Entry> open_session(const std::string &artifact_id,
                                                              const std::filesystem::path &local_path,
                                                              std::uint64_t file_size, const std::string &sha256,
                                                              const std::optional<std::string> &content_type);
        bool session_still_active(const std::string &session_id);

        artistore::protocol::ResponseEnvelope rpc(artistore::protocol::Command command,
                                                  const nlohmann::json &payload = nlohmann::json::object());
        void print_help() const;
        void print_error(const artistore::protocol::ResponseEnvelope &response) const;
        std::string next_request_id();

        ClientConfig config_;
        Logger logger_;
        TransferStateStore state_store_;
        asio::io_context io_context_;
        asio::ip::tcp::socket socket_;
        std::string identity_;
        std::uint64_t request_counter_{0};
    };

} // namespace artistore::client
