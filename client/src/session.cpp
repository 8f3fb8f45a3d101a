#include "artistore/client/session.hpp"

#include <asio/connect.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>

#include <array>
#include <cctype>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "artistore/error_codes.hpp"
#include "artistore/framing.hpp"
#include "artistore/protocol.hpp"

namespace artistore::client
{

    namespace
    {

        std::string trim(const std::string &input)
        {
            const auto begin = input.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
            {
                return "";
            }
            const auto end = input.find_last_not_of(" \t\r\n");
            return input.substr(begin, end - begin + 1);
        }

        std::vector<std::string> split_tokens(const std::string &input)
        {
            std::vector<std::string> tokens;
            std::istringstream iss(input);
            std::string token;
            while (iss >> token)
            {
                tokens.push_back(token);
            }
            return tokens;
        }

        std::string to_upper(std::string value)
        {
            for (auto &ch : value)
            {
                ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
            }
            return value;
        }

    } // namespace

    ClientSession::ClientSession(ClientConfig config, Logger logger)
        : config_(std::move(config)),
          logger_(std::move(logger)),
          state_store_(),
          socket_(io_context_) {}

    int ClientSession::run()
    {
        try
        {
            connect();
            authenticate();
            interactive_shell();
        }
        catch (const std::exception &ex)
        {
            std::cerr << "ERROR: " << ex.what() << std::endl;
            logger_.log("error", "fatal: ", ex.what());
            return 1;
        }
        return 0;
    }

    void ClientSession::connect()
    {
        asio::ip::tcp::resolver resolver(io_context_);
        const auto results = resolver.resolve(config_.host, std::to_string(config_.port));
        asio::connect(socket_, results);
        logger_.log("info", "connected to ", config_.host, ':', config_.port);
    }

    std::string ClientSession::prompt_password(const std::string &username)
    {
        std::string password;
        std::cout << "Password for " << username << ": " << std::flush;
        std::getline(std::cin, password);
        return password;
    }

    bool ClientSession::ask_yes_no(const std::string &question) const
    {
        while (true)
        {
            std::cout << question << " (y/n): " << std::flush;
            std::string answer;
            if (!std::getline(std::cin, answer))
            {
                return false;
            }
            answer = trim(to_upper(answer));
            if (answer == "Y" || answer == "YES")
            {
                return true;
            }
            if (answer == "N" || answer == "NO")
            {
                return false;
            }
            std::cout << "Please answer y or n." << std::endl;
        }
    }

    void ClientSession::authenticate()
    {
        artistore::protocol::AuthenticateRequest request{};
        request.username = config_.username;
        request.password = prompt_password(request.username);

        for (;;)
        {
            auto response = rpc(artistore::protocol::Command::Authenticate, request);
            if (response.kind == artistore::protocol::ResponseKind::Ok)
            {
                const auto auth = response.payload.get<artistore::protocol::AuthenticateResponse>();
                identity_ = auth.identity;
                std::cout << "Logged in as " << identity_ << std::endl;
                logger_.log("info", "authenticated as ", identity_);
                resume_pending_uploads();
                return;
            }

            std::cout << "Authentication failed: " << response.message << std::endl;
            if (request.register_user || !ask_yes_no("Register " + request.username + "?"))
            {
                throw std::runtime_error("Unable to authenticate user");
            }
            request.register_user = true;
            request.password = prompt_password(request.username);
        }
    }

    void ClientSession::interactive_shell()
    {
        while (true)
        {
            std::cout << identity_ << "> " << std::flush;
            std::string line;
            if (!std::getline(std::cin, line))
            {
                std::cout << std::endl;
                break;
            }
            line = trim(line);
            if (line.empty())
            {
                continue;
            }
            logger_.log("cmd", line);

            const auto tokens = split_tokens(line);
            const auto command = to_upper(tokens[0]);
            const std::vector<std::string> args(tokens.begin() + 1, tokens.end());

            if (command == "EXIT" || command == "QUIT")
            {
                std::cout << "OK" << std::endl;
                break;
            }
            if (command == "HELP")
            {
                print_help();
                continue;
            }

            try
            {
                if (!dispatch(command, args))
                {
                    std::cout << "ERROR: unsupported_command" << std::endl;
                }
            }
            catch (const std::exception &ex)
            {
                std::cout << "ERROR: internal_error" << std::endl;
                std::cout << ex.what() << std::endl;
                logger_.log("error", "command failed: ", ex.what());
            }
        }
    }

    void ClientSession::resume_pending_uploads()
    {
        auto pending = state_store_.pending_for_identity(identity_);
        if (pending.empty())
        {
            return;
        }
        if (!ask_yes_no("Incomplete uploads detected, resume?"))
        {
            for (const auto &entry : pending)
            {
                artistore::protocol::SessionRequest abort{.session_id = entry.session_id};
                rpc(artistore::protocol::Command::UploadAbort, abort);
            }
            state_store_.discard_identity(identity_);
            return;
        }
        for (const auto &entry : pending)
        {
            std::cout << "> UPLOAD " << entry.artifact_id << ' ' << entry.local_path.generic_string() << std::endl;
            perform_upload(entry.artifact_id, entry.local_path, std::nullopt);
        }
    }

    bool ClientSession::dispatch(const std::string &command, const std::vector<std::string> &args)
    {
        if (command == "UPLOAD")
        {
            return handle_upload(args);
        }
        if (command == "PROGRESS")
        {
            return handle_progress(args);
        }
        if (command == "ABORT")
        {
            return handle_abort(args);
        }
        if (command == "CHECK")
        {
            return handle_check(args);
        }
        if (command == "VALIDATE")
        {
            return handle_validate(args);
        }
        if (command == "BATCH")
        {
            return handle_batch(args);
        }
        if (command == "PING")
        {
            return handle_ping();
        }
        return false;
    }

    void ClientSession::print_help() const
    {
        std::cout << "Available commands:" << std::endl;
        std::cout << "  HELP                                  Show this help" << std::endl;
        std::cout << "  EXIT                                  Disconnect and exit" << std::endl;
        std::cout << "  UPLOAD <artifact> <file> [type]       Upload a file in chunks (resumable)" << std::endl;
        std::cout << "  PROGRESS <session>                    Show upload progress" << std::endl;
        std::cout << "  ABORT <session>                       Abort an upload session" << std::endl;
        std::cout << "  CHECK <sha256> [artifact]             Ask whether content is already stored" << std::endl;
        std::cout << "  VALIDATE <file> [type]                Run server-side validation on a file" << std::endl;
        std::cout << "  BATCH <artifact> [--skip-duplicates] [--stop-on-error] <files...>" << std::endl;
        std::cout << "                                        Upload several small files at once" << std::endl;
        std::cout << "  PING                                  Check the connection" << std::endl;
        std::cout << "\nFlags:\n";
        std::cout << "  --log <file>              Append structured logs to file\n";
        std::cout << "  --chunk-size <bytes>      Chunk size for UPLOAD\n";
        std::cout << "  --max-upload-rate <bps>   Throttle uploads (bytes per second)\n";
    }

    void ClientSession::print_error(const artistore::protocol::ResponseEnvelope &response) const
    {
        std::cout << "ERROR: " << artistore::to_string(response.error) << " (" << response.status_code << ")"
                  << std::endl;
        if (!response.message.empty())
        {
            std::cout << response.message << std::endl;
        }
    }

    artistore::protocol::ResponseEnvelope ClientSession::rpc(artistore::protocol::Command command,
                                                             const nlohmann::json &payload)
    {
        artistore::protocol::RequestEnvelope envelope;
        envelope.command = command;
        envelope.payload = payload;
        envelope.request_id = next_request_id();

        const auto frame = artistore::protocol::encode_frame(nlohmann::json(envelope));
        asio::write(socket_, asio::buffer(frame));

        std::array<std::uint8_t, artistore::protocol::kFrameHeaderSize> header{};
        asio::read(socket_, asio::buffer(header));
        const auto size = artistore::protocol::decode_frame_length(header);
        std::vector<char> buffer(size);
        asio::read(socket_, asio::buffer(buffer.data(), buffer.size()));

        nlohmann::json json_response;
        try
        {
            json_response = nlohmann::json::parse(std::string(buffer.begin(), buffer.end()));
        }
        catch (const std::exception &ex)
        {
            logger_.log("rpc", "parse_error size=", size, " msg=", ex.what());
            throw std::runtime_error("Failed to decode server response");
        }
        auto response = json_response.get<artistore::protocol::ResponseEnvelope>();
        if (response.kind == artistore::protocol::ResponseKind::Error)
        {
            logger_.log("rpc", "error=", artistore::to_string(response.error), " msg=", response.message);
        }
        else
        {
            logger_.log("rpc", "success cmd=", artistore::protocol::to_string(command));
        }
        return response;
    }

    std::string ClientSession::next_request_id()
    {
        std::ostringstream oss;
        oss << "req-" << (++request_counter_);
        return oss.str();
    }

} // namespace artistore::client
