#include "artistore/server/connection.hpp"

#include <asio/read.hpp>
#include <asio/write.hpp>
#include <nlohmann/json.hpp>

#include <span>
#include <stdexcept>
#include <string>

#include "artistore/error_codes.hpp"
#include "artistore/framing.hpp"
#include "connection_common.hpp"

#include <spdlog/spdlog.h>

namespace artistore::server
{

    Connection::Connection(asio::ip::tcp::socket socket, ServerServices services)
        : socket_(std::move(socket)), services_(services) {}

    Connection::~Connection() = default;

    void Connection::start()
    {
        spdlog::info("Client connected from {}", remote_endpoint());
        read_frame_header();
    }

    void Connection::stop()
    {
        if (!socket_.is_open())
        {
            return;
        }
        std::error_code ec;
        spdlog::info("Closing connection for {}", remote_endpoint());
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

    void Connection::read_frame_header()
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(header_buffer_),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             const std::uint32_t payload_size = artistore::protocol::decode_frame_length(header_buffer_);
                             if (payload_size == 0)
                             {
                                 read_frame_header();
                                 return;
                             }
                             if (payload_size > services_.max_frame_size)
                             {
                                 spdlog::warn("{} announced a {} byte frame (limit {})", remote_endpoint(), payload_size,
                                              services_.max_frame_size);
                                 close_after_error(artistore::ErrorCode::PayloadTooLarge,
                                                   "Frame of " + std::to_string(payload_size) +
                                                       " bytes exceeds the limit of " +
                                                       std::to_string(services_.max_frame_size));
                                 return;
                             }
                             buffer_.resize(payload_size);
                             read_frame_payload(payload_size);
                         });
    }

    void Connection::read_frame_payload(std::size_t size)
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(buffer_.data(), size),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             try
                             {
                                 const std::string payload(reinterpret_cast<const char *>(buffer_.data()), buffer_.size());
                                 const auto json = nlohmann::json::parse(payload);
                                 process_message(json);
                             }
                             catch (const std::exception &ex)
                             {
                                 send_error(artistore::ErrorCode::InvalidPayload, ex.what());
                             }
                             buffer_.clear();
                             buffer_.shrink_to_fit();
                             read_frame_header();
                         });
    }

    void Connection::process_message(const nlohmann::json &json)
    {
        artistore::protocol::RequestEnvelope envelope;
        try
        {
            envelope = json.get<artistore::protocol::RequestEnvelope>();
        }
        catch (const std::exception &ex)
        {
            send_error(artistore::ErrorCode::InvalidCommand, ex.what());
            return;
        }

        spdlog::debug("{} -> command {}", remote_endpoint(), artistore::protocol::to_string(envelope.command));

        switch (envelope.command)
        {
        case artistore::protocol::Command::Authenticate:
            handle_authenticate(envelope);
            break;
        case artistore::protocol::Command::Ping:
            handle_ping(envelope);
            break;
        case artistore::protocol::Command::UploadInit:
            handle_upload_init(envelope);
            break;
        case artistore::protocol::Command::UploadChunk:
            handle_upload_chunk(envelope);
            break;
        case artistore::protocol::Command::UploadFinalize:
            handle_upload_finalize(envelope);
            break;
        case artistore::protocol::Command::UploadProgress:
            handle_upload_progress(envelope);
            break;
        case artistore::protocol::Command::UploadAbort:
            handle_upload_abort(envelope);
            break;
        case artistore::protocol::Command::CheckDuplicate:
            handle_check_duplicate(envelope);
            break;
        case artistore::protocol::Command::ValidateFile:
            handle_validate_file(envelope);
            break;
        case artistore::protocol::Command::UploadBatch:
            handle_upload_batch(envelope);
            break;
        default:
            send_error(artistore::ErrorCode::Unsupported, "Command not supported", envelope.request_id);
            break;
        }
    }

    void Connection::send_response(const artistore::protocol::ResponseEnvelope &envelope)
    {
        try
        {
            const auto json = nlohmann::json(envelope);
            auto frame = std::make_shared<std::vector<std::uint8_t>>(artistore::protocol::encode_frame(json));
            auto self = shared_from_this();
            asio::async_write(socket_, asio::buffer(*frame),
                              [this, self, frame](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                              {
                                  if (ec || closing_)
                                  {
                                      stop();
                                  }
                              });
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Failed to encode response for {}: {}", remote_endpoint(), ex.what());
            stop();
        }
    }

    void Connection::send_error(artistore::ErrorCode code, std::string message, std::optional<std::string> request_id)
    {
        send_response(connection_common::make_error_response(artistore::make_error(code, std::move(message)),
                                                             request_id));
    }

    void Connection::close_after_error(artistore::ErrorCode code, std::string message)
    {
        closing_ = true;
        send_error(code, std::move(message));
    }

    bool Connection::require_authentication(const artistore::protocol::RequestEnvelope &envelope)
    {
        if (authenticated_)
        {
            return true;
        }
        send_error(artistore::ErrorCode::AuthenticationRequired, "Authentication required", envelope.request_id);
        return false;
    }

    void Connection::handle_ping(const artistore::protocol::RequestEnvelope &envelope)
    {
        send_response(connection_common::make_ok_response(nlohmann::json::object(), envelope.request_id));
    }

    std::string Connection::remote_endpoint() const
    {
        std::error_code ec;
        const auto endpoint = socket_.remote_endpoint(ec);
        if (ec)
        {
            return "unknown";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

} // namespace artistore::server
