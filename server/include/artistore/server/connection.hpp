#pragma once

#include <asio/ip/tcp.hpp>
#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "artistore/error_codes.hpp"
#include "artistore/framing.hpp"
#include "artistore/protocol.hpp"
#include "artistore/server/credential_store.hpp"
#include "artistore/server/upload_service.hpp"

namespace artistore::server
{

    struct ServerServices
    {
        UploadService &uploads;
        CredentialStore &credentials;
        std::size_t max_frame_size;
    };

    // One client connection: reads framed requests, dispatches them to the
    // upload service and writes framed responses back in order.
    class Connection : public std::enable_shared_from_this<Connection>
    {
    public:
        Connection(asio::ip::tcp::socket socket, ServerServices services);
        ~Connection();

        void start();

        void stop();

    private:
        void read_frame_header();
        void read_frame_payload(std::size_t size);
        void process_message(const nlohmann::json &json);
        void send_response(const artistore::protocol::ResponseEnvelope &envelope);
        void send_error(artistore::ErrorCode code, std::string message,
                        std::optional<std::string> request_id = std::nullopt);
        void close_after_error(artistore::ErrorCode code, std::string message);
        bool require_authentication(const artistore::protocol::RequestEnvelope &envelope);

        // Command handlers
        void handle_authenticate(const artistore::protocol::RequestEnvelope &envelope);
        void handle_ping(const artistore::protocol::RequestEnvelope &envelope);
        void handle_upload_init(const artistore::protocol::RequestEnvelope &envelope);
        void handle_upload_chunk(const artistore::protocol::RequestEnvelope &envelope);
        void handle_upload_finalize(const artistore::protocol::RequestEnvelope &envelope);
        void handle_upload_progress(const artistore::protocol::RequestEnvelope &envelope);
        void handle_upload_abort(const artistore::protocol::RequestEnvelope &envelope);
        void handle_check_duplicate(const artistore::protocol::RequestEnvelope &envelope);
        void handle_validate_file(const artistore::protocol::RequestEnvelope &envelope);
        void handle_upload_batch(const artistore::protocol::RequestEnvelope &envelope);

        std::string remote_endpoint() const;

        asio::ip::tcp::socket socket_;
        ServerServices services_;

        std::array<std::uint8_t, artistore::protocol::kFrameHeaderSize> header_buffer_{};
        std::vector<std::uint8_t> buffer_;
        bool authenticated_{false};
        bool closing_{false};
        std::string identity_;
    };

} // namespace artistore::server
