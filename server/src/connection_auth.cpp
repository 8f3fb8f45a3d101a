#include "artistore/server/connection.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "connection_common.hpp"

namespace artistore::server
{

    void Connection::handle_authenticate(const artistore::protocol::RequestEnvelope &envelope)
    {
        if (authenticated_)
        {
            send_error(artistore::ErrorCode::InvalidState, "Already authenticated", envelope.request_id);
            return;
        }

        artistore::protocol::AuthenticateRequest request;
        try
        {
            request = envelope.payload.get<artistore::protocol::AuthenticateRequest>();
        }
        catch (const std::exception &ex)
        {
            send_error(artistore::ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
            return;
        }

        if (request.username.empty())
        {
            send_error(artistore::ErrorCode::InvalidPayload, "Username is required", envelope.request_id);
            return;
        }

        try
        {
            if (request.register_user)
            {
                if (auto status = services_.credentials.register_user(request.username, request.password); !status)
                {
                    send_response(connection_common::make_error_response(status.error(), envelope.request_id));
                    return;
                }
            }
            if (!services_.credentials.authenticate(request.username, request.password))
            {
                spdlog::warn("Failed login for {} from {}", request.username, remote_endpoint());
                send_error(artistore::ErrorCode::AuthenticationFailed, "Invalid credentials", envelope.request_id);
                return;
            }
        }
        catch (const std::exception &ex)
        {
            send_error(artistore::ErrorCode::InternalError, ex.what(), envelope.request_id);
            return;
        }

        authenticated_ = true;
        identity_ = request.username;
        artistore::protocol::AuthenticateResponse response{
            .success = true,
            .newly_registered = request.register_user,
            .identity = identity_,
        };
        nlohmann::json payload = response;
        send_response(connection_common::make_ok_response(std::move(payload), envelope.request_id));
        spdlog::info("Connection authenticated as {} ({})", identity_, remote_endpoint());
    }

} // namespace artistore::server
