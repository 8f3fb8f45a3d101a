#include "artistore/server/connection.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "connection_common.hpp"

namespace artistore::server
{

    namespace
    {
        constexpr std::uint16_t kCreated = 201;
        constexpr std::uint16_t kAccepted = 202;

        // Decodes the typed request, runs the operation and writes either its
        // payload or its error back to the client.
        template <typename Request, typename Operation, typename Send>
        void respond(const artistore::protocol::RequestEnvelope &envelope, Operation &&operation, Send &&send,
                     std::uint16_t ok_status = 200)
        {
            Request request;
            try
            {
                request = envelope.payload.get<Request>();
            }
            catch (const std::exception &ex)
            {
                send(connection_common::make_error_response(
                    artistore::make_error(artistore::ErrorCode::InvalidPayload, ex.what()), envelope.request_id));
                return;
            }

            auto result = operation(request);
            if (!result)
            {
                send(connection_common::make_error_response(result.error(), envelope.request_id));
                return;
            }
            nlohmann::json payload = result.value();
            send(connection_common::make_ok_response(std::move(payload), envelope.request_id, ok_status));
        }
    } // namespace

    void Connection::handle_upload_init(const artistore::protocol::RequestEnvelope &envelope)
    {
        if (!require_authentication(envelope))
        {
            return;
        }
        respond<artistore::protocol::UploadInitRequest>(
            envelope, [this](const auto &request)
            { return services_.uploads.init_session(request); },
            [this](const auto &response)
            { send_response(response); },
            kCreated);
    }

    void Connection::handle_upload_chunk(const artistore::protocol::RequestEnvelope &envelope)
    {
        if (!require_authentication(envelope))
        {
            return;
        }
        respond<artistore::protocol::UploadChunkRequest>(
            envelope, [this](const auto &request)
            { return services_.uploads.upload_chunk(request); },
            [this](const auto &response)
            { send_response(response); },
            kAccepted);
    }

    void Connection::handle_upload_finalize(const artistore::protocol::RequestEnvelope &envelope)
    {
        if (!require_authentication(envelope))
        {
            return;
        }
        respond<artistore::protocol::FinalizeRequest>(
            envelope, [this](const auto &request)
            { return services_.uploads.finalize(request); },
            [this](const auto &response)
            { send_response(response); });
    }

    void Connection::handle_upload_progress(const artistore::protocol::RequestEnvelope &envelope)
    {
        if (!require_authentication(envelope))
        {
            return;
        }
        respond<artistore::protocol::SessionRequest>(
            envelope, [this](const auto &request)
            { return services_.uploads.progress(request); },
            [this](const auto &response)
            { send_response(response); });
    }

    void Connection::handle_upload_abort(const artistore::protocol::RequestEnvelope &envelope)
    {
        if (!require_authentication(envelope))
        {
            return;
        }
        respond<artistore::protocol::SessionRequest>(
            envelope, [this](const auto &request)
            { return services_.uploads.abort(request); },
            [this](const auto &response)
            { send_response(response); });
    }

    void Connection::handle_check_duplicate(const artistore::protocol::RequestEnvelope &envelope)
    {
        if (!require_authentication(envelope))
        {
            return;
        }
        respond<artistore::protocol::DuplicateCheckRequest>(
            envelope, [this](const auto &request)
            { return services_.uploads.check_duplicate(request); },
            [this](const auto &response)
            { send_response(response); });
    }

    void Connection::handle_validate_file(const artistore::protocol::RequestEnvelope &envelope)
    {
        if (!require_authentication(envelope))
        {
            return;
        }
        respond<artistore::protocol::ValidateFileRequest>(
            envelope, [this](const auto &request)
            { return services_.uploads.validate_file(request); },
            [this](const auto &response)
            { send_response(response); });
    }

    void Connection::handle_upload_batch(const artistore::protocol::RequestEnvelope &envelope)
    {
        if (!require_authentication(envelope))
        {
            return;
        }
        respond<artistore::protocol::BatchUploadRequest>(
            envelope, [this](const auto &request)
            {
                auto result = services_.uploads.upload_batch(request);
                if (result)
                {
                    spdlog::info("{} uploaded batch {} ({} files)", identity_, result->batch_id, result->total_files);
                }
                return result; },
            [this](const auto &response)
            { send_response(response); },
            kCreated);
    }

} // namespace artistore::server
