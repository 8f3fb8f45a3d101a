#include "connection_common.hpp"

#include "artistore/error_codes.hpp"

namespace artistore::server::connection_common
{

    artistore::protocol::ResponseEnvelope make_ok_response(nlohmann::json payload,
                                                           const std::optional<std::string> &request_id,
                                                           std::uint16_t status_code)
    {
        artistore::protocol::ResponseEnvelope envelope;
        envelope.kind = artistore::protocol::ResponseKind::Ok;
        envelope.status_code = status_code;
        envelope.payload = std::move(payload);
        envelope.message = "";
        envelope.error = artistore::ErrorCode::Ok;
        envelope.request_id = request_id;
        return envelope;
    }

    artistore::protocol::ResponseEnvelope make_error_response(const artistore::Error &error,
                                                              const std::optional<std::string> &request_id)
    {
        artistore::protocol::ResponseEnvelope envelope;
        envelope.kind = artistore::protocol::ResponseKind::Error;
        envelope.status_code = artistore::status_code(error.code);
        envelope.error = error.code;
        envelope.message = error.message;
        envelope.request_id = request_id;
        return envelope;
    }

} // namespace artistore::server::connection_common
