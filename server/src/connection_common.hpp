#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "artistore/protocol.hpp"
#include "artistore/result.hpp"

namespace artistore::server::connection_common
{

    artistore::protocol::ResponseEnvelope make_ok_response(nlohmann::json payload,
                                                           const std::optional<std::string> &request_id,
                                                           std::uint16_t status_code = 200);

    artistore::protocol::ResponseEnvelope make_error_response(const artistore::Error &error,
                                                              const std::optional<std::string> &request_id);

} // namespace artistore::server::connection_common
