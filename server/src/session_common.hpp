#pragma once

#include <exception>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "mediaup/protocol.hpp"
#include "mediaup/server/registry_error.hpp"

namespace mediaup::server::session_common
{

    mediaup::protocol::ResponseEnvelope make_ok_response(nlohmann::json payload,
                                                         const std::optional<std::string> &request_id);

    // Typed view of a request payload. Throws RegistryError(InvalidPayload) when it does not match.
    template <typename T>
    T parse_payload(const nlohmann::json &payload)
    {
        try
        {
            return payload.get<T>();
        }
        catch (const std::exception &ex)
        {
            throw RegistryError(mediaup::ErrorCode::InvalidPayload, std::string("Malformed payload: ") + ex.what());
        }
    }

    // Decodes base64 request data. Throws RegistryError(InvalidPayload) on malformed input.
    std::vector<std::byte> decode_data(const std::string &data_base64);

} // namespace mediaup::server::session_common
