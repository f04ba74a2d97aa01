#include "session_common.hpp"

#include "mediaup/encoding/base64.hpp"
#include "mediaup/error_codes.hpp"
#include "mediaup/server/registry_error.hpp"

namespace mediaup::server::session_common
{

    mediaup::protocol::ResponseEnvelope make_ok_response(nlohmann::json payload,
                                                         const std::optional<std::string> &request_id)
    {
        mediaup::protocol::ResponseEnvelope envelope;
        envelope.kind = mediaup::protocol::ResponseKind::Ok;
        envelope.payload = std::move(payload);
        envelope.message = "";
        envelope.error = mediaup::ErrorCode::Ok;
        envelope.request_id = request_id;
        return envelope;
    }

    std::vector<std::byte> decode_data(const std::string &data_base64)
    {
        auto data = mediaup::encoding::decode_base64(data_base64);
        if (!data)
        {
            throw RegistryError(mediaup::ErrorCode::InvalidPayload, "Data is not valid base64");
        }
        return std::move(*data);
    }

} // namespace mediaup::server::session_common
