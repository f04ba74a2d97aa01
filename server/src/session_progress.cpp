#include "mediaup/server/session.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "mediaup/version.hpp"
#include "session_common.hpp"

namespace mediaup::server
{

    nlohmann::json Session::handle_publish_progress(const mediaup::protocol::RequestEnvelope &envelope)
    {
        auto record = session_common::parse_payload<mediaup::protocol::ProgressRecord>(envelope.payload);
        const auto stored = context_.progress.publish(std::move(record));
        spdlog::debug("Progress {} {} {:.1f}% {}", stored.session_id, mediaup::protocol::to_string(stored.status),
                      stored.progress, stored.stage);
        return stored;
    }

    nlohmann::json Session::handle_get_progress(const mediaup::protocol::RequestEnvelope &envelope)
    {
        const auto request = session_common::parse_payload<mediaup::protocol::SessionRequest>(envelope.payload);
        return context_.progress.fetch(request.session_id);
    }

    nlohmann::json Session::handle_ping(const mediaup::protocol::RequestEnvelope & /*envelope*/)
    {
        return {{"version", std::string(mediaup::version())}};
    }

} // namespace mediaup::server
