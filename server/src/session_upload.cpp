#include "mediaup/server/session.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "session_common.hpp"

namespace mediaup::server
{

    nlohmann::json Session::handle_initialize_upload(const mediaup::protocol::RequestEnvelope &envelope)
    {
        context_.uploads.cleanup_expired(context_.idle_timeout);
        const auto request = session_common::parse_payload<mediaup::protocol::InitializeUploadRequest>(envelope.payload);
        const auto state = context_.uploads.create(request);
        spdlog::info("Session {} opened for {} ({} bytes, {}, {} part(s), {} speaker(s))", state.session_id,
                     state.filename, state.file_size, mediaup::protocol::to_string(state.strategy), state.total_parts,
                     state.speaker_count);

        mediaup::protocol::InitializeUploadResponse response{
            .session_id = state.session_id,
            .upload_id = state.upload_id,
        };
        return response;
    }

    nlohmann::json Session::handle_upload_part(const mediaup::protocol::RequestEnvelope &envelope)
    {
        const auto request = session_common::parse_payload<mediaup::protocol::UploadPartRequest>(envelope.payload);
        const auto data = session_common::decode_data(request.data_base64);
        auto etag = context_.uploads.store_part(request.session_id, request.part_number, data,
                                                         request.part_hash);
        spdlog::debug("Session {} stored part {} ({} bytes)", request.session_id, request.part_number, data.size());

        mediaup::protocol::UploadPartResponse response{
            .part_number = request.part_number,
            .etag = std::move(etag),
        };
        return response;
    }

    nlohmann::json Session::handle_direct_upload(const mediaup::protocol::RequestEnvelope &envelope)
    {
        const auto request = session_common::parse_payload<mediaup::protocol::DirectUploadRequest>(envelope.payload);
        const auto data = session_common::decode_data(request.data_base64);
        const auto size = context_.uploads.store_direct(request.session_id, data, request.content_hash);
        spdlog::info("Session {} stored directly ({} bytes)", request.session_id, size);
        return mediaup::protocol::UploadAck{.session_id = request.session_id, .size = size};
    }

    nlohmann::json Session::handle_complete_upload(const mediaup::protocol::RequestEnvelope &envelope)
    {
        const auto request = session_common::parse_payload<mediaup::protocol::CompleteUploadRequest>(envelope.payload);
        const auto size = context_.uploads.complete(request.session_id, request.parts);
        spdlog::info("Session {} completed ({} parts, {} bytes)", request.session_id, request.parts.size(), size);
        return mediaup::protocol::UploadAck{.session_id = request.session_id, .size = size};
    }

    nlohmann::json Session::handle_abort_upload(const mediaup::protocol::RequestEnvelope &envelope)
    {
        const auto request = session_common::parse_payload<mediaup::protocol::SessionRequest>(envelope.payload);
        context_.uploads.abort(request.session_id);
        spdlog::info("Session {} aborted", request.session_id);
        return mediaup::protocol::UploadAck{.session_id = request.session_id, .size = 0};
    }

} // namespace mediaup::server
