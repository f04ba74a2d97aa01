#include "mediaup/client/rpc_services.hpp"

#include <exception>
#include <string_view>

#include "mediaup/crypto.hpp"
#include "mediaup/encoding/base64.hpp"

namespace mediaup::client
{

    namespace
    {

        // Typed view of a response payload; a payload that does not match is the gateway's fault.
        template <typename T>
        T decode(const nlohmann::json &payload, std::string_view what)
        {
            try
            {
                return payload.get<T>();
            }
            catch (const std::exception &ex)
            {
                throw ServiceError(mediaup::ErrorCode::InvalidPayload,
                                   "Malformed " + std::string(what) + " response: " + ex.what());
            }
        }

        CompletionResult to_completion(const mediaup::protocol::UploadAck &ack, const std::string &session_id)
        {
            if (ack.session_id != session_id)
            {
                throw ServiceError(mediaup::ErrorCode::InvalidPayload,
                                   "Acknowledgement for " + ack.session_id + " while uploading " + session_id);
            }
            return CompletionResult{.session_id = ack.session_id, .size = ack.size};
        }

    } // namespace

    RpcStorageService::RpcStorageService(RpcChannel &channel) : channel_(channel) {}

    InitResult RpcStorageService::initialize(const mediaup::protocol::InitializeUploadRequest &request)
    {
        const auto payload = channel_.call(mediaup::protocol::Command::InitializeUpload, nlohmann::json(request));
        auto response = decode<mediaup::protocol::InitializeUploadResponse>(payload, "initialize");
        return InitResult{.session_id = std::move(response.session_id), .upload_id = std::move(response.upload_id)};
    }

    PartResult RpcStorageService::upload_part(const std::string &session_id, std::uint32_t part_number,
                                              std::span<const std::byte> bytes)
    {
        mediaup::protocol::UploadPartRequest request{
            .session_id = session_id,
            .part_number = part_number,
            .data_base64 = mediaup::encoding::encode_base64(bytes),
            .part_hash = mediaup::crypto::hash_bytes(bytes),
        };
        const auto payload = channel_.call(mediaup::protocol::Command::UploadPart, nlohmann::json(request));
        auto response = decode<mediaup::protocol::UploadPartResponse>(payload, "upload part");
        return PartResult{.part_number = response.part_number, .etag = std::move(response.etag)};
    }

    CompletionResult RpcStorageService::direct_upload(const std::string &session_id, std::span<const std::byte> bytes)
    {
        mediaup::protocol::DirectUploadRequest request{
            .session_id = session_id,
            .data_base64 = mediaup::encoding::encode_base64(bytes),
            .content_hash = mediaup::crypto::hash_bytes(bytes),
        };
        const auto payload = channel_.call(mediaup::protocol::Command::DirectUpload, nlohmann::json(request));
        return to_completion(decode<mediaup::protocol::UploadAck>(payload, "direct upload"), session_id);
    }

    CompletionResult RpcStorageService::complete_upload(const std::string &session_id,
                                                        const std::vector<mediaup::protocol::PartETag> &parts)
    {
        mediaup::protocol::CompleteUploadRequest request{.session_id = session_id, .parts = parts};
        const auto payload = channel_.call(mediaup::protocol::Command::CompleteUpload, nlohmann::json(request));
        return to_completion(decode<mediaup::protocol::UploadAck>(payload, "complete upload"), session_id);
    }

    void RpcStorageService::abort_upload(const std::string &session_id)
    {
        channel_.call(mediaup::protocol::Command::AbortUpload,
                      nlohmann::json(mediaup::protocol::SessionRequest{.session_id = session_id}));
    }

    RpcProgressStore::RpcProgressStore(RpcChannel &channel) : channel_(channel) {}

    void RpcProgressStore::publish(const mediaup::protocol::ProgressRecord &record)
    {
        channel_.call(mediaup::protocol::Command::PublishProgress, nlohmann::json(record));
    }

    std::optional<mediaup::protocol::ProgressRecord> RpcProgressStore::fetch(const std::string &session_id)
    {
        const auto payload = channel_.call(mediaup::protocol::Command::GetProgress,
                                           nlohmann::json(mediaup::protocol::SessionRequest{.session_id = session_id}));
        auto record = decode<mediaup::protocol::ProgressRecord>(payload, "progress");
        if (record.status == mediaup::protocol::SessionStatus::Unknown)
        {
            return std::nullopt;
        }
        if (record.session_id.empty())
        {
            record.session_id = session_id;
        }
        return record;
    }

} // namespace mediaup::client
