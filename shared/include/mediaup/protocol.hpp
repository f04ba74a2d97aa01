/**
 * MediaUp - Shared protocol schema and serialization helpers.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "mediaup/error_codes.hpp"

namespace mediaup::protocol
{

    enum class Command : std::uint8_t
    {
        InitializeUpload,
        UploadPart,
        DirectUpload,
        CompleteUpload,
        AbortUpload,
        PublishProgress,
        GetProgress,
        Ping
    };

    std::string_view to_string(Command command) noexcept;
    std::optional<Command> command_from_string(std::string_view value) noexcept;

    enum class ResponseKind : std::uint8_t
    {
        Ok = 0,
        Error = 1
    };

    std::string_view to_string(ResponseKind kind) noexcept;
    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept;

    struct RequestEnvelope
    {
        Command command{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope);
    void from_json(const nlohmann::json &json, RequestEnvelope &envelope);

    struct ResponseEnvelope
    {
        ResponseKind kind{ResponseKind::Ok};
        ErrorCode error{ErrorCode::Ok};
        std::string message{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope);
    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope);

    enum class UploadStrategy : std::uint8_t
    {
        Direct,
        Multipart
    };

    std::string_view to_string(UploadStrategy strategy) noexcept;
    std::optional<UploadStrategy> upload_strategy_from_string(std::string_view value) noexcept;

    enum class SessionStatus : std::uint8_t
    {
        Uploading,
        Processing,
        Transcribing,
        Completed,
        Failed,
        Unknown
    };

    std::string_view to_string(SessionStatus status) noexcept;
    // Case-insensitive; anything unrecognised maps to Unknown.
    SessionStatus session_status_from_string(std::string_view value) noexcept;

    constexpr bool is_terminal(SessionStatus status) noexcept
    {
        return status == SessionStatus::Completed || status == SessionStatus::Failed;
    }

    // Position along the pipeline, used to keep observed phases from going backwards.
    constexpr int phase_rank(SessionStatus status) noexcept
    {
        switch (status)
        {
        case SessionStatus::Uploading:
            return 1;
        case SessionStatus::Processing:
            return 2;
        case SessionStatus::Transcribing:
            return 3;
        case SessionStatus::Completed:
        case SessionStatus::Failed:
            return 4;
        case SessionStatus::Unknown:
            break;
        }
        return 0;
    }

    struct InitializeUploadRequest
    {
        std::string filename;
        std::uint64_t file_size{};
        std::string content_type{"application/octet-stream"};
        std::uint32_t speaker_count{2};
        UploadStrategy strategy{UploadStrategy::Direct};
        std::uint64_t chunk_size{};
        std::uint32_t total_parts{};
    };

    void to_json(nlohmann::json &json, const InitializeUploadRequest &request);
    void from_json(const nlohmann::json &json, InitializeUploadRequest &request);

    struct InitializeUploadResponse
    {
        std::string session_id;
        std::optional<std::string> upload_id{};
    };

    void to_json(nlohmann::json &json, const InitializeUploadResponse &response);
    void from_json(const nlohmann::json &json, InitializeUploadResponse &response);

    struct UploadPartRequest
    {
        std::string session_id;
        std::uint32_t part_number{};
        std::string data_base64;
        std::string part_hash;
    };

    void to_json(nlohmann::json &json, const UploadPartRequest &request);
    void from_json(const nlohmann::json &json, UploadPartRequest &request);

    struct UploadPartResponse
    {
        std::uint32_t part_number{};
        std::string etag;
    };

    void to_json(nlohmann::json &json, const UploadPartResponse &response);
    void from_json(const nlohmann::json &json, UploadPartResponse &response);

    struct DirectUploadRequest
    {
        std::string session_id;
        std::string data_base64;
        std::string content_hash;
    };

    void to_json(nlohmann::json &json, const DirectUploadRequest &request);
    void from_json(const nlohmann::json &json, DirectUploadRequest &request);

    struct PartETag
    {
        std::uint32_t part_number{};
        std::string etag;

        bool operator==(const PartETag &) const = default;
    };

    void to_json(nlohmann::json &json, const PartETag &part);
    void from_json(const nlohmann::json &json, PartETag &part);

    struct CompleteUploadRequest
    {
        std::string session_id;
        std::vector<PartETag> parts;
    };

    void to_json(nlohmann::json &json, const CompleteUploadRequest &request);
    void from_json(const nlohmann::json &json, CompleteUploadRequest &request);

    // Acknowledgement for both DIRECT_UPLOAD and COMPLETE_UPLOAD.
    struct UploadAck
    {
        std::string session_id;
        std::uint64_t size{};
    };

    void to_json(nlohmann::json &json, const UploadAck &ack);
    void from_json(const nlohmann::json &json, UploadAck &ack);

    struct SessionRequest
    {
        std::string session_id;
    };

    void to_json(nlohmann::json &json, const SessionRequest &request);
    void from_json(const nlohmann::json &json, SessionRequest &request);

    struct ProgressRecord
    {
        std::string session_id;
        SessionStatus status{SessionStatus::Unknown};
        double progress{};
        std::string message;
        std::string stage;
        std::string timestamp;
    };

    void to_json(nlohmann::json &json, const ProgressRecord &record);
    void from_json(const nlohmann::json &json, ProgressRecord &record);

} // namespace mediaup::protocol
