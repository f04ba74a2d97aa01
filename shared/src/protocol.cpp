#include "mediaup/protocol.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>

namespace mediaup::protocol
{

    namespace
    {

        struct CommandMapping
        {
            Command command;
            std::string_view label;
        };

        constexpr std::array<CommandMapping, 8> kCommandMappings{{
            {Command::InitializeUpload, "INITIALIZE_UPLOAD"},
            {Command::UploadPart, "UPLOAD_PART"},
            {Command::DirectUpload, "DIRECT_UPLOAD"},
            {Command::CompleteUpload, "COMPLETE_UPLOAD"},
            {Command::AbortUpload, "ABORT_UPLOAD"},
            {Command::PublishProgress, "PUBLISH_PROGRESS"},
            {Command::GetProgress, "GET_PROGRESS"},
            {Command::Ping, "PING"},
        }};

        struct ResponseKindMapping
        {
            ResponseKind kind;
            std::string_view label;
        };

        constexpr std::array<ResponseKindMapping, 2> kResponseMappings{{
            {ResponseKind::Ok, "OK"},
            {ResponseKind::Error, "ERROR"},
        }};

        struct StrategyMapping
        {
            UploadStrategy strategy;
            std::string_view label;
        };

        constexpr std::array<StrategyMapping, 2> kStrategyMappings{{
            {UploadStrategy::Direct, "direct"},
            {UploadStrategy::Multipart, "multipart"},
        }};

        struct StatusMapping
        {
            SessionStatus status;
            std::string_view label;
        };

        constexpr std::array<StatusMapping, 6> kStatusMappings{{
            {SessionStatus::Uploading, "uploading"},
            {SessionStatus::Processing, "processing"},
            {SessionStatus::Transcribing, "transcribing"},
            {SessionStatus::Completed, "completed"},
            {SessionStatus::Failed, "failed"},
            {SessionStatus::Unknown, "unknown"},
        }};

        bool equals_ignore_case(std::string_view lhs, std::string_view rhs)
        {
            return lhs.size() == rhs.size() &&
                   std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b)
                              { return std::tolower(static_cast<unsigned char>(a)) ==
                                       std::tolower(static_cast<unsigned char>(b)); });
        }

        void read_request_id(const nlohmann::json &json, std::optional<std::string> &request_id)
        {
            if (auto it = json.find("id"); it != json.end())
            {
                request_id = it->get<std::string>();
            }
            else
            {
                request_id.reset();
            }
        }

    } // namespace

    std::string_view to_string(Command command) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.command == command)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<Command> command_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.label == value)
            {
                return mapping.command;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(ResponseKind kind) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.label == value)
            {
                return mapping.kind;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(UploadStrategy strategy) noexcept
    {
        for (const auto &mapping : kStrategyMappings)
        {
            if (mapping.strategy == strategy)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<UploadStrategy> upload_strategy_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kStrategyMappings)
        {
            if (mapping.label == value)
            {
                return mapping.strategy;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(SessionStatus status) noexcept
    {
        for (const auto &mapping : kStatusMappings)
        {
            if (mapping.status == status)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    SessionStatus session_status_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kStatusMappings)
        {
            if (equals_ignore_case(mapping.label, value))
            {
                return mapping.status;
            }
        }
        return SessionStatus::Unknown;
    }

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope)
    {
        json = {
            {"cmd", to_string(envelope.command)},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
    }

    void from_json(const nlohmann::json &json, RequestEnvelope &envelope)
    {
        const auto cmd_label = json.at("cmd").get<std::string>();
        auto cmd = command_from_string(cmd_label);
        if (!cmd)
        {
            throw std::runtime_error("Unknown command: " + cmd_label);
        }
        envelope.command = *cmd;
        envelope.payload = json.value("payload", nlohmann::json::object());
        read_request_id(json, envelope.request_id);
    }

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope)
    {
        json = {
            {"status", to_string(envelope.kind)},
            {"error", to_int(envelope.error)},
            {"message", envelope.message},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
    }

    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope)
    {
        const auto status_label = json.at("status").get<std::string>();
        auto kind = response_kind_from_string(status_label);
        if (!kind)
        {
            throw std::runtime_error("Unknown response status: " + status_label);
        }
        envelope.kind = *kind;
        const auto error_value = json.value("error", 0u);
        envelope.error = error_code_from_int(static_cast<std::uint16_t>(error_value));
        envelope.message = json.value("message", std::string{});
        envelope.payload = json.value("payload", nlohmann::json::object());
        read_request_id(json, envelope.request_id);
    }

    void to_json(nlohmann::json &json, const InitializeUploadRequest &request)
    {
        json = {
            {"filename", request.filename},
            {"file_size", request.file_size},
            {"content_type", request.content_type},
            {"num_speakers", request.speaker_count},
            {"strategy", to_string(request.strategy)},
            {"chunk_size", request.chunk_size},
            {"total_parts", request.total_parts},
        };
    }

    void from_json(const nlohmann::json &json, InitializeUploadRequest &request)
    {
        request.filename = json.at("filename").get<std::string>();
        request.file_size = json.at("file_size").get<std::uint64_t>();
        request.content_type = json.value("content_type", std::string{"application/octet-stream"});
        request.speaker_count = json.value("num_speakers", 2u);
        const auto strategy_label = json.value("strategy", std::string{"direct"});
        auto strategy = upload_strategy_from_string(strategy_label);
        if (!strategy)
        {
            throw std::runtime_error("Unknown upload strategy: " + strategy_label);
        }
        request.strategy = *strategy;
        request.chunk_size = json.value("chunk_size", 0ULL);
        request.total_parts = json.value("total_parts", 0u);
    }

    void to_json(nlohmann::json &json, const InitializeUploadResponse &response)
    {
        json = {{"session_id", response.session_id}};
        if (response.upload_id)
        {
            json["upload_id"] = *response.upload_id;
        }
    }

    void from_json(const nlohmann::json &json, InitializeUploadResponse &response)
    {
        response.session_id = json.at("session_id").get<std::string>();
        if (auto it = json.find("upload_id"); it != json.end() && !it->is_null())
        {
            response.upload_id = it->get<std::string>();
        }
        else
        {
            response.upload_id.reset();
        }
    }

    void to_json(nlohmann::json &json, const UploadPartRequest &request)
    {
        json = {
            {"session_id", request.session_id},
            {"part_number", request.part_number},
            {"data", request.data_base64},
            {"hash", request.part_hash},
        };
    }

    void from_json(const nlohmann::json &json, UploadPartRequest &request)
    {
        request.session_id = json.at("session_id").get<std::string>();
        request.part_number = json.at("part_number").get<std::uint32_t>();
        request.data_base64 = json.at("data").get<std::string>();
        request.part_hash = json.value("hash", std::string{});
    }

    void to_json(nlohmann::json &json, const UploadPartResponse &response)
    {
        json = {
            {"part_number", response.part_number},
            {"etag", response.etag},
        };
    }

    void from_json(const nlohmann::json &json, UploadPartResponse &response)
    {
        response.part_number = json.at("part_number").get<std::uint32_t>();
        response.etag = json.at("etag").get<std::string>();
    }

    void to_json(nlohmann::json &json, const DirectUploadRequest &request)
    {
        json = {
            {"session_id", request.session_id},
            {"data", request.data_base64},
            {"hash", request.content_hash},
        };
    }

    void from_json(const nlohmann::json &json, DirectUploadRequest &request)
    {
        request.session_id = json.at("session_id").get<std::string>();
        request.data_base64 = json.at("data").get<std::string>();
        request.content_hash = json.value("hash", std::string{});
    }

    void to_json(nlohmann::json &json, const PartETag &part)
    {
        json = {
            {"part_number", part.part_number},
            {"etag", part.etag},
        };
    }

    void from_json(const nlohmann::json &json, PartETag &part)
    {
        part.part_number = json.at("part_number").get<std::uint32_t>();
        part.etag = json.at("etag").get<std::string>();
    }

    void to_json(nlohmann::json &json, const CompleteUploadRequest &request)
    {
        json = {
            {"session_id", request.session_id},
            {"parts", request.parts},
        };
    }

    void from_json(const nlohmann::json &json, CompleteUploadRequest &request)
    {
        request.session_id = json.at("session_id").get<std::string>();
        request.parts = json.at("parts").get<std::vector<PartETag>>();
    }

    void to_json(nlohmann::json &json, const UploadAck &ack)
    {
        json = {
            {"session_id", ack.session_id},
            {"size", ack.size},
        };
    }

    void from_json(const nlohmann::json &json, UploadAck &ack)
    {
        ack.session_id = json.at("session_id").get<std::string>();
        ack.size = json.value("size", 0ULL);
    }

    void to_json(nlohmann::json &json, const SessionRequest &request)
    {
        json = {{"session_id", request.session_id}};
    }

    void from_json(const nlohmann::json &json, SessionRequest &request)
    {
        request.session_id = json.at("session_id").get<std::string>();
    }

    void to_json(nlohmann::json &json, const ProgressRecord &record)
    {
        json = {
            {"session_id", record.session_id},
            {"status", to_string(record.status)},
            {"progress", record.progress},
            {"message", record.message},
            {"stage", record.stage},
            {"timestamp", record.timestamp},
        };
    }

    void from_json(const nlohmann::json &json, ProgressRecord &record)
    {
        record.session_id = json.value("session_id", std::string{});
        record.status = session_status_from_string(json.value("status", std::string{"unknown"}));
        record.progress = std::clamp(json.value("progress", 0.0), 0.0, 100.0);
        record.message = json.value("message", std::string{});
        record.stage = json.value("stage", std::string{});
        record.timestamp = json.value("timestamp", std::string{});
    }

} // namespace mediaup::protocol
