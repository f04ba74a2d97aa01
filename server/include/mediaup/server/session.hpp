#pragma once

#include <asio/ip/tcp.hpp>
#include <array>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "mediaup/error_codes.hpp"
#include "mediaup/framing.hpp"
#include "mediaup/protocol.hpp"
#include "mediaup/server/progress_board.hpp"
#include "mediaup/server/upload_registry.hpp"

namespace mediaup::server
{

    struct GatewayContext
    {
        UploadRegistry &uploads;
        ProgressBoard &progress;
        // Multipart sessions idle for longer are reaped.
        std::chrono::seconds idle_timeout;
    };

    class Session : public std::enable_shared_from_this<Session>
    {
    public:
        Session(asio::ip::tcp::socket socket, GatewayContext context);

        void start();

        void stop();

    private:
        using Handler = std::function<nlohmann::json(const mediaup::protocol::RequestEnvelope &)>;

        void read_frame_header();
        void read_frame_payload(std::size_t size);
        void process_message(const nlohmann::json &json);
        void send_response(const mediaup::protocol::ResponseEnvelope &envelope);
        void send_error(mediaup::ErrorCode code, std::string message,
                        std::optional<std::string> request_id = std::nullopt);
        // Runs `handler` and answers with its payload, or with the error it raised.
        void respond(const mediaup::protocol::RequestEnvelope &envelope, const Handler &handler);

        // Command handlers
        nlohmann::json handle_initialize_upload(const mediaup::protocol::RequestEnvelope &envelope);
        nlohmann::json handle_upload_part(const mediaup::protocol::RequestEnvelope &envelope);
        nlohmann::json handle_direct_upload(const mediaup::protocol::RequestEnvelope &envelope);
        nlohmann::json handle_complete_upload(const mediaup::protocol::RequestEnvelope &envelope);
        nlohmann::json handle_abort_upload(const mediaup::protocol::RequestEnvelope &envelope);
        nlohmann::json handle_publish_progress(const mediaup::protocol::RequestEnvelope &envelope);
        nlohmann::json handle_get_progress(const mediaup::protocol::RequestEnvelope &envelope);
        nlohmann::json handle_ping(const mediaup::protocol::RequestEnvelope &envelope);

        std::string remote_endpoint() const;

        asio::ip::tcp::socket socket_;
        GatewayContext context_;

        std::array<std::uint8_t, mediaup::protocol::kFrameHeaderSize> header_buffer_{};
        std::vector<std::uint8_t> buffer_;
        bool closed_{false};
    };

} // namespace mediaup::server
