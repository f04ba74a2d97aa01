#include "mediaup/server/session.hpp"

#include <asio/read.hpp>
#include <asio/write.hpp>
#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

#include "mediaup/error_codes.hpp"
#include "mediaup/framing.hpp"
#include "session_common.hpp"

#include <spdlog/spdlog.h>

namespace mediaup::server
{

    Session::Session(asio::ip::tcp::socket socket, GatewayContext context)
        : socket_(std::move(socket)), context_(context) {}

    void Session::start()
    {
        spdlog::info("Client connected from {}", remote_endpoint());
        read_frame_header();
    }

    void Session::stop()
    {
        if (closed_)
        {
            return;
        }
        closed_ = true;
        std::error_code ec;
        spdlog::info("Closing connection for {}", remote_endpoint());
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

    void Session::read_frame_header()
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(header_buffer_),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             std::size_t payload_size = 0;
                             try
                             {
                                 payload_size = mediaup::protocol::decode_frame_header(header_buffer_);
                             }
                             catch (const std::length_error &ex)
                             {
                                 spdlog::warn("{} sent an oversized frame: {}", remote_endpoint(), ex.what());
                                 stop();
                                 return;
                             }
                             if (payload_size == 0)
                             {
                                 read_frame_header();
                                 return;
                             }
                             buffer_.resize(payload_size);
                             read_frame_payload(payload_size);
                         });
    }

    void Session::read_frame_payload(std::size_t size)
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(buffer_.data(), size),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             try
                             {
                                 const auto json = nlohmann::json::parse(buffer_.begin(), buffer_.end());
                                 process_message(json);
                             }
                             catch (const nlohmann::json::exception &ex)
                             {
                                 send_error(mediaup::ErrorCode::InvalidPayload, ex.what());
                             }
                             read_frame_header();
                         });
    }

    void Session::process_message(const nlohmann::json &json)
    {
        mediaup::protocol::RequestEnvelope envelope;
        try
        {
            envelope = json.get<mediaup::protocol::RequestEnvelope>();
        }
        catch (const std::exception &ex)
        {
            send_error(mediaup::ErrorCode::InvalidCommand, ex.what(),
                       json.is_object() && json.contains("id") && json["id"].is_string()
                           ? std::optional<std::string>(json["id"].get<std::string>())
                           : std::nullopt);
            return;
        }

        spdlog::debug("{} -> command {}", remote_endpoint(), mediaup::protocol::to_string(envelope.command));

        switch (envelope.command)
        {
        case mediaup::protocol::Command::InitializeUpload:
            respond(envelope, [this](const auto &request)
                    { return handle_initialize_upload(request); });
            break;
        case mediaup::protocol::Command::UploadPart:
            respond(envelope, [this](const auto &request)
                    { return handle_upload_part(request); });
            break;
        case mediaup::protocol::Command::DirectUpload:
            respond(envelope, [this](const auto &request)
                    { return handle_direct_upload(request); });
            break;
        case mediaup::protocol::Command::CompleteUpload:
            respond(envelope, [this](const auto &request)
                    { return handle_complete_upload(request); });
            break;
        case mediaup::protocol::Command::AbortUpload:
            respond(envelope, [this](const auto &request)
                    { return handle_abort_upload(request); });
            break;
        case mediaup::protocol::Command::PublishProgress:
            respond(envelope, [this](const auto &request)
                    { return handle_publish_progress(request); });
            break;
        case mediaup::protocol::Command::GetProgress:
            respond(envelope, [this](const auto &request)
                    { return handle_get_progress(request); });
            break;
        case mediaup::protocol::Command::Ping:
            respond(envelope, [this](const auto &request)
                    { return handle_ping(request); });
            break;
        default:
            send_error(mediaup::ErrorCode::Unsupported, "Command not supported", envelope.request_id);
            break;
        }
    }

    void Session::respond(const mediaup::protocol::RequestEnvelope &envelope, const Handler &handler)
    {
        try
        {
            send_response(session_common::make_ok_response(handler(envelope), envelope.request_id));
        }
        catch (const RegistryError &ex)
        {
            spdlog::warn("{} {} rejected ({}): {}", remote_endpoint(), mediaup::protocol::to_string(envelope.command),
                         mediaup::to_string(ex.code()), ex.what());
            send_error(ex.code(), ex.what(), envelope.request_id);
        }
        catch (const nlohmann::json::exception &ex)
        {
            send_error(mediaup::ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("{} {} failed: {}", remote_endpoint(), mediaup::protocol::to_string(envelope.command),
                          ex.what());
            send_error(mediaup::ErrorCode::InternalError, ex.what(), envelope.request_id);
        }
    }

    void Session::send_response(const mediaup::protocol::ResponseEnvelope &envelope)
    {
        const auto json = nlohmann::json(envelope);
        auto frame = std::make_shared<std::vector<std::uint8_t>>(mediaup::protocol::encode_frame(json));
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(*frame),
                          [this, self, frame](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          {
                              if (ec)
                              {
                                  stop();
                              }
                          });
    }

    void Session::send_error(mediaup::ErrorCode code, std::string message, std::optional<std::string> request_id)
    {
        mediaup::protocol::ResponseEnvelope envelope;
        envelope.kind = mediaup::protocol::ResponseKind::Error;
        envelope.error = code;
        envelope.message = std::move(message);
        envelope.request_id = std::move(request_id);
        send_response(envelope);
    }

    std::string Session::remote_endpoint() const
    {
        std::error_code ec;
        const auto endpoint = socket_.remote_endpoint(ec);
        if (ec)
        {
            return "<disconnected>";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

} // namespace mediaup::server
