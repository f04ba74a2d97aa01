#include "mediaup/client/rpc_channel.hpp"

#include <asio/connect.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>

#include <array>
#include <stdexcept>
#include <utility>

#include "mediaup/client/errors.hpp"
#include "mediaup/error_codes.hpp"
#include "mediaup/framing.hpp"

namespace mediaup::client
{

    RpcChannel::RpcChannel(std::string host, std::uint16_t port, Logger logger, std::size_t max_idle)
        : host_(std::move(host)), port_(port), logger_(std::move(logger)), max_idle_(max_idle) {}

    nlohmann::json RpcChannel::call(mediaup::protocol::Command command, const nlohmann::json &payload)
    {
        mediaup::protocol::RequestEnvelope request;
        request.command = command;
        request.payload = payload;
        request.request_id = next_request_id();

        auto socket = acquire();
        mediaup::protocol::ResponseEnvelope response;
        try
        {
            response = exchange(*socket, request);
        }
        catch (const asio::system_error &ex)
        {
            logger_.warn("rpc", mediaup::protocol::to_string(command), " ", *request.request_id,
                         " transport error: ", ex.what());
            throw ServiceError(mediaup::ErrorCode::Unavailable,
                               "Gateway " + host_ + ":" + std::to_string(port_) + " unreachable: " + ex.what());
        }
        release(std::move(socket));

        if (response.kind == mediaup::protocol::ResponseKind::Error)
        {
            logger_.debug("rpc", mediaup::protocol::to_string(command), " error=", mediaup::to_string(response.error),
                          " msg=", response.message);
            throw ServiceError(response.error == mediaup::ErrorCode::Ok ? mediaup::ErrorCode::InternalError
                                                                        : response.error,
                               response.message);
        }
        logger_.debug("rpc", "success cmd=", mediaup::protocol::to_string(command));
        return std::move(response.payload);
    }

    void RpcChannel::ping()
    {
        call(mediaup::protocol::Command::Ping);
    }

    std::unique_ptr<asio::ip::tcp::socket> RpcChannel::acquire()
    {
        {
            std::lock_guard lock(mutex_);
            if (!idle_.empty())
            {
                auto socket = std::move(idle_.back());
                idle_.pop_back();
                return socket;
            }
        }
        return connect();
    }

    void RpcChannel::release(std::unique_ptr<asio::ip::tcp::socket> socket)
    {
        std::lock_guard lock(mutex_);
        if (idle_.size() < max_idle_)
        {
            idle_.push_back(std::move(socket));
        }
    }

    std::unique_ptr<asio::ip::tcp::socket> RpcChannel::connect()
    {
        auto socket = std::make_unique<asio::ip::tcp::socket>(io_context_);
        try
        {
            asio::ip::tcp::resolver resolver(io_context_);
            const auto results = resolver.resolve(host_, std::to_string(port_));
            asio::connect(*socket, results);
            socket->set_option(asio::ip::tcp::no_delay(true));
        }
        catch (const asio::system_error &ex)
        {
            throw ServiceError(mediaup::ErrorCode::Unavailable,
                               "Cannot connect to " + host_ + ":" + std::to_string(port_) + ": " + ex.what());
        }
        logger_.debug("rpc", "connected to ", host_, ':', port_);
        return socket;
    }

    mediaup::protocol::ResponseEnvelope RpcChannel::exchange(asio::ip::tcp::socket &socket,
                                                             const mediaup::protocol::RequestEnvelope &request)
    {
        const auto frame = mediaup::protocol::encode_frame(nlohmann::json(request));
        asio::write(socket, asio::buffer(frame));

        std::array<std::uint8_t, mediaup::protocol::kFrameHeaderSize> header{};
        asio::read(socket, asio::buffer(header));
        std::size_t size = 0;
        try
        {
            size = mediaup::protocol::decode_frame_header(header);
        }
        catch (const std::length_error &ex)
        {
            throw ServiceError(mediaup::ErrorCode::InvalidPayload, ex.what());
        }
        std::vector<char> buffer(size);
        asio::read(socket, asio::buffer(buffer.data(), buffer.size()));

        mediaup::protocol::ResponseEnvelope response;
        try
        {
            response = nlohmann::json::parse(buffer.begin(), buffer.end()).get<mediaup::protocol::ResponseEnvelope>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            logger_.warn("rpc", "parse_error size=", size, " msg=", ex.what());
            throw ServiceError(mediaup::ErrorCode::InvalidPayload, "Failed to decode gateway response");
        }
        if (response.request_id && request.request_id && *response.request_id != *request.request_id)
        {
            throw ServiceError(mediaup::ErrorCode::InvalidPayload,
                               "Response " + *response.request_id + " does not answer " + *request.request_id);
        }
        return response;
    }

    std::string RpcChannel::next_request_id()
    {
        return "req-" + std::to_string(++request_counter_);
    }

} // namespace mediaup::client
