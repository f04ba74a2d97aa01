#pragma once

#include <asio.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "mediaup/client/logger.hpp"
#include "mediaup/protocol.hpp"

namespace mediaup::client
{

    /**
     * Request/response calls to the gateway over a small pool of blocking TCP connections.
     *
     * Safe to share between threads: each call checks a connection out of the pool for its whole
     * exchange. A connection that fails mid-call is closed and dropped.
     */
    class RpcChannel
    {
    public:
        RpcChannel(std::string host, std::uint16_t port, Logger logger, std::size_t max_idle = 4);

        RpcChannel(const RpcChannel &) = delete;
        RpcChannel &operator=(const RpcChannel &) = delete;

        // Returns the response payload. Throws ServiceError: Unavailable for transport failures,
        // InvalidPayload for undecodable responses, and the gateway's code for ERROR responses.
        nlohmann::json call(mediaup::protocol::Command command,
                            const nlohmann::json &payload = nlohmann::json::object());

        void ping();

        const std::string &host() const noexcept { return host_; }
        std::uint16_t port() const noexcept { return port_; }

    private:
        std::unique_ptr<asio::ip::tcp::socket> acquire();
        void release(std::unique_ptr<asio::ip::tcp::socket> socket);
        std::unique_ptr<asio::ip::tcp::socket> connect();
        mediaup::protocol::ResponseEnvelope exchange(asio::ip::tcp::socket &socket,
                                                     const mediaup::protocol::RequestEnvelope &request);
        std::string next_request_id();

        std::string host_;
        std::uint16_t port_;
        Logger logger_;
        std::size_t max_idle_;
        asio::io_context io_context_;
        std::mutex mutex_;
        std::vector<std::unique_ptr<asio::ip::tcp::socket>> idle_;
        std::atomic<std::uint64_t> request_counter_{0};
    };

} // namespace mediaup::client
