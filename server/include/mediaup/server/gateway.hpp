#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>
#include <asio/steady_timer.hpp>
#include <cstddef>
#include <cstdint>
#include <thread>
#include <vector>

#include "mediaup/server/config.hpp"
#include "mediaup/server/progress_board.hpp"
#include "mediaup/server/upload_registry.hpp"

namespace mediaup::server
{

    /**
     * Storage and progress gateway.
     *
     * Accepts framed JSON connections and serves the upload and progress commands from one
     * UploadRegistry and one ProgressBoard. A periodic sweep reaps idle upload sessions and
     * expired progress records. SIGINT and SIGTERM stop the gateway.
     */
    class Gateway
    {
    public:
        explicit Gateway(GatewayConfig config);

        // Blocks until shutdown().
        void run();

        // Safe to call from any thread.
        void shutdown();

        // Bound port; differs from the configured one when that was 0.
        std::uint16_t port() const;

    private:
        void open_listener();
        void watch_signals();
        void accept_connection();
        void start_session(asio::ip::tcp::socket socket);
        void schedule_sweep();
        void sweep();

        GatewayConfig config_;
        std::size_t thread_count_;
        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;
        asio::steady_timer sweep_timer_;

        UploadRegistry uploads_;
        ProgressBoard progress_;

        std::vector<std::thread> io_threads_;
    };

} // namespace mediaup::server
