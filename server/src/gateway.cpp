#include "mediaup/server/gateway.hpp"

#include <asio/ip/address.hpp>
#include <asio/post.hpp>

#include <csignal>
#include <exception>
#include <memory>

#include <spdlog/spdlog.h>

#include "mediaup/server/session.hpp"

namespace mediaup::server
{

    namespace
    {

        std::size_t effective_threads(std::size_t requested)
        {
            if (requested > 0)
            {
                return requested;
            }
            const auto cores = std::thread::hardware_concurrency();
            return cores == 0 ? 2 : cores;
        }

    } // namespace

    Gateway::Gateway(GatewayConfig config)
        : config_(std::move(config)),
          thread_count_(effective_threads(config_.io_threads)),
          io_context_(static_cast<int>(thread_count_)),
          acceptor_(io_context_),
          signals_(io_context_, SIGINT, SIGTERM),
          sweep_timer_(io_context_),
          uploads_(config_.storage_root, config_.max_file_size),
          progress_(config_.progress_ttl)
    {
        open_listener();
        watch_signals();
    }

    void Gateway::open_listener()
    {
        const asio::ip::tcp::endpoint endpoint(asio::ip::make_address(config_.listen_address), config_.listen_port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();
        spdlog::info("Gateway listening on {}:{}, storage at {}", config_.listen_address, port(),
                     config_.storage_root.string());
    }

    void Gateway::watch_signals()
    {
        signals_.async_wait([this](const std::error_code &ec, int signal_number)
                            {
            if (ec)
            {
                return;
            }
            spdlog::info("Received signal {}, shutting down", signal_number);
            shutdown(); });
    }

    void Gateway::run()
    {
        accept_connection();
        schedule_sweep();

        io_threads_.reserve(thread_count_ - 1);
        for (std::size_t i = 1; i < thread_count_; ++i)
        {
            io_threads_.emplace_back([this]
                                     { io_context_.run(); });
        }
        spdlog::info("Serving with {} I/O thread(s)", thread_count_);
        io_context_.run();

        for (auto &thread : io_threads_)
        {
            thread.join();
        }
        io_threads_.clear();
    }

    void Gateway::shutdown()
    {
        asio::post(io_context_, [this]
                   {
            std::error_code ec;
            acceptor_.close(ec);
            sweep_timer_.cancel();
            signals_.cancel();
            io_context_.stop(); });
    }

    std::uint16_t Gateway::port() const
    {
        return acceptor_.local_endpoint().port();
    }

    void Gateway::accept_connection()
    {
        acceptor_.async_accept([this](const std::error_code &ec, asio::ip::tcp::socket socket)
                               {
            if (!acceptor_.is_open())
            {
                return;
            }
            if (ec)
            {
                spdlog::warn("Accept failed: {}", ec.message());
            }
            else
            {
                start_session(std::move(socket));
            }
            accept_connection(); });
    }

    void Gateway::start_session(asio::ip::tcp::socket socket)
    {
        GatewayContext context{uploads_, progress_, config_.idle_timeout};
        std::make_shared<Session>(std::move(socket), context)->start();
    }

    void Gateway::schedule_sweep()
    {
        sweep_timer_.expires_after(config_.maintenance_interval);
        sweep_timer_.async_wait([this](const std::error_code &ec)
                                {
            if (ec)
            {
                return;
            }
            sweep();
            schedule_sweep(); });
    }

    void Gateway::sweep()
    {
        try
        {
            const auto reaped = uploads_.cleanup_expired(config_.idle_timeout);
            const auto purged = progress_.purge_expired();
            if (reaped > 0 || purged > 0)
            {
                spdlog::info("Sweep reaped {} idle upload(s), purged {} progress record(s)", reaped, purged);
            }
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Sweep failed: {}", ex.what());
        }
    }

} // namespace mediaup::server
