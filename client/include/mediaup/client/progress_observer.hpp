#pragma once

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "mediaup/client/logger.hpp"
#include "mediaup/client/services.hpp"
#include "mediaup/protocol.hpp"

namespace mediaup::client
{

    inline constexpr std::chrono::milliseconds kDefaultPollInterval{5000};

    struct ObservedSession
    {
        std::string session_id;
        mediaup::protocol::SessionStatus status{mediaup::protocol::SessionStatus::Unknown};
        double progress{};
        std::string message;
        std::string stage;
        std::string timestamp;
        // False until the store has returned a record for the session.
        bool seen{false};
    };

    /**
     * Read-only view of a set of sessions, reconciled from periodic fetches.
     *
     * Reported progress is the maximum of everything seen so far and the caller's baseline, and
     * the reported phase never moves backwards. Sessions that reach a terminal status are not
     * fetched again.
     */
    class ProgressObserver
    {
    public:
        using Listener = std::function<void(const ObservedSession &)>;

        ProgressObserver(ProgressStore &store, Logger logger,
                         std::chrono::milliseconds interval = kDefaultPollInterval);

        void watch(const std::string &session_id, std::optional<double> baseline = std::nullopt);

        void on_update(Listener listener);

        // One polling round over every non-terminal session. Returns the number fetched.
        std::size_t poll_once();

        std::optional<ObservedSession> snapshot(const std::string &session_id) const;
        std::vector<ObservedSession> snapshot() const;

        bool all_terminal() const;

        // Polls on the interval until every session is terminal or stop() is called.
        void run();
        void stop();

    private:
        struct Entry
        {
            ObservedSession state;
            double baseline{};
        };

        void arm(asio::steady_timer &timer);

        ProgressStore &store_;
        Logger logger_;
        std::chrono::milliseconds interval_;
        asio::io_context io_context_;
        std::atomic<bool> stopped_{false};

        mutable std::mutex mutex_;
        std::map<std::string, Entry> sessions_;
        Listener listener_;
    };

} // namespace mediaup::client
