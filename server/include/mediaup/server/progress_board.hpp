#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

#include "mediaup/protocol.hpp"
#include "mediaup/server/registry_error.hpp"

namespace mediaup::server
{

    // Latest progress record per session, kept for `ttl` after its last write. Last write wins.
    class ProgressBoard
    {
    public:
        explicit ProgressBoard(std::chrono::seconds ttl = std::chrono::seconds{3600});

        // Stamps the record with the current UTC time and stores it. Throws RegistryError(InvalidPayload).
        mediaup::protocol::ProgressRecord publish(mediaup::protocol::ProgressRecord record);

        // A record with status Unknown when nothing is stored for the session.
        mediaup::protocol::ProgressRecord fetch(const std::string &session_id);

        std::size_t purge_expired();

        std::size_t size() const;

    private:
        using Clock = std::chrono::steady_clock;

        struct Entry
        {
            mediaup::protocol::ProgressRecord record;
            Clock::time_point expires_at;
        };

        std::chrono::seconds ttl_;
        mutable std::mutex mutex_;
        std::unordered_map<std::string, Entry> records_;
    };

} // namespace mediaup::server
