#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mediaup::client
{

    enum class ClientMode
    {
        Upload,
        Watch
    };

    struct WatchTarget
    {
        std::string session_id;
        std::optional<double> baseline;
    };

    struct ClientConfig
    {
        std::string host;
        std::uint16_t port{};
        ClientMode mode{ClientMode::Upload};
        std::vector<std::filesystem::path> files;
        std::vector<WatchTarget> targets;
        std::uint32_t speaker_count{2};
        std::uint32_t parallel_parts{1};
        std::uint32_t max_attempts{3};
        bool watch_uploads{false};
        std::chrono::seconds poll_interval{5};
        std::optional<std::filesystem::path> log_path;
        bool verbose{false};
    };

    std::string usage();

    // Throws std::runtime_error describing the first invalid argument.
    ClientConfig parse_arguments(int argc, char *argv[]);

} // namespace mediaup::client
