#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace mediaup::server
{

    inline constexpr std::uint64_t kDefaultMaxFileSize = 5ULL * 1024 * 1024 * 1024;

    struct GatewayConfig
    {
        std::string listen_address{"0.0.0.0"};
        std::uint16_t listen_port{0};
        // Holds upload metadata, stored parts and finished objects.
        std::filesystem::path storage_root;
        // 0 picks one thread per hardware core.
        std::size_t io_threads{0};
        std::chrono::seconds idle_timeout{std::chrono::hours{1}};
        std::chrono::seconds progress_ttl{std::chrono::hours{1}};
        std::chrono::seconds maintenance_interval{std::chrono::minutes{1}};
        // Larger uploads are refused at initialization.
        std::uint64_t max_file_size{kDefaultMaxFileSize};
        std::optional<std::filesystem::path> log_file;
    };

} // namespace mediaup::server
