#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "mediaup/client/chunk_planner.hpp"

namespace mediaup::client
{

    // One file's upload, as seen by the coordinator that drives it.
    struct UploadSession
    {
        std::string session_id;
        std::optional<std::string> upload_id;
        std::filesystem::path source;
        std::string filename;
        std::uint32_t speaker_count{2};
        ChunkPlan plan;

        std::uint64_t file_size() const noexcept { return plan.file_size; }
        std::uint32_t total_parts() const noexcept { return plan.total_parts; }
        mediaup::protocol::UploadStrategy strategy() const noexcept { return plan.strategy; }
    };

    struct PartRecord
    {
        std::uint32_t part_number{};
        ByteRange range;
        std::string etag;
    };

} // namespace mediaup::client
