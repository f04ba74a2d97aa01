#pragma once

#include <cstdint>

#include "mediaup/protocol.hpp"

namespace mediaup::client
{

    inline constexpr std::uint64_t kMiB = 1024ULL * 1024ULL;
    inline constexpr std::uint64_t kGiB = 1024ULL * kMiB;

    struct PlannerPolicy
    {
        std::uint64_t direct_threshold{10 * kMiB};
        std::uint64_t small_chunk_size{5 * kMiB};
        std::uint64_t large_chunk_size{10 * kMiB};
        // Files at or above this size use large_chunk_size.
        std::uint64_t large_file_threshold{kGiB};
    };

    struct ChunkPlan
    {
        mediaup::protocol::UploadStrategy strategy{mediaup::protocol::UploadStrategy::Direct};
        std::uint64_t file_size{};
        std::uint64_t chunk_size{};
        std::uint32_t total_parts{};
    };

    struct ByteRange
    {
        std::uint64_t offset{};
        std::uint64_t length{};
    };

    // Throws std::invalid_argument for an empty file, or std::length_error if the
    // part count does not fit the protocol's 32-bit part numbers.
    ChunkPlan plan_chunks(std::uint64_t file_size, const PlannerPolicy &policy = {});

    // part_number is 1-based. Throws std::out_of_range outside 1..total_parts.
    ByteRange byte_range(const ChunkPlan &plan, std::uint32_t part_number);

} // namespace mediaup::client
