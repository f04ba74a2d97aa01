#include "mediaup/client/chunk_planner.hpp"

#include <limits>
#include <stdexcept>
#include <string>

namespace mediaup::client
{

    ChunkPlan plan_chunks(std::uint64_t file_size, const PlannerPolicy &policy)
    {
        if (file_size == 0)
        {
            throw std::invalid_argument("Cannot plan an upload for an empty file");
        }

        ChunkPlan plan{};
        plan.file_size = file_size;
        if (file_size < policy.direct_threshold)
        {
            plan.strategy = mediaup::protocol::UploadStrategy::Direct;
            plan.chunk_size = file_size;
            plan.total_parts = 1;
            return plan;
        }

        plan.strategy = mediaup::protocol::UploadStrategy::Multipart;
        plan.chunk_size = file_size < policy.large_file_threshold ? policy.small_chunk_size : policy.large_chunk_size;
        if (plan.chunk_size == 0)
        {
            throw std::invalid_argument("Chunk size must be positive");
        }
        const auto parts = (file_size + plan.chunk_size - 1) / plan.chunk_size;
        if (parts > std::numeric_limits<std::uint32_t>::max())
        {
            throw std::length_error("File needs " + std::to_string(parts) + " parts");
        }
        plan.total_parts = static_cast<std::uint32_t>(parts);
        return plan;
    }

    ByteRange byte_range(const ChunkPlan &plan, std::uint32_t part_number)
    {
        if (part_number == 0 || part_number > plan.total_parts)
        {
            throw std::out_of_range("Part " + std::to_string(part_number) + " outside 1.." +
                                    std::to_string(plan.total_parts));
        }
        const auto offset = plan.chunk_size * (part_number - 1);
        const auto length = part_number == plan.total_parts ? plan.file_size - offset : plan.chunk_size;
        return ByteRange{.offset = offset, .length = length};
    }

} // namespace mediaup::client
