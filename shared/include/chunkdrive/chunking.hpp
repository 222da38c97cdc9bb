/**
 * ChunkDrive - Chunk layout arithmetic shared by the scheduler and the coordinator.
 *
 * A file of total_size bytes is cut into ceil(total_size / chunk_size) chunks. Chunk i starts at
 * i * chunk_size; every chunk is chunk_size bytes long except the last, which carries the remainder.
 */
#pragma once

#include <cstdint>

namespace chunkdrive
{

    inline constexpr std::uint64_t kDefaultChunkSize = 5ULL * 1024 * 1024;

    constexpr std::uint64_t chunk_count(std::uint64_t total_size, std::uint64_t chunk_size) noexcept
    {
        if (chunk_size == 0)
        {
            return 0;
        }
        return (total_size + chunk_size - 1) / chunk_size;
    }

    constexpr std::uint64_t chunk_offset(std::uint64_t index, std::uint64_t chunk_size) noexcept
    {
        return index * chunk_size;
    }

    // Zero for indices past the end of the file.
    constexpr std::uint64_t chunk_length(std::uint64_t index, std::uint64_t total_size,
                                         std::uint64_t chunk_size) noexcept
    {
        const auto offset = chunk_offset(index, chunk_size);
        if (offset >= total_size)
        {
            return 0;
        }
        const auto remaining = total_size - offset;
        return remaining < chunk_size ? remaining : chunk_size;
    }

} // namespace chunkdrive
