#pragma once

#include <cstdint>
#include <vector>

namespace chunkup::storage {

struct ChunkRange {
    std::uint64_t start;
    std::uint64_t end;   // exclusive

    std::uint64_t size() const { return end - start; }
    bool operator==(const ChunkRange&) const = default;
};

class ChunkPlanner {
public:
    static constexpr std::uint64_t DEFAULT_CHUNK_SIZE = 5 * 1024 * 1024;

    // ceil(file_size / chunk_size); throws std::invalid_argument on zero sizes.
    static std::uint32_t plan(std::uint64_t file_size, std::uint64_t chunk_size);

    // Throws std::out_of_range when chunk_index >= plan(file_size, chunk_size).
    static ChunkRange range(std::uint32_t chunk_index, std::uint64_t file_size, std::uint64_t chunk_size);

    static std::vector<ChunkRange> ranges(std::uint64_t file_size, std::uint64_t chunk_size);
};

} // namespace chunkup::storage
