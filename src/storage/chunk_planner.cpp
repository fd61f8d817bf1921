#include "chunkup/storage/chunk_planner.hpp"
#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>

namespace chunkup::storage {

std::uint32_t ChunkPlanner::plan(std::uint64_t file_size, std::uint64_t chunk_size) {
    if (chunk_size == 0) {
        throw std::invalid_argument("Chunk size must be positive");
    }
    if (file_size == 0) {
        throw std::invalid_argument("File size must be positive");
    }

    std::uint64_t chunks = file_size / chunk_size + (file_size % chunk_size != 0 ? 1 : 0);
    if (chunks > std::numeric_limits<std::uint32_t>::max()) {
        throw std::invalid_argument("Chunk size too small for file of " + std::to_string(file_size) + " bytes");
    }
    return static_cast<std::uint32_t>(chunks);
}

ChunkRange ChunkPlanner::range(std::uint32_t chunk_index, std::uint64_t file_size, std::uint64_t chunk_size) {
    auto total = plan(file_size, chunk_size);
    if (chunk_index >= total) {
        throw std::out_of_range("Chunk index " + std::to_string(chunk_index) +
                                " out of range for " + std::to_string(total) + " chunks");
    }

    std::uint64_t start = static_cast<std::uint64_t>(chunk_index) * chunk_size;
    return ChunkRange{start, std::min(start + chunk_size, file_size)};
}

std::vector<ChunkRange> ChunkPlanner::ranges(std::uint64_t file_size, std::uint64_t chunk_size) {
    auto total = plan(file_size, chunk_size);

    std::vector<ChunkRange> result;
    result.reserve(total);
    for (std::uint32_t i = 0; i < total; ++i) {
        std::uint64_t start = static_cast<std::uint64_t>(i) * chunk_size;
        result.push_back(ChunkRange{start, std::min(start + chunk_size, file_size)});
    }
    return result;
}

} // namespace chunkup::storage
