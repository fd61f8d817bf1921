#pragma once

#include "storage_config.hpp"
#include "chunkup/core/result.hpp"
#include <string>
#include <vector>
#include <span>
#include <filesystem>
#include <chrono>
#include <cstdint>

namespace chunkup::storage {

// Receives chunks on the server side and assembles them on finalize.
class ChunkStaging {
public:
    explicit ChunkStaging(const StorageConfig& config);

    // Ids become directory names, so only [A-Za-z0-9_-] is accepted.
    static bool is_valid_upload_id(const std::string& upload_id);

    core::Result write_chunk(const std::string& upload_id,
                             std::uint32_t chunk_index,
                             std::uint32_t total_chunks,
                             std::span<const std::uint8_t> chunk_data);

    core::Result read_chunk(const std::string& upload_id,
                            std::uint32_t chunk_index,
                            std::vector<std::uint8_t>& chunk_data) const;

    std::vector<std::uint32_t> get_missing_chunks(const std::string& upload_id,
                                                  std::uint32_t total_chunks) const;

    size_t staged_chunk_count(const std::string& upload_id) const;

    // Verifies every chunk is staged, concatenates them in index order into
    // the storage directory and drops the staging directory.
    core::Result merge_chunks(const std::string& upload_id,
                              const std::string& file_name,
                              std::uint32_t total_chunks,
                              std::filesystem::path& output_path);

    bool discard(const std::string& upload_id);

    // Drops staging directories untouched for longer than max_age.
    size_t cleanup_stale(std::chrono::hours max_age);

    std::filesystem::path get_chunk_path(const std::string& upload_id, std::uint32_t chunk_index) const;

private:
    StorageConfig config_;
};

} // namespace chunkup::storage
