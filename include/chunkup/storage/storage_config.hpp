#pragma once

#include <filesystem>
#include <string>
#include <chrono>
#include <cstdint>

namespace chunkup::storage {

// Server-side directory layout: chunks are staged per upload, merged files land in
// the storage directory.
struct StorageConfig {
    std::filesystem::path staging_directory;
    std::filesystem::path storage_directory;

    std::uint64_t max_chunk_size = 16ULL * 1024 * 1024;
    std::chrono::hours stale_staging_after{24};

    StorageConfig() = default;

    explicit StorageConfig(const std::filesystem::path& base_dir);

    bool validate() const;

    bool create_directories() const;

    std::filesystem::path get_staging_path(const std::string& upload_id) const;

    std::filesystem::path get_storage_path(const std::string& upload_id, const std::string& file_name) const;

    void set_base_directory(const std::filesystem::path& base_dir);
};

} // namespace chunkup::storage
