#include "chunkup/storage/storage_config.hpp"
#include "chunkup/core/utils.hpp"

namespace chunkup::storage {

StorageConfig::StorageConfig(const std::filesystem::path& base_dir) {
    set_base_directory(base_dir);
}

bool StorageConfig::validate() const {
    if (staging_directory.empty() || storage_directory.empty()) {
        return false;
    }

    // Merging renames out of staging; the two trees must not overlap.
    auto staging = std::filesystem::weakly_canonical(staging_directory);
    auto storage = std::filesystem::weakly_canonical(storage_directory);
    if (staging == storage) {
        return false;
    }

    if (max_chunk_size == 0) {
        return false;
    }

    return true;
}

bool StorageConfig::create_directories() const {
    try {
        std::filesystem::create_directories(staging_directory);
        std::filesystem::create_directories(storage_directory);
        return true;
    } catch (const std::filesystem::filesystem_error&) {
        return false;
    }
}

std::filesystem::path StorageConfig::get_staging_path(const std::string& upload_id) const {
    return staging_directory / upload_id;
}

std::filesystem::path StorageConfig::get_storage_path(const std::string& upload_id,
                                                      const std::string& file_name) const {
    return storage_directory / (upload_id + "_" + core::utils::FileUtils::sanitize_file_name(file_name));
}

void StorageConfig::set_base_directory(const std::filesystem::path& base_dir) {
    staging_directory = base_dir / "staging";
    storage_directory = base_dir / "files";
}

} // namespace chunkup::storage
