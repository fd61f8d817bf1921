#include "chunkup/storage/chunk_staging.hpp"
#include "chunkup/core/logger.hpp"
#include "chunkup/core/utils.hpp"
#include <fstream>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>

namespace chunkup::storage {

using core::ErrorCode;
using core::Result;

ChunkStaging::ChunkStaging(const StorageConfig& config)
    : config_(config) {
}

bool ChunkStaging::is_valid_upload_id(const std::string& upload_id) {
    if (upload_id.empty() || upload_id.size() > 128) {
        return false;
    }
    return std::all_of(upload_id.begin(), upload_id.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-';
    });
}

Result ChunkStaging::write_chunk(const std::string& upload_id,
                                 std::uint32_t chunk_index,
                                 std::uint32_t total_chunks,
                                 std::span<const std::uint8_t> chunk_data) {
    if (!is_valid_upload_id(upload_id)) {
        return Result(ErrorCode::INVALID_ARGUMENT, "Invalid upload id");
    }
    if (total_chunks == 0 || chunk_index >= total_chunks) {
        return Result(ErrorCode::INVALID_ARGUMENT,
                      "Chunk index " + std::to_string(chunk_index) + " out of range");
    }
    if (chunk_data.empty()) {
        return Result(ErrorCode::INVALID_ARGUMENT, "Empty chunk");
    }
    if (chunk_data.size() > config_.max_chunk_size) {
        return Result(ErrorCode::INVALID_ARGUMENT, "Chunk exceeds maximum size");
    }

    auto chunk_path = get_chunk_path(upload_id, chunk_index);
    std::error_code ec;
    std::filesystem::create_directories(chunk_path.parent_path(), ec);
    if (ec) {
        return Result(ErrorCode::FILE_WRITE_ERROR, "Cannot create staging directory: " + ec.message());
    }

    // Write-then-rename so a half-written chunk never counts as staged.
    auto temp_path = chunk_path;
    temp_path += ".part";
    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            return Result(ErrorCode::FILE_WRITE_ERROR, "Cannot open chunk file");
        }
        file.write(reinterpret_cast<const char*>(chunk_data.data()),
                   static_cast<std::streamsize>(chunk_data.size()));
        if (!file.good()) {
            return Result(ErrorCode::FILE_WRITE_ERROR, "Failed to write chunk");
        }
    }

    std::filesystem::rename(temp_path, chunk_path, ec);
    if (ec) {
        std::filesystem::remove(temp_path, ec);
        return Result(ErrorCode::FILE_WRITE_ERROR, "Failed to commit chunk");
    }

    LOG_DEBUG("Staged chunk {}/{} for {} ({} bytes)", chunk_index + 1, total_chunks, upload_id, chunk_data.size());
    return Result();
}

Result ChunkStaging::read_chunk(const std::string& upload_id,
                                std::uint32_t chunk_index,
                                std::vector<std::uint8_t>& chunk_data) const {
    auto chunk_path = get_chunk_path(upload_id, chunk_index);

    std::ifstream file(chunk_path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        return Result(ErrorCode::NOT_FOUND, "Chunk " + std::to_string(chunk_index) + " not staged");
    }

    auto size = file.tellg();
    file.seekg(0);
    chunk_data.resize(static_cast<size_t>(size));
    file.read(reinterpret_cast<char*>(chunk_data.data()), size);
    if (!file.good()) {
        return Result(ErrorCode::FILE_READ_ERROR, "Failed to read chunk " + std::to_string(chunk_index));
    }
    return Result();
}

std::vector<std::uint32_t> ChunkStaging::get_missing_chunks(const std::string& upload_id,
                                                            std::uint32_t total_chunks) const {
    std::vector<std::uint32_t> missing;
    for (std::uint32_t i = 0; i < total_chunks; ++i) {
        if (!std::filesystem::exists(get_chunk_path(upload_id, i))) {
            missing.push_back(i);
        }
    }
    return missing;
}

size_t ChunkStaging::staged_chunk_count(const std::string& upload_id) const {
    auto dir = config_.get_staging_path(upload_id);
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return 0;
    }

    size_t count = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        auto name = entry.path().filename().string();
        if (entry.is_regular_file() && core::utils::StringUtils::starts_with(name, "chunk_") &&
            !core::utils::StringUtils::ends_with(name, ".part")) {
            ++count;
        }
    }
    return count;
}

Result ChunkStaging::merge_chunks(const std::string& upload_id,
                                  const std::string& file_name,
                                  std::uint32_t total_chunks,
                                  std::filesystem::path& output_path) {
    if (!is_valid_upload_id(upload_id)) {
        return Result(ErrorCode::INVALID_ARGUMENT, "Invalid upload id");
    }
    if (total_chunks == 0) {
        return Result(ErrorCode::INVALID_ARGUMENT, "Total chunks must be positive");
    }

    auto staged = staged_chunk_count(upload_id);
    if (staged == 0) {
        return Result(ErrorCode::NOT_FOUND, "Upload session not found");
    }
    if (staged != total_chunks) {
        return Result(ErrorCode::INCOMPLETE_UPLOAD,
                      "Not all chunks uploaded (" + std::to_string(staged) + " of " +
                      std::to_string(total_chunks) + ")");
    }

    auto missing = get_missing_chunks(upload_id, total_chunks);
    if (!missing.empty()) {
        std::vector<std::string> names;
        for (auto index : missing) {
            names.push_back(std::to_string(index));
        }
        return Result(ErrorCode::INCOMPLETE_UPLOAD,
                      "Missing chunks: " + core::utils::StringUtils::join(names, ", "));
    }

    std::error_code ec;
    std::filesystem::create_directories(config_.storage_directory, ec);
    if (ec) {
        return Result(ErrorCode::FILE_WRITE_ERROR, "Cannot create storage directory: " + ec.message());
    }

    auto final_path = config_.get_storage_path(upload_id, file_name);
    auto temp_path = final_path;
    temp_path += ".part";

    {
        std::ofstream output_file(temp_path, std::ios::binary | std::ios::trunc);
        if (!output_file.is_open()) {
            return Result(ErrorCode::FILE_WRITE_ERROR, "Cannot open output file");
        }

        std::vector<std::uint8_t> chunk_data;
        for (std::uint32_t i = 0; i < total_chunks; ++i) {
            auto result = read_chunk(upload_id, i, chunk_data);
            if (!result.success()) {
                output_file.close();
                std::filesystem::remove(temp_path, ec);
                return result;
            }

            output_file.write(reinterpret_cast<const char*>(chunk_data.data()),
                              static_cast<std::streamsize>(chunk_data.size()));
            if (!output_file.good()) {
                output_file.close();
                std::filesystem::remove(temp_path, ec);
                return Result(ErrorCode::FILE_WRITE_ERROR, "Failed to write merged file");
            }
        }
    }

    std::filesystem::rename(temp_path, final_path, ec);
    if (ec) {
        std::filesystem::remove(temp_path, ec);
        return Result(ErrorCode::FILE_WRITE_ERROR, "Failed to commit merged file");
    }

    if (!discard(upload_id)) {
        LOG_WARN("Merged {} but could not remove its staging directory", upload_id);
    }

    output_path = final_path;
    LOG_INFO("Merged {} chunks of {} into {}", total_chunks, upload_id, final_path.string());
    return Result();
}

bool ChunkStaging::discard(const std::string& upload_id) {
    if (!is_valid_upload_id(upload_id)) {
        return false;
    }

    std::error_code ec;
    std::filesystem::remove_all(config_.get_staging_path(upload_id), ec);
    return !ec;
}

size_t ChunkStaging::cleanup_stale(std::chrono::hours max_age) {
    std::error_code ec;
    if (!std::filesystem::is_directory(config_.staging_directory, ec)) {
        return 0;
    }

    auto cutoff = std::filesystem::file_time_type::clock::now() - max_age;
    std::vector<std::filesystem::path> stale;

    for (const auto& entry : std::filesystem::directory_iterator(config_.staging_directory, ec)) {
        if (!entry.is_directory()) continue;

        auto modified = std::filesystem::last_write_time(entry.path(), ec);
        if (!ec && modified < cutoff) {
            stale.push_back(entry.path());
        }
    }

    size_t removed = 0;
    for (const auto& path : stale) {
        std::filesystem::remove_all(path, ec);
        if (!ec) {
            ++removed;
            LOG_INFO("Removed stale staging directory {}", path.string());
        }
    }
    return removed;
}

std::filesystem::path ChunkStaging::get_chunk_path(const std::string& upload_id, std::uint32_t chunk_index) const {
    std::ostringstream filename;
    filename << "chunk_" << std::setfill('0') << std::setw(6) << chunk_index;

    return config_.get_staging_path(upload_id) / filename.str();
}

} // namespace chunkup::storage
