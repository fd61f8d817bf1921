#pragma once

#include <string>
#include <vector>
#include <set>
#include <chrono>
#include <optional>
#include <cstdint>

namespace chunkup::storage {

enum class UploadStatus {
    PREPARING,
    UPLOADING,
    PAUSED,
    COMPLETED,
    ERROR
};

std::string to_string(UploadStatus status);
std::optional<UploadStatus> status_from_string(const std::string& value);

struct FileInfo {
    std::string name;
    std::uint64_t size = 0;
    std::string type;

    bool operator==(const FileInfo&) const = default;
};

struct UploadSession {
    static constexpr std::chrono::hours DEFAULT_TTL{24};

    std::string upload_id;
    std::string file_name;
    std::uint64_t file_size = 0;
    std::string file_type;
    std::uint64_t chunk_size = 0;
    std::uint32_t total_chunks = 0;
    std::set<std::uint32_t> uploaded_chunks;
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point expires_at;
    UploadStatus status = UploadStatus::PREPARING;

    UploadSession() = default;

    // Plans the chunk count; throws std::invalid_argument on zero sizes.
    static UploadSession create(const std::string& upload_id,
                                const FileInfo& file,
                                std::uint64_t chunk_size,
                                std::chrono::system_clock::time_point now,
                                std::chrono::hours ttl = DEFAULT_TTL);

    FileInfo file_info() const { return FileInfo{file_name, file_size, file_type}; }

    // Same name, size and type.
    bool matches(const FileInfo& file) const;

    bool is_expired(std::chrono::system_clock::time_point now) const { return expires_at <= now; }
    bool is_complete() const { return uploaded_chunks.size() == total_chunks; }
    bool has_chunk(std::uint32_t chunk_index) const { return uploaded_chunks.count(chunk_index) > 0; }

    // False when the index lies outside [0, total_chunks).
    bool mark_chunk_uploaded(std::uint32_t chunk_index);

    std::vector<std::uint32_t> missing_chunks() const;

    // |uploaded_chunks| * chunk_size, capped at file_size.
    std::uint64_t uploaded_bytes() const;
    int percentage() const;
};

} // namespace chunkup::storage
