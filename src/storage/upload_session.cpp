#include "chunkup/storage/upload_session.hpp"
#include "chunkup/storage/chunk_planner.hpp"
#include <algorithm>
#include <cmath>

namespace chunkup::storage {

std::string to_string(UploadStatus status) {
    switch (status) {
        case UploadStatus::PREPARING: return "preparing";
        case UploadStatus::UPLOADING: return "uploading";
        case UploadStatus::PAUSED: return "paused";
        case UploadStatus::COMPLETED: return "completed";
        case UploadStatus::ERROR: return "error";
    }
    return "unknown";
}

std::optional<UploadStatus> status_from_string(const std::string& value) {
    if (value == "preparing") return UploadStatus::PREPARING;
    if (value == "uploading") return UploadStatus::UPLOADING;
    if (value == "paused") return UploadStatus::PAUSED;
    if (value == "completed") return UploadStatus::COMPLETED;
    if (value == "error") return UploadStatus::ERROR;
    return std::nullopt;
}

UploadSession UploadSession::create(const std::string& upload_id,
                                    const FileInfo& file,
                                    std::uint64_t chunk_size,
                                    std::chrono::system_clock::time_point now,
                                    std::chrono::hours ttl) {
    UploadSession session;
    session.upload_id = upload_id;
    session.file_name = file.name;
    session.file_size = file.size;
    session.file_type = file.type;
    session.chunk_size = chunk_size;
    session.total_chunks = ChunkPlanner::plan(file.size, chunk_size);
    session.start_time = now;
    session.expires_at = now + ttl;
    session.status = UploadStatus::PREPARING;
    return session;
}

bool UploadSession::matches(const FileInfo& file) const {
    return file.name == file_name && file.size == file_size && file.type == file_type;
}

bool UploadSession::mark_chunk_uploaded(std::uint32_t chunk_index) {
    if (chunk_index >= total_chunks) {
        return false;
    }
    uploaded_chunks.insert(chunk_index);
    return true;
}

std::vector<std::uint32_t> UploadSession::missing_chunks() const {
    std::vector<std::uint32_t> missing;
    for (std::uint32_t i = 0; i < total_chunks; ++i) {
        if (!has_chunk(i)) {
            missing.push_back(i);
        }
    }
    return missing;
}

std::uint64_t UploadSession::uploaded_bytes() const {
    return std::min<std::uint64_t>(uploaded_chunks.size() * chunk_size, file_size);
}

int UploadSession::percentage() const {
    if (file_size == 0) {
        return 0;
    }
    return static_cast<int>(std::lround(static_cast<double>(uploaded_bytes()) / file_size * 100.0));
}

} // namespace chunkup::storage
