#pragma once

#include "upload_controller.hpp"
#include "chunkup/storage/upload_session.hpp"
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace chunkup::transfer {

using ExtraFields = std::map<std::string, std::string>;

struct ValidationResult {
    bool valid;
    std::string error;

    static ValidationResult ok() { return {true, {}}; }
    static ValidationResult invalid(std::string reason) { return {false, std::move(reason)}; }
};

struct ChunkRequest {
    std::string upload_id;
    std::uint32_t chunk_index;
    std::uint32_t total_chunks;
    std::string file_name;
    std::string file_type;
    std::uint64_t file_size;
    ExtraFields extra_fields;
    std::vector<std::uint8_t> data;
};

struct ChunkResponse {
    bool success;
    std::string error;
};

struct MergeRequest {
    std::string upload_id;
    std::string file_name;
    std::string file_type;
    std::uint64_t file_size;
    std::uint32_t total_chunks;
    ExtraFields extra_fields;
};

struct MergeResponse {
    std::optional<std::string> storage_path;
    std::string error;
};

// The backend the engine uploads to. Handlers must be invoked exactly once, on
// the io_context the engine runs on, and never from inside the initiating call.
class UploadService {
public:
    using ChunkHandler = std::function<void(ChunkResponse)>;
    using MergeHandler = std::function<void(MergeResponse)>;

    virtual ~UploadService() = default;

    virtual ValidationResult validate_file(const storage::FileInfo& file) = 0;

    // A cancelled token should abort the request and complete it with a failure.
    virtual void async_upload_chunk(ChunkRequest request, CancellationToken token, ChunkHandler handler) = 0;

    virtual void async_merge_chunks(MergeRequest request, CancellationToken token, MergeHandler handler) = 0;
};

} // namespace chunkup::transfer
