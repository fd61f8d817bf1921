#pragma once

#include <string>
#include <optional>
#include <cstdint>

namespace chunkup::transfer {

enum class UploadErrorKind {
    VALIDATION_FAILED,
    CHUNK_FAILED,
    MERGE_FAILED,
    CANCELLED,
    SESSION_NOT_FOUND,
    SESSION_EXPIRED,
    SESSION_LOCKED,
    SOURCE_READ_FAILED,
    INVALID_STATE
};

std::string to_string(UploadErrorKind kind);

struct UploadError {
    UploadErrorKind kind;
    std::string reason;
    std::uint32_t chunk_index = 0;
    std::uint32_t attempts = 0;

    static UploadError validation_failed(std::string reason);
    static UploadError chunk_failed(std::uint32_t chunk_index, std::uint32_t attempts, std::string last_error = "");
    static UploadError merge_failed(std::string reason);
    static UploadError cancelled();
    static UploadError session_not_found(const std::string& upload_id);
    static UploadError session_expired(const std::string& upload_id);
    static UploadError session_locked(const std::string& upload_id);
    static UploadError source_read_failed(std::string reason);
    static UploadError invalid_state(std::string reason);

    std::uint32_t retries() const { return attempts > 0 ? attempts - 1 : 0; }

    // Human-readable text, e.g. "Failed to upload chunk 3 after 3 retries".
    std::string message() const;

    bool operator==(const UploadError&) const = default;
};

struct UploadOutcome {
    std::string upload_id;
    std::optional<UploadError> error;
    std::string storage_path;

    bool success() const { return !error.has_value(); }
    bool cancelled() const { return error && error->kind == UploadErrorKind::CANCELLED; }

    static UploadOutcome completed(std::string upload_id, std::string storage_path) {
        return UploadOutcome{std::move(upload_id), std::nullopt, std::move(storage_path)};
    }
    static UploadOutcome failed(std::string upload_id, UploadError error) {
        return UploadOutcome{std::move(upload_id), std::move(error), {}};
    }
};

} // namespace chunkup::transfer
