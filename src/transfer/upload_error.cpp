#include "chunkup/transfer/upload_error.hpp"

namespace chunkup::transfer {

std::string to_string(UploadErrorKind kind) {
    switch (kind) {
        case UploadErrorKind::VALIDATION_FAILED: return "validation_failed";
        case UploadErrorKind::CHUNK_FAILED: return "chunk_failed";
        case UploadErrorKind::MERGE_FAILED: return "merge_failed";
        case UploadErrorKind::CANCELLED: return "cancelled";
        case UploadErrorKind::SESSION_NOT_FOUND: return "session_not_found";
        case UploadErrorKind::SESSION_EXPIRED: return "session_expired";
        case UploadErrorKind::SESSION_LOCKED: return "session_locked";
        case UploadErrorKind::SOURCE_READ_FAILED: return "source_read_failed";
        case UploadErrorKind::INVALID_STATE: return "invalid_state";
    }
    return "unknown";
}

UploadError UploadError::validation_failed(std::string reason) {
    return UploadError{UploadErrorKind::VALIDATION_FAILED, std::move(reason)};
}

UploadError UploadError::chunk_failed(std::uint32_t chunk_index, std::uint32_t attempts, std::string last_error) {
    return UploadError{UploadErrorKind::CHUNK_FAILED, std::move(last_error), chunk_index, attempts};
}

UploadError UploadError::merge_failed(std::string reason) {
    return UploadError{UploadErrorKind::MERGE_FAILED, std::move(reason)};
}

UploadError UploadError::cancelled() {
    return UploadError{UploadErrorKind::CANCELLED, {}};
}

UploadError UploadError::session_not_found(const std::string& upload_id) {
    return UploadError{UploadErrorKind::SESSION_NOT_FOUND, upload_id};
}

UploadError UploadError::session_expired(const std::string& upload_id) {
    return UploadError{UploadErrorKind::SESSION_EXPIRED, upload_id};
}

UploadError UploadError::session_locked(const std::string& upload_id) {
    return UploadError{UploadErrorKind::SESSION_LOCKED, upload_id};
}

UploadError UploadError::source_read_failed(std::string reason) {
    return UploadError{UploadErrorKind::SOURCE_READ_FAILED, std::move(reason)};
}

UploadError UploadError::invalid_state(std::string reason) {
    return UploadError{UploadErrorKind::INVALID_STATE, std::move(reason)};
}

std::string UploadError::message() const {
    switch (kind) {
        case UploadErrorKind::VALIDATION_FAILED:
            return reason;
        case UploadErrorKind::CHUNK_FAILED:
            return "Failed to upload chunk " + std::to_string(chunk_index) +
                   " after " + std::to_string(retries()) + " retries";
        case UploadErrorKind::MERGE_FAILED:
            return "Failed to merge chunks: " + reason;
        case UploadErrorKind::CANCELLED:
            return "Upload cancelled";
        case UploadErrorKind::SESSION_NOT_FOUND:
            return "Upload session not found: " + reason;
        case UploadErrorKind::SESSION_EXPIRED:
            return "Upload session expired: " + reason;
        case UploadErrorKind::SESSION_LOCKED:
            return "Upload session is in use by another uploader: " + reason;
        case UploadErrorKind::SOURCE_READ_FAILED:
            return "Failed to read source file: " + reason;
        case UploadErrorKind::INVALID_STATE:
            return reason;
    }
    return reason;
}

} // namespace chunkup::transfer
