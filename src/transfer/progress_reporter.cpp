#include "chunkup/transfer/progress_reporter.hpp"
#include "chunkup/core/logger.hpp"
#include <exception>

namespace chunkup::transfer {

ProgressReporter::ProgressReporter(Callback callback, Clock clock)
    : callback_(std::move(callback))
    , clock_(clock ? std::move(clock) : Clock([]() { return std::chrono::system_clock::now(); })) {
}

UploadProgress ProgressReporter::report(const storage::UploadSession& session,
                                        std::chrono::system_clock::time_point now) {
    UploadProgress progress;
    progress.upload_id = session.upload_id;
    progress.uploaded_bytes = session.uploaded_bytes();
    progress.total_bytes = session.file_size;
    progress.uploaded_chunks = static_cast<std::uint32_t>(session.uploaded_chunks.size());
    progress.total_chunks = session.total_chunks;
    progress.percentage = session.percentage();
    progress.status = session.status;

    double elapsed = std::chrono::duration<double>(now - session.start_time).count();
    progress.speed = elapsed > 0.0 ? static_cast<double>(progress.uploaded_bytes) / elapsed : 0.0;
    progress.remaining_time = progress.speed > 0.0
        ? static_cast<double>(session.file_size - progress.uploaded_bytes) / progress.speed
        : 0.0;

    return progress;
}

UploadProgress ProgressReporter::snapshot(const storage::UploadSession& session) const {
    return report(session, clock_());
}

UploadProgress ProgressReporter::notify(const storage::UploadSession& session,
                                        const std::optional<UploadError>& error) const {
    auto progress = snapshot(session);
    progress.error = error;

    if (callback_) {
        try {
            callback_(progress);
        } catch (const std::exception& e) {
            LOG_WARN("Progress callback for {} threw: {}", session.upload_id, e.what());
        }
    }

    return progress;
}

} // namespace chunkup::transfer
