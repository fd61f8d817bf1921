#pragma once

#include "upload_error.hpp"
#include "chunkup/storage/upload_session.hpp"
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <cstdint>

namespace chunkup::transfer {

struct UploadProgress {
    std::string upload_id;
    std::uint64_t uploaded_bytes;
    std::uint64_t total_bytes;
    std::uint32_t uploaded_chunks;
    std::uint32_t total_chunks;
    int percentage;
    double speed;            // bytes per second since start_time
    double remaining_time;   // seconds, 0 while speed is unknown
    storage::UploadStatus status;
    std::optional<UploadError> error;
};

class ProgressReporter {
public:
    using Callback = std::function<void(const UploadProgress&)>;
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    explicit ProgressReporter(Callback callback = nullptr, Clock clock = nullptr);

    static UploadProgress report(const storage::UploadSession& session,
                                 std::chrono::system_clock::time_point now);

    // Computes progress at the current time and hands it to the callback. The
    // callback's failures never reach the caller.
    UploadProgress notify(const storage::UploadSession& session,
                          const std::optional<UploadError>& error = std::nullopt) const;

    UploadProgress snapshot(const storage::UploadSession& session) const;

    void set_callback(Callback callback) { callback_ = std::move(callback); }
    bool has_callback() const { return static_cast<bool>(callback_); }

private:
    Callback callback_;
    Clock clock_;
};

} // namespace chunkup::transfer
