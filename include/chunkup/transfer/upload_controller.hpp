#pragma once

#include "chunkup/storage/upload_session.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <cstdint>

namespace chunkup::transfer {

class CancellationSource;

// Observer side of a cancellation signal. A default-constructed token is never
// cancelled.
class CancellationToken {
public:
    using Callback = std::function<void()>;
    using Registration = std::uint64_t;

    CancellationToken() = default;

    bool is_cancelled() const;

    // Runs the callback right away when already cancelled (and returns 0).
    Registration on_cancel(Callback callback) const;
    void remove(Registration registration) const;

private:
    friend class CancellationSource;

    struct State {
        std::mutex mutex;
        bool cancelled = false;
        Registration next_id = 1;
        std::map<Registration, Callback> callbacks;
    };

    explicit CancellationToken(std::shared_ptr<State> state) : state_(std::move(state)) {}

    std::shared_ptr<State> state_;
};

class CancellationSource {
public:
    CancellationSource();

    CancellationToken token() const { return CancellationToken(state_); }

    // Idempotent; callbacks fire once, outside the lock.
    void cancel();
    bool is_cancelled() const;

private:
    std::shared_ptr<CancellationToken::State> state_;
};

// Pause/cancel state machine over UploadStatus. Each uploading run gets a fresh
// cancellation source so pause aborts only the requests of the run it ends.
class UploadController {
public:
    explicit UploadController(storage::UploadStatus initial = storage::UploadStatus::PREPARING);

    static bool can_transition(storage::UploadStatus from, storage::UploadStatus to);

    storage::UploadStatus status() const { return status_; }

    bool start();      // preparing|paused -> uploading
    bool pause();      // uploading -> paused
    bool resume();     // paused -> uploading
    bool cancel();     // any non-terminal -> error, flagged as cancelled
    bool fail();       // preparing|uploading|paused -> error
    bool complete();   // uploading|paused -> completed

    bool is_cancelled() const { return cancelled_; }
    bool is_terminal() const;
    bool should_schedule() const;

    CancellationToken token() const { return source_->token(); }

private:
    storage::UploadStatus status_;
    bool cancelled_;
    std::unique_ptr<CancellationSource> source_;

    bool transition(storage::UploadStatus to);
    void begin_run();
};

} // namespace chunkup::transfer
