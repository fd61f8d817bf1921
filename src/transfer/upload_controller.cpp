#include "chunkup/transfer/upload_controller.hpp"
#include "chunkup/core/logger.hpp"
#include <vector>

namespace chunkup::transfer {

using storage::UploadStatus;

bool CancellationToken::is_cancelled() const {
    if (!state_) return false;
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

CancellationToken::Registration CancellationToken::on_cancel(Callback callback) const {
    if (!state_) return 0;

    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->cancelled) {
            auto id = state_->next_id++;
            state_->callbacks.emplace(id, std::move(callback));
            return id;
        }
    }

    callback();
    return 0;
}

void CancellationToken::remove(Registration registration) const {
    if (!state_ || registration == 0) return;
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->callbacks.erase(registration);
}

CancellationSource::CancellationSource()
    : state_(std::make_shared<CancellationToken::State>()) {
}

void CancellationSource::cancel() {
    std::vector<CancellationToken::Callback> callbacks;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled) return;
        state_->cancelled = true;
        for (auto& [id, callback] : state_->callbacks) {
            callbacks.push_back(std::move(callback));
        }
        state_->callbacks.clear();
    }

    for (auto& callback : callbacks) {
        callback();
    }
}

bool CancellationSource::is_cancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

UploadController::UploadController(UploadStatus initial)
    : status_(initial)
    , cancelled_(false)
    , source_(std::make_unique<CancellationSource>()) {
}

bool UploadController::can_transition(UploadStatus from, UploadStatus to) {
    switch (to) {
        case UploadStatus::UPLOADING:
            return from == UploadStatus::PREPARING || from == UploadStatus::PAUSED;
        case UploadStatus::PAUSED:
            return from == UploadStatus::UPLOADING;
        case UploadStatus::ERROR:
            return from == UploadStatus::PREPARING || from == UploadStatus::UPLOADING ||
                   from == UploadStatus::PAUSED;
        case UploadStatus::COMPLETED:
            return from == UploadStatus::UPLOADING || from == UploadStatus::PAUSED;
        case UploadStatus::PREPARING:
            return false;
    }
    return false;
}

bool UploadController::transition(UploadStatus to) {
    if (!can_transition(status_, to)) {
        LOG_DEBUG("Rejected status transition {} -> {}", storage::to_string(status_), storage::to_string(to));
        return false;
    }
    status_ = to;
    return true;
}

void UploadController::begin_run() {
    if (source_->is_cancelled()) {
        source_ = std::make_unique<CancellationSource>();
    }
}

bool UploadController::start() {
    if (!transition(UploadStatus::UPLOADING)) return false;
    begin_run();
    return true;
}

bool UploadController::pause() {
    if (!transition(UploadStatus::PAUSED)) return false;
    source_->cancel();
    return true;
}

bool UploadController::resume() {
    if (status_ != UploadStatus::PAUSED) return false;
    return start();
}

bool UploadController::cancel() {
    if (!transition(UploadStatus::ERROR)) return false;
    cancelled_ = true;
    source_->cancel();
    return true;
}

bool UploadController::fail() {
    if (!transition(UploadStatus::ERROR)) return false;
    source_->cancel();
    return true;
}

bool UploadController::complete() {
    return transition(UploadStatus::COMPLETED);
}

bool UploadController::is_terminal() const {
    return status_ == UploadStatus::COMPLETED || status_ == UploadStatus::ERROR;
}

bool UploadController::should_schedule() const {
    return status_ == UploadStatus::UPLOADING && !cancelled_;
}

} // namespace chunkup::transfer
