#include "chunkup/transfer/transfer_engine.hpp"
#include "chunkup/core/logger.hpp"
#include "chunkup/storage/chunk_planner.hpp"
#include <boost/asio/post.hpp>

namespace chunkup::transfer {

using storage::UploadStatus;

namespace {
    UploadStatus initial_status(UploadStatus stored) {
        return stored == UploadStatus::PREPARING ? UploadStatus::PREPARING : UploadStatus::PAUSED;
    }
}

TransferEngine::TransferEngine(boost::asio::io_context& io_context,
                               storage::UploadSession session,
                               std::shared_ptr<storage::ByteSource> source,
                               std::shared_ptr<UploadService> service,
                               std::shared_ptr<storage::SessionStore> store,
                               EngineOptions options)
    : io_context_(io_context)
    , session_(std::move(session))
    , source_(std::move(source))
    , service_(std::move(service))
    , store_(std::move(store))
    , options_(std::move(options))
    , controller_(initial_status(session_.status))
    , run_(0)
    , started_(false)
    , merging_(false)
    , finished_(false) {

    if (options_.max_concurrency == 0) {
        options_.max_concurrency = 1;
    }
    sync_status();
}

TransferEngine::~TransferEngine() {
    LOG_DEBUG("Transfer engine for {} destroyed", session_.upload_id);
}

void TransferEngine::set_progress_callback(ProgressReporter::Callback callback) {
    reporter_.set_callback(std::move(callback));
}

bool TransferEngine::start(CompletionHandler on_complete) {
    if (started_ || finished_) {
        LOG_WARN("Upload {} already started", session_.upload_id);
        return false;
    }

    if (!controller_.start()) {
        return false;
    }

    started_ = true;
    on_complete_ = std::move(on_complete);

    LOG_INFO("Uploading {} as {} ({} bytes, {}/{} chunks already stored)",
             session_.file_name, session_.upload_id, session_.file_size,
             session_.uploaded_chunks.size(), session_.total_chunks);

    begin_run();
    return true;
}

bool TransferEngine::pause() {
    if (!controller_.pause()) {
        return false;
    }

    sync_status();
    if (!persist()) {
        lose_lease();
        return true;
    }
    report();

    LOG_INFO("Paused upload {} at {}/{} chunks", session_.upload_id,
             session_.uploaded_chunks.size(), session_.total_chunks);
    return true;
}

bool TransferEngine::resume() {
    if (!started_ || finished_ || controller_.status() != UploadStatus::PAUSED) {
        return false;
    }

    // Someone else may have picked the session up while we were paused.
    if (!renew_lease()) {
        lose_lease();
        return false;
    }

    if (!controller_.resume()) {
        return false;
    }

    LOG_INFO("Resuming upload {}", session_.upload_id);
    begin_run();
    return true;
}

bool TransferEngine::cancel() {
    if (finished_ || !controller_.cancel()) {
        return false;
    }

    sync_status();

    // Cancelled sessions are not resumable.
    if (store_ && !store_->remove(session_.upload_id, options_.lease_owner)) {
        LOG_WARN("Failed to remove cancelled session {} from store", session_.upload_id);
    }

    auto error = UploadError::cancelled();
    report(error);

    LOG_INFO("Cancelled upload {}", session_.upload_id);
    finish(UploadOutcome::failed(session_.upload_id, error));
    return true;
}

void TransferEngine::begin_run() {
    ++run_;
    sync_status();
    if (!persist()) {
        lose_lease();
        return;
    }
    report();

    pending_chunks_.clear();
    for (auto index : session_.missing_chunks()) {
        if (in_flight_chunks_.count(index) == 0) {
            pending_chunks_.insert(index);
        }
    }

    schedule();
}

void TransferEngine::schedule() {
    while (controller_.should_schedule() &&
           in_flight_chunks_.size() < options_.max_concurrency &&
           !pending_chunks_.empty()) {
        auto index = *pending_chunks_.begin();
        pending_chunks_.erase(pending_chunks_.begin());

        if (!launch(index)) {
            return;
        }
    }

    maybe_finalize();
}

bool TransferEngine::launch(std::uint32_t chunk_index) {
    if (!source_) {
        fail(UploadError::source_read_failed("no byte source for " + session_.file_name));
        return false;
    }

    auto range = storage::ChunkPlanner::range(chunk_index, session_.file_size, session_.chunk_size);

    ChunkRequest request;
    request.upload_id = session_.upload_id;
    request.chunk_index = chunk_index;
    request.total_chunks = session_.total_chunks;
    request.file_name = session_.file_name;
    request.file_type = session_.file_type;
    request.file_size = session_.file_size;
    request.extra_fields = options_.extra_fields;

    auto read = source_->read(range.start, range.size(), request.data);
    if (!read.success()) {
        fail(UploadError::source_read_failed(read.message));
        return false;
    }

    in_flight_chunks_.insert(chunk_index);
    LOG_DEBUG("Scheduling chunk {}/{} of {} ({} bytes)", chunk_index + 1, session_.total_chunks,
              session_.upload_id, range.size());

    auto self = shared_from_this();
    auto token = controller_.token();
    auto run = run_;

    options_.retry_policy.execute(io_context_, token,
        [self, token, request = std::move(request)](std::uint32_t, UploadService::ChunkHandler handler) {
            self->service_->async_upload_chunk(request, token, std::move(handler));
        },
        [self, chunk_index, run](const RetryOutcome& outcome) {
            self->on_chunk_done(chunk_index, run, outcome);
        });

    return true;
}

void TransferEngine::on_chunk_done(std::uint32_t chunk_index, std::uint64_t run, const RetryOutcome& outcome) {
    in_flight_chunks_.erase(chunk_index);

    if (finished_) {
        return;
    }

    if (outcome.success) {
        session_.mark_chunk_uploaded(chunk_index);
        if (!persist()) {
            lose_lease();
            return;
        }
        report();
        LOG_DEBUG("Chunk {} of {} acknowledged after {} attempt(s)", chunk_index, session_.upload_id, outcome.attempts);
    } else if (outcome.aborted || run != run_ || !controller_.should_schedule()) {
        // Interrupted by a pause; the chunk goes back in line for the next run.
        pending_chunks_.insert(chunk_index);
    } else {
        LOG_ERROR("Chunk {} of {} failed after {} attempts: {}", chunk_index, session_.upload_id,
                  outcome.attempts, outcome.last_error);
        fail(UploadError::chunk_failed(chunk_index, outcome.attempts, outcome.last_error));
        return;
    }

    schedule();
}

void TransferEngine::maybe_finalize() {
    if (merging_ || finished_ || !controller_.should_schedule() ||
        !in_flight_chunks_.empty() || !session_.is_complete()) {
        return;
    }

    if (!renew_lease()) {
        lose_lease();
        return;
    }

    merging_ = true;

    MergeRequest request;
    request.upload_id = session_.upload_id;
    request.file_name = session_.file_name;
    request.file_type = session_.file_type;
    request.file_size = session_.file_size;
    request.total_chunks = session_.total_chunks;
    request.extra_fields = options_.extra_fields;

    LOG_INFO("All {} chunks of {} uploaded, requesting merge", session_.total_chunks, session_.upload_id);

    auto self = shared_from_this();
    auto run = run_;
    service_->async_merge_chunks(std::move(request), controller_.token(),
        [self, run](MergeResponse response) {
            self->on_merge_done(run, response);
        });
}

void TransferEngine::on_merge_done(std::uint64_t run, const MergeResponse& response) {
    merging_ = false;

    if (finished_) {
        return;
    }

    if (response.storage_path) {
        controller_.complete();
        sync_status();
        report();

        if (store_ && !store_->remove(session_.upload_id, options_.lease_owner)) {
            LOG_WARN("Failed to remove completed session {} from store", session_.upload_id);
        }

        LOG_INFO("Upload {} completed: {}", session_.upload_id, *response.storage_path);
        finish(UploadOutcome::completed(session_.upload_id, *response.storage_path));
        return;
    }

    if (controller_.status() == UploadStatus::PAUSED) {
        // The merge was aborted by the pause; resume() issues it again.
        LOG_DEBUG("Merge of {} interrupted by pause", session_.upload_id);
        return;
    }

    if (run != run_) {
        // Paused and resumed while the aborted merge was outstanding.
        maybe_finalize();
        return;
    }

    LOG_ERROR("Merge of {} failed: {}", session_.upload_id, response.error);
    fail(UploadError::merge_failed(response.error.empty() ? "unknown error" : response.error));
}

void TransferEngine::fail(UploadError error) {
    controller_.fail();
    sync_status();

    // The session stays stored so the caller can resume or retry the finalize.
    if (!persist()) {
        LOG_WARN("Session {} not saved after failure: lease lost", session_.upload_id);
    }
    report(error);
    finish(UploadOutcome::failed(session_.upload_id, std::move(error)));
}

void TransferEngine::finish(UploadOutcome outcome) {
    finished_ = true;
    pending_chunks_.clear();

    if (store_ && !options_.lease_owner.empty()) {
        store_->release_lease(session_.upload_id, options_.lease_owner);
    }

    if (!on_complete_) {
        return;
    }

    auto self = shared_from_this();
    auto handler = std::move(on_complete_);
    on_complete_ = nullptr;
    boost::asio::post(io_context_, [self, handler = std::move(handler), outcome = std::move(outcome)]() {
        handler(outcome);
    });
}

bool TransferEngine::persist() {
    if (!store_ || controller_.is_cancelled()) {
        return true;
    }

    if (!renew_lease()) {
        return false;
    }

    if (!store_->save(session_)) {
        LOG_WARN("Failed to persist session {}; it may not be resumable", session_.upload_id);
    }
    return true;
}

bool TransferEngine::renew_lease() {
    if (!store_ || options_.lease_owner.empty()) {
        return true;
    }
    return store_->acquire_lease(session_.upload_id, options_.lease_owner,
                                 std::chrono::system_clock::now(), options_.lease_duration);
}

void TransferEngine::lose_lease() {
    LOG_WARN("Lost the lease on session {} to another owner, stopping", session_.upload_id);

    // Aborts whatever is in flight. The stored session now belongs to the new owner.
    controller_.fail();
    sync_status();

    auto error = UploadError::session_locked(session_.upload_id);
    report(error);
    finish(UploadOutcome::failed(session_.upload_id, std::move(error)));
}

void TransferEngine::report(const std::optional<UploadError>& error) {
    reporter_.notify(session_, error);
}

} // namespace chunkup::transfer
