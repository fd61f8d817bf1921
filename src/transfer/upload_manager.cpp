#include "chunkup/transfer/upload_manager.hpp"
#include "chunkup/core/logger.hpp"
#include "chunkup/crypto/random.hpp"
#include <boost/asio/post.hpp>
#include <stdexcept>

namespace chunkup::transfer {

using storage::UploadSession;
using storage::UploadStatus;

ManagerOptions ManagerOptions::from_config(const core::Config& config) {
    ManagerOptions options;
    options.chunk_size = config.get_uint64("upload.chunk_size", storage::ChunkPlanner::DEFAULT_CHUNK_SIZE);
    options.max_concurrency = static_cast<std::size_t>(config.get_int("upload.concurrency", 1));
    options.max_retries = static_cast<std::uint32_t>(
        config.get_int("upload.max_retries", RetryPolicy::DEFAULT_MAX_RETRIES));
    options.retry_delay = std::chrono::milliseconds(config.get_int("upload.retry_delay_ms", 0));
    options.session_ttl = std::chrono::hours(config.get_int("upload.session_ttl_hours", 24));
    options.lease_duration = std::chrono::seconds(config.get_int("store.lease_seconds", 1800));

    if (options.chunk_size == 0) {
        options.chunk_size = storage::ChunkPlanner::DEFAULT_CHUNK_SIZE;
    }
    if (options.max_concurrency == 0) {
        options.max_concurrency = 1;
    }
    return options;
}

UploadManager::UploadManager(boost::asio::io_context& io_context,
                             std::shared_ptr<UploadService> service,
                             std::shared_ptr<storage::SessionStore> store,
                             ManagerOptions options)
    : io_context_(io_context)
    , service_(std::move(service))
    , store_(std::move(store))
    , options_(std::move(options))
    , owner_id_("owner_" + crypto::SecureRandom::generate_hex(8))
    , alive_(std::make_shared<bool>(true)) {

    if (!service_) {
        throw std::invalid_argument("UploadManager requires an upload service");
    }
    if (!store_) {
        throw std::invalid_argument("UploadManager requires a session store");
    }

    LOG_DEBUG("Upload manager {} created (chunk size {}, concurrency {})",
              owner_id_, options_.chunk_size, options_.max_concurrency);
}

UploadManager::~UploadManager() {
    // Leave every active session resumable and free for the next process.
    for (auto& [upload_id, engine] : engines_) {
        engine->pause();
        store_->release_lease(upload_id, owner_id_);
    }
    engines_.clear();
}

std::string UploadManager::generate_upload_id() {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "upload_" + std::to_string(ms) + "_" + crypto::SecureRandom::generate_base36(9);
}

std::optional<UploadError> UploadManager::initialize_upload(std::shared_ptr<storage::ByteSource> source,
                                                            std::string& upload_id,
                                                            ProgressCallback on_progress,
                                                            ExtraFields extra_fields) {
    if (!source) {
        return UploadError::validation_failed("No file to upload");
    }

    const auto& info = source->info();
    auto validation = service_->validate_file(info);
    if (!validation.valid) {
        LOG_WARN("Rejected {}: {}", info.name, validation.error);
        return UploadError::validation_failed(validation.error);
    }

    UploadSession session;
    try {
        session = UploadSession::create(generate_upload_id(), info, options_.chunk_size,
                                        std::chrono::system_clock::now(), options_.session_ttl);
    } catch (const std::invalid_argument& e) {
        return UploadError::validation_failed(e.what());
    }

    if (auto error = claim(session.upload_id)) {
        return error;
    }

    if (!store_->save(session)) {
        store_->release_lease(session.upload_id, owner_id_);
        return UploadError::invalid_state("Failed to record upload session " + session.upload_id);
    }

    upload_id = session.upload_id;
    auto engine = create_engine(std::move(session), std::move(source),
                                std::move(on_progress), std::move(extra_fields));
    engines_[upload_id] = engine;

    LOG_INFO("Initialized upload {} for {} ({} chunks)", upload_id, info.name,
             engine->session().total_chunks);
    return std::nullopt;
}

void UploadManager::start_upload(const std::string& upload_id, CompletionHandler on_complete) {
    auto it = engines_.find(upload_id);
    if (it == engines_.end()) {
        fail_async(upload_id, UploadError::session_not_found(upload_id), std::move(on_complete));
        return;
    }

    if (it->second->status() != UploadStatus::PREPARING) {
        fail_async(upload_id, UploadError::invalid_state("Upload " + upload_id + " already started"),
                   std::move(on_complete));
        return;
    }

    launch(it->second, std::move(on_complete));
}

std::string UploadManager::upload_file(std::shared_ptr<storage::ByteSource> source,
                                       CompletionHandler on_complete,
                                       ProgressCallback on_progress,
                                       ExtraFields extra_fields) {
    std::string upload_id;
    if (auto error = initialize_upload(std::move(source), upload_id,
                                       std::move(on_progress), std::move(extra_fields))) {
        fail_async(upload_id, std::move(*error), std::move(on_complete));
        return {};
    }

    start_upload(upload_id, std::move(on_complete));
    return upload_id;
}

void UploadManager::resume_upload(const std::string& upload_id,
                                  std::shared_ptr<storage::ByteSource> source,
                                  CompletionHandler on_complete,
                                  ProgressCallback on_progress,
                                  ExtraFields extra_fields) {
    if (engines_.count(upload_id) > 0) {
        fail_async(upload_id, UploadError::session_locked(upload_id), std::move(on_complete));
        return;
    }

    auto session = store_->load(upload_id);
    if (!session) {
        fail_async(upload_id, UploadError::session_not_found(upload_id), std::move(on_complete));
        return;
    }

    auto now = std::chrono::system_clock::now();
    if (session->is_expired(now)) {
        store_->remove(upload_id, owner_id_);
        fail_async(upload_id, UploadError::session_expired(upload_id), std::move(on_complete));
        return;
    }

    if (!source) {
        fail_async(upload_id, UploadError::validation_failed("No file to upload"), std::move(on_complete));
        return;
    }

    if (!session->matches(source->info())) {
        LOG_WARN("File {} ({} bytes) does not match session {} ({}, {} bytes)",
                 source->info().name, source->info().size, upload_id,
                 session->file_name, session->file_size);
        fail_async(upload_id, UploadError::validation_failed("File does not match upload session"),
                   std::move(on_complete));
        return;
    }

    auto validation = service_->validate_file(source->info());
    if (!validation.valid) {
        fail_async(upload_id, UploadError::validation_failed(validation.error), std::move(on_complete));
        return;
    }

    if (auto error = claim(upload_id)) {
        fail_async(upload_id, std::move(*error), std::move(on_complete));
        return;
    }

    LOG_INFO("Resuming stored upload {} at {}/{} chunks", upload_id,
             session->uploaded_chunks.size(), session->total_chunks);

    auto engine = create_engine(std::move(*session), std::move(source),
                                std::move(on_progress), std::move(extra_fields));
    engines_[upload_id] = engine;
    launch(engine, std::move(on_complete));
}

void UploadManager::retry_finalize(const std::string& upload_id,
                                   CompletionHandler on_complete,
                                   ExtraFields extra_fields) {
    if (engines_.count(upload_id) > 0) {
        fail_async(upload_id, UploadError::session_locked(upload_id), std::move(on_complete));
        return;
    }

    auto session = store_->load(upload_id);
    if (!session) {
        fail_async(upload_id, UploadError::session_not_found(upload_id), std::move(on_complete));
        return;
    }

    if (session->is_expired(std::chrono::system_clock::now())) {
        store_->remove(upload_id, owner_id_);
        fail_async(upload_id, UploadError::session_expired(upload_id), std::move(on_complete));
        return;
    }

    if (!session->is_complete()) {
        fail_async(upload_id,
                   UploadError::invalid_state("Upload " + upload_id + " has " +
                                              std::to_string(session->uploaded_chunks.size()) + " of " +
                                              std::to_string(session->total_chunks) + " chunks"),
                   std::move(on_complete));
        return;
    }

    if (auto error = claim(upload_id)) {
        fail_async(upload_id, std::move(*error), std::move(on_complete));
        return;
    }

    LOG_INFO("Retrying merge of upload {}", upload_id);

    // Every chunk is stored remotely, so the engine goes straight to the merge.
    auto engine = create_engine(std::move(*session), nullptr, nullptr, std::move(extra_fields));
    engines_[upload_id] = engine;
    launch(engine, std::move(on_complete));
}

bool UploadManager::pause(const std::string& upload_id) {
    auto it = engines_.find(upload_id);
    if (it == engines_.end()) {
        return false;
    }
    return it->second->pause();
}

bool UploadManager::resume(const std::string& upload_id) {
    auto it = engines_.find(upload_id);
    if (it == engines_.end()) {
        return false;
    }
    return it->second->resume();
}

bool UploadManager::cancel(const std::string& upload_id) {
    auto it = engines_.find(upload_id);
    if (it != engines_.end()) {
        auto engine = it->second;
        bool cancelled = engine->cancel();
        if (cancelled && !engine->is_started()) {
            // Never started, so no completion handler will erase it.
            engines_.erase(upload_id);
        }
        return cancelled;
    }

    if (!store_->load(upload_id)) {
        return false;
    }

    auto holder = store_->lease_holder(upload_id, std::chrono::system_clock::now());
    if (holder && *holder != owner_id_) {
        LOG_WARN("Not cancelling {}: it is being uploaded by {}", upload_id, *holder);
        return false;
    }

    LOG_INFO("Discarded stored upload {}", upload_id);
    return store_->remove(upload_id, owner_id_);
}

std::optional<UploadProgress> UploadManager::get_progress(const std::string& upload_id) const {
    auto it = engines_.find(upload_id);
    if (it != engines_.end()) {
        return it->second->progress();
    }

    auto session = store_->load(upload_id);
    if (!session) {
        return std::nullopt;
    }
    return ProgressReporter::report(*session, std::chrono::system_clock::now());
}

std::vector<storage::ResumableUpload> UploadManager::list_resumable() const {
    return store_->list_resumable(std::chrono::system_clock::now());
}

size_t UploadManager::purge_expired() {
    auto removed = store_->purge_expired(std::chrono::system_clock::now());
    if (removed > 0) {
        LOG_INFO("Purged {} expired upload session(s)", removed);
    }
    return removed;
}

std::optional<UploadError> UploadManager::claim(const std::string& upload_id) {
    if (engines_.count(upload_id) > 0) {
        return UploadError::session_locked(upload_id);
    }

    if (!store_->acquire_lease(upload_id, owner_id_, std::chrono::system_clock::now(),
                               options_.lease_duration)) {
        LOG_WARN("Session {} is leased by another uploader", upload_id);
        return UploadError::session_locked(upload_id);
    }
    return std::nullopt;
}

std::shared_ptr<TransferEngine> UploadManager::create_engine(UploadSession session,
                                                             std::shared_ptr<storage::ByteSource> source,
                                                             ProgressCallback on_progress,
                                                             ExtraFields extra_fields) {
    EngineOptions engine_options;
    engine_options.max_concurrency = options_.max_concurrency;
    engine_options.retry_policy = RetryPolicy(options_.max_retries, options_.retry_delay);
    engine_options.extra_fields = std::move(extra_fields);
    engine_options.lease_owner = owner_id_;
    engine_options.lease_duration = options_.lease_duration;

    auto engine = std::make_shared<TransferEngine>(io_context_, std::move(session), std::move(source),
                                                   service_, store_, std::move(engine_options));
    if (on_progress) {
        engine->set_progress_callback(std::move(on_progress));
    }
    return engine;
}

bool UploadManager::launch(const std::shared_ptr<TransferEngine>& engine, CompletionHandler on_complete) {
    std::weak_ptr<bool> alive = alive_;
    auto upload_id = engine->upload_id();

    auto started = engine->start([this, alive, upload_id, on_complete](const UploadOutcome& outcome) {
        if (alive.lock()) {
            engines_.erase(upload_id);
        }
        if (on_complete) {
            on_complete(outcome);
        }
    });

    if (!started) {
        engines_.erase(upload_id);
        store_->release_lease(upload_id, owner_id_);
        fail_async(upload_id, UploadError::invalid_state("Upload " + upload_id + " cannot be started"),
                   std::move(on_complete));
    }
    return started;
}

void UploadManager::fail_async(const std::string& upload_id, UploadError error, CompletionHandler on_complete) {
    LOG_ERROR("Upload {}: {}", upload_id.empty() ? "<new>" : upload_id, error.message());
    if (!on_complete) {
        return;
    }

    boost::asio::post(io_context_, [outcome = UploadOutcome::failed(upload_id, std::move(error)),
                                    on_complete = std::move(on_complete)]() {
        on_complete(outcome);
    });
}

} // namespace chunkup::transfer
