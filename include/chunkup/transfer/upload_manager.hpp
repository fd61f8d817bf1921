#pragma once

#include "transfer_engine.hpp"
#include "chunkup/core/config.hpp"
#include "chunkup/storage/chunk_planner.hpp"
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace chunkup::transfer {

struct ManagerOptions {
    std::uint64_t chunk_size = storage::ChunkPlanner::DEFAULT_CHUNK_SIZE;
    std::size_t max_concurrency = 1;
    std::uint32_t max_retries = RetryPolicy::DEFAULT_MAX_RETRIES;
    std::chrono::milliseconds retry_delay{0};
    std::chrono::hours session_ttl{storage::UploadSession::DEFAULT_TTL};
    std::chrono::seconds lease_duration{1800};

    static ManagerOptions from_config(const core::Config& config);
};

// Entry point for callers: creates sessions, owns one TransferEngine per active
// upload id and refuses a second one, in this process or (through the store
// lease) in another. All methods must run on the io_context's thread.
class UploadManager {
public:
    using CompletionHandler = TransferEngine::CompletionHandler;
    using ProgressCallback = ProgressReporter::Callback;

    UploadManager(boost::asio::io_context& io_context,
                  std::shared_ptr<UploadService> service,
                  std::shared_ptr<storage::SessionStore> store,
                  ManagerOptions options = {});
    ~UploadManager();

    UploadManager(const UploadManager&) = delete;
    UploadManager& operator=(const UploadManager&) = delete;

    // upload_<unix-ms>_<9 random base36 chars>
    static std::string generate_upload_id();

    const std::string& owner_id() const { return owner_id_; }

    // Validates the file, records a new session and prepares its engine.
    std::optional<UploadError> initialize_upload(std::shared_ptr<storage::ByteSource> source,
                                                 std::string& upload_id,
                                                 ProgressCallback on_progress = nullptr,
                                                 ExtraFields extra_fields = {});

    // Starts a session prepared by initialize_upload().
    void start_upload(const std::string& upload_id, CompletionHandler on_complete);

    // initialize_upload() + start_upload(); returns the upload id, or an empty
    // string when validation failed (the handler then gets the error).
    std::string upload_file(std::shared_ptr<storage::ByteSource> source,
                            CompletionHandler on_complete,
                            ProgressCallback on_progress = nullptr,
                            ExtraFields extra_fields = {});

    // Continues a stored session with a freshly opened file, typically after a
    // restart. The file must match the stored name, size and type.
    void resume_upload(const std::string& upload_id,
                       std::shared_ptr<storage::ByteSource> source,
                       CompletionHandler on_complete,
                       ProgressCallback on_progress = nullptr,
                       ExtraFields extra_fields = {});

    // Re-issues the merge for a stored session whose chunks are all uploaded.
    void retry_finalize(const std::string& upload_id,
                        CompletionHandler on_complete,
                        ExtraFields extra_fields = {});

    bool pause(const std::string& upload_id);
    bool resume(const std::string& upload_id);

    // Stops an active upload, or drops a stored one that has no engine here.
    bool cancel(const std::string& upload_id);

    std::optional<UploadProgress> get_progress(const std::string& upload_id) const;
    std::vector<storage::ResumableUpload> list_resumable() const;
    size_t purge_expired();

    size_t active_count() const { return engines_.size(); }
    bool is_active(const std::string& upload_id) const { return engines_.count(upload_id) > 0; }

private:
    boost::asio::io_context& io_context_;
    std::shared_ptr<UploadService> service_;
    std::shared_ptr<storage::SessionStore> store_;
    ManagerOptions options_;
    std::string owner_id_;
    std::shared_ptr<bool> alive_;

    std::unordered_map<std::string, std::shared_ptr<TransferEngine>> engines_;

    std::optional<UploadError> claim(const std::string& upload_id);
    std::shared_ptr<TransferEngine> create_engine(storage::UploadSession session,
                                                  std::shared_ptr<storage::ByteSource> source,
                                                  ProgressCallback on_progress,
                                                  ExtraFields extra_fields);
    bool launch(const std::shared_ptr<TransferEngine>& engine, CompletionHandler on_complete);
    void fail_async(const std::string& upload_id, UploadError error, CompletionHandler on_complete);
};

} // namespace chunkup::transfer
