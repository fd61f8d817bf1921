#pragma once

#include "progress_reporter.hpp"
#include "retry_policy.hpp"
#include "upload_controller.hpp"
#include "upload_error.hpp"
#include "upload_service.hpp"
#include "chunkup/storage/byte_source.hpp"
#include "chunkup/storage/session_store.hpp"
#include "chunkup/storage/upload_session.hpp"
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <set>
#include <string>

namespace chunkup::transfer {

struct EngineOptions {
    std::size_t max_concurrency = 1;
    RetryPolicy retry_policy;
    ExtraFields extra_fields;

    // When set, the store lease on the session is renewed on every persist;
    // failing to renew it ends the upload with SESSION_LOCKED.
    std::string lease_owner;
    std::chrono::seconds lease_duration{1800};
};

// Drives one upload session to completed or error. The engine owns the session
// exclusively; every method must be called on the io_context's thread.
class TransferEngine : public std::enable_shared_from_this<TransferEngine> {
public:
    using CompletionHandler = std::function<void(const UploadOutcome&)>;

    // A session that is not PREPARING is taken as PAUSED and resumed by start().
    TransferEngine(boost::asio::io_context& io_context,
                   storage::UploadSession session,
                   std::shared_ptr<storage::ByteSource> source,
                   std::shared_ptr<UploadService> service,
                   std::shared_ptr<storage::SessionStore> store,
                   EngineOptions options = EngineOptions());
    ~TransferEngine();

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    void set_progress_callback(ProgressReporter::Callback callback);

    // The handler runs once, posted to the io_context, when the session
    // completes, fails or is cancelled. Pausing does not complete it.
    bool start(CompletionHandler on_complete);

    bool pause();
    bool resume();
    bool cancel();

    const std::string& upload_id() const { return session_.upload_id; }
    const storage::UploadSession& session() const { return session_; }
    storage::UploadStatus status() const { return controller_.status(); }
    UploadProgress progress() const { return reporter_.snapshot(session_); }

    std::size_t in_flight() const { return in_flight_chunks_.size(); }
    bool is_started() const { return started_; }
    bool is_finished() const { return finished_; }

private:
    boost::asio::io_context& io_context_;
    storage::UploadSession session_;
    std::shared_ptr<storage::ByteSource> source_;
    std::shared_ptr<UploadService> service_;
    std::shared_ptr<storage::SessionStore> store_;
    EngineOptions options_;

    UploadController controller_;
    ProgressReporter reporter_;
    CompletionHandler on_complete_;

    std::set<std::uint32_t> pending_chunks_;
    std::set<std::uint32_t> in_flight_chunks_;
    std::uint64_t run_;
    bool started_;
    bool merging_;
    bool finished_;

    void begin_run();
    void schedule();
    bool launch(std::uint32_t chunk_index);
    void on_chunk_done(std::uint32_t chunk_index, std::uint64_t run, const RetryOutcome& outcome);
    void maybe_finalize();
    void on_merge_done(std::uint64_t run, const MergeResponse& response);

    void fail(UploadError error);
    void finish(UploadOutcome outcome);
    bool persist();
    bool renew_lease();
    void lose_lease();
    void report(const std::optional<UploadError>& error = std::nullopt);
    void sync_status() { session_.status = controller_.status(); }
};

} // namespace chunkup::transfer
