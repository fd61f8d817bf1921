#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "fake_upload_service.hpp"
#include "chunkup/transfer/upload_manager.hpp"
#include <filesystem>
#include <regex>

using namespace chunkup::transfer;
using namespace chunkup::storage;
using chunkup::testing::FakeUploadService;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Return;

class MockUploadService : public UploadService {
public:
    MOCK_METHOD(ValidationResult, validate_file, (const FileInfo&), (override));
    MOCK_METHOD(void, async_upload_chunk, (ChunkRequest, CancellationToken, ChunkHandler), (override));
    MOCK_METHOD(void, async_merge_chunks, (MergeRequest, CancellationToken, MergeHandler), (override));
};

class UploadManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "chunkup_manager_test";
        std::filesystem::remove_all(test_dir);
        store = std::make_shared<SessionStore>(test_dir / "sessions.db");
        ASSERT_TRUE(store->initialize());
        service = std::make_shared<FakeUploadService>(io);

        options.chunk_size = 1024;
        options.max_retries = 2;
        manager = std::make_unique<UploadManager>(io, service, store, options);
    }

    void TearDown() override {
        manager.reset();
        store.reset();
        std::filesystem::remove_all(test_dir);
    }

    std::shared_ptr<MemoryByteSource> make_source(std::uint64_t size = 4 * 1024,
                                                  const std::string& name = "take.wav") {
        return std::make_shared<MemoryByteSource>(name, size, "audio/wav");
    }

    UploadManager::CompletionHandler capture() {
        return [this](const UploadOutcome& result) { outcome = result; };
    }

    void run() {
        io.restart();
        io.run();
    }

    boost::asio::io_context io;
    std::filesystem::path test_dir;
    std::shared_ptr<SessionStore> store;
    std::shared_ptr<FakeUploadService> service;
    ManagerOptions options;
    std::unique_ptr<UploadManager> manager;
    std::optional<UploadOutcome> outcome;
};

TEST_F(UploadManagerTest, UploadIdFormat) {
    auto id = UploadManager::generate_upload_id();
    EXPECT_TRUE(std::regex_match(id, std::regex("upload_[0-9]+_[0-9a-z]{9}"))) << id;
    EXPECT_NE(id, UploadManager::generate_upload_id());
}

TEST_F(UploadManagerTest, RequiresCollaborators) {
    EXPECT_THROW(UploadManager(io, nullptr, store), std::invalid_argument);
    EXPECT_THROW(UploadManager(io, service, nullptr), std::invalid_argument);
}

TEST_F(UploadManagerTest, UploadFileCompletes) {
    auto id = manager->upload_file(make_source(), capture());
    ASSERT_FALSE(id.empty());
    EXPECT_TRUE(manager->is_active(id));
    run();

    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(outcome->success());
    EXPECT_EQ(outcome->upload_id, id);
    EXPECT_EQ(service->validate_calls, 1);
    EXPECT_EQ(service->chunk_calls.size(), 4u);
    EXPECT_EQ(manager->active_count(), 0u);
    EXPECT_FALSE(store->load(id).has_value());
}

TEST_F(UploadManagerTest, ValidationFailureSendsNothing) {
    auto source = std::make_shared<MemoryByteSource>("notes.txt", 100, "text/plain");
    auto id = manager->upload_file(source, capture());
    EXPECT_TRUE(id.empty());
    run();

    ASSERT_TRUE(outcome.has_value());
    ASSERT_TRUE(outcome->error.has_value());
    EXPECT_EQ(outcome->error->kind, UploadErrorKind::VALIDATION_FAILED);
    EXPECT_EQ(outcome->error->message(), "Unsupported file type: text/plain");
    EXPECT_TRUE(service->chunk_calls.empty());
    EXPECT_EQ(store->count(), 0u);
}

TEST_F(UploadManagerTest, InitializeThenStart) {
    std::string id;
    ASSERT_FALSE(manager->initialize_upload(make_source(), id).has_value());
    ASSERT_FALSE(id.empty());

    auto stored = store->load(id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->status, UploadStatus::PREPARING);
    EXPECT_EQ(stored->total_chunks, 4u);
    EXPECT_TRUE(service->chunk_calls.empty());

    manager->start_upload(id, capture());
    std::optional<UploadOutcome> second;
    manager->start_upload(id, [&second](const UploadOutcome& result) { second = result; });
    run();

    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(outcome->success());
    ASSERT_TRUE(second.has_value());
    ASSERT_TRUE(second->error.has_value());
    EXPECT_EQ(second->error->kind, UploadErrorKind::INVALID_STATE);
}

TEST_F(UploadManagerTest, StartUnknownUpload) {
    manager->start_upload("upload_nope", capture());
    run();

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->error->kind, UploadErrorKind::SESSION_NOT_FOUND);
}

TEST_F(UploadManagerTest, PausedUploadIsListedAndResumedAfterRestart) {
    auto source = make_source();
    auto id = manager->upload_file(source, capture(), [this](const UploadProgress& progress) {
        if (progress.uploaded_chunks == 2) {
            manager->pause(progress.upload_id);
        }
    });
    run();
    EXPECT_FALSE(outcome.has_value());

    auto resumable = manager->list_resumable();
    ASSERT_EQ(resumable.size(), 1u);
    EXPECT_EQ(resumable[0].upload_id, id);
    EXPECT_EQ(resumable[0].progress, 50);

    auto progress = manager->get_progress(id);
    ASSERT_TRUE(progress.has_value());
    EXPECT_EQ(progress->status, UploadStatus::PAUSED);

    // A new process picks the session up from the store.
    manager = std::make_unique<UploadManager>(io, service, store, options);
    EXPECT_FALSE(store->lease_holder(id, std::chrono::system_clock::now()).has_value());

    manager->resume_upload(id, make_source(), capture());
    run();

    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(outcome->success());
    EXPECT_EQ(service->chunk_calls, (std::vector<std::uint32_t>{0, 1, 2, 3}));
    EXPECT_TRUE(manager->list_resumable().empty());
}

TEST_F(UploadManagerTest, InProcessPauseResume) {
    bool paused = false;
    auto id = manager->upload_file(make_source(), capture(), [this, &paused](const UploadProgress& progress) {
        if (!paused && progress.uploaded_chunks == 1) {
            paused = manager->pause(progress.upload_id);
        }
    });
    run();

    EXPECT_TRUE(paused);
    EXPECT_FALSE(outcome.has_value());
    EXPECT_TRUE(manager->is_active(id));
    EXPECT_FALSE(manager->pause(id));
    EXPECT_FALSE(manager->resume("upload_nope"));

    ASSERT_TRUE(manager->resume(id));
    run();

    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(outcome->success());
    EXPECT_EQ(service->chunk_calls.size(), 4u);
    EXPECT_FALSE(manager->is_active(id));
}

TEST_F(UploadManagerTest, ResumeWithDifferentFileIsRejected) {
    auto session = UploadSession::create("upload_stored", FileInfo{"take.wav", 4096, "audio/wav"}, 1024,
                                         std::chrono::system_clock::now());
    session.mark_chunk_uploaded(0);
    ASSERT_TRUE(store->save(session));

    manager->resume_upload("upload_stored", make_source(5000), capture());
    run();

    ASSERT_TRUE(outcome.has_value());
    ASSERT_TRUE(outcome->error.has_value());
    EXPECT_EQ(outcome->error->kind, UploadErrorKind::VALIDATION_FAILED);
    EXPECT_EQ(outcome->error->message(), "File does not match upload session");
    EXPECT_TRUE(service->chunk_calls.empty());

    outcome.reset();
    manager->resume_upload("upload_stored", make_source(4096, "other.wav"), capture());
    run();
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->error->kind, UploadErrorKind::VALIDATION_FAILED);
    EXPECT_TRUE(service->chunk_calls.empty());
    EXPECT_TRUE(store->load("upload_stored").has_value());
}

TEST_F(UploadManagerTest, ResumeUnknownSession) {
    manager->resume_upload("upload_missing", make_source(), capture());
    run();

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->error->kind, UploadErrorKind::SESSION_NOT_FOUND);
}

TEST_F(UploadManagerTest, ExpiredSessionIsDroppedOnResume) {
    auto session = UploadSession::create("upload_old", FileInfo{"take.wav", 4096, "audio/wav"}, 1024,
                                         std::chrono::system_clock::now() - std::chrono::hours(48));
    ASSERT_TRUE(store->save(session));
    EXPECT_TRUE(manager->list_resumable().empty());

    manager->resume_upload("upload_old", make_source(), capture());
    run();

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->error->kind, UploadErrorKind::SESSION_EXPIRED);
    EXPECT_FALSE(store->load("upload_old").has_value());
}

TEST_F(UploadManagerTest, SecondUploaderIsLockedOut) {
    service->hold_chunks = true;
    auto id = manager->upload_file(make_source(), capture());
    io.poll();
    ASSERT_TRUE(manager->is_active(id));

    // Another process sharing the same database.
    auto other_store = std::make_shared<SessionStore>(test_dir / "sessions.db");
    ASSERT_TRUE(other_store->initialize());
    UploadManager other(io, service, other_store, options);

    std::optional<UploadOutcome> locked;
    other.resume_upload(id, make_source(), [&locked](const UploadOutcome& result) { locked = result; });
    EXPECT_FALSE(other.cancel(id));

    // And the same process.
    std::optional<UploadOutcome> again;
    manager->resume_upload(id, make_source(), [&again](const UploadOutcome& result) { again = result; });

    service->hold_chunks = false;
    service->release_held();
    run();

    ASSERT_TRUE(locked.has_value());
    EXPECT_EQ(locked->error->kind, UploadErrorKind::SESSION_LOCKED);
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again->error->kind, UploadErrorKind::SESSION_LOCKED);

    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(outcome->success());
    EXPECT_EQ(service->chunk_calls.size(), 4u);
}

TEST_F(UploadManagerTest, RetryFinalizeAfterMergeFailure) {
    service->merge_error = "HTTP 502";
    auto id = manager->upload_file(make_source(3 * 1024), capture());
    run();

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->error->kind, UploadErrorKind::MERGE_FAILED);
    EXPECT_EQ(outcome->error->message(), "Failed to merge chunks: HTTP 502");
    ASSERT_TRUE(store->load(id).has_value());

    service->merge_error.reset();
    outcome.reset();
    manager->retry_finalize(id, capture());
    run();

    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(outcome->success());
    EXPECT_EQ(outcome->storage_path, "/uploads/take.wav");
    EXPECT_EQ(service->chunk_calls.size(), 3u);
    EXPECT_EQ(service->merge_calls.size(), 2u);
    EXPECT_FALSE(store->load(id).has_value());
}

TEST_F(UploadManagerTest, RetryFinalizeNeedsEveryChunk) {
    auto session = UploadSession::create("upload_partial", FileInfo{"take.wav", 4096, "audio/wav"}, 1024,
                                         std::chrono::system_clock::now());
    session.mark_chunk_uploaded(0);
    ASSERT_TRUE(store->save(session));

    manager->retry_finalize("upload_partial", capture());
    run();

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->error->kind, UploadErrorKind::INVALID_STATE);
    EXPECT_EQ(outcome->error->message(), "Upload upload_partial has 1 of 4 chunks");
    EXPECT_TRUE(service->merge_calls.empty());
}

TEST_F(UploadManagerTest, CancelActiveUpload) {
    auto id = manager->upload_file(make_source(), capture(), [this](const UploadProgress& progress) {
        if (progress.uploaded_chunks == 1) {
            manager->cancel(progress.upload_id);
        }
    });
    run();

    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(outcome->cancelled());
    EXPECT_EQ(service->chunk_calls.size(), 1u);
    EXPECT_TRUE(service->merge_calls.empty());
    EXPECT_FALSE(store->load(id).has_value());
    EXPECT_FALSE(manager->is_active(id));
}

TEST_F(UploadManagerTest, CancelPreparedAndStoredUploads) {
    std::string id;
    ASSERT_FALSE(manager->initialize_upload(make_source(), id).has_value());
    EXPECT_TRUE(manager->cancel(id));
    EXPECT_FALSE(manager->is_active(id));
    EXPECT_FALSE(store->load(id).has_value());

    auto session = UploadSession::create("upload_stored", FileInfo{"take.wav", 4096, "audio/wav"}, 1024,
                                         std::chrono::system_clock::now());
    ASSERT_TRUE(store->save(session));
    EXPECT_TRUE(manager->cancel("upload_stored"));
    EXPECT_FALSE(store->load("upload_stored").has_value());

    EXPECT_FALSE(manager->cancel("upload_missing"));
}

TEST_F(UploadManagerTest, CancelPreparedUploadReportsCancelled) {
    std::vector<UploadProgress> seen;
    std::string id;
    ASSERT_FALSE(manager->initialize_upload(make_source(), id,
        [&seen](const UploadProgress& progress) { seen.push_back(progress); }).has_value());

    EXPECT_TRUE(manager->cancel(id));
    EXPECT_FALSE(manager->is_active(id));
    EXPECT_FALSE(store->load(id).has_value());
    EXPECT_FALSE(store->lease_holder(id, std::chrono::system_clock::now()).has_value());

    ASSERT_FALSE(seen.empty());
    ASSERT_TRUE(seen.back().error.has_value());
    EXPECT_EQ(seen.back().error->kind, UploadErrorKind::CANCELLED);
    EXPECT_EQ(seen.back().status, UploadStatus::ERROR);
    EXPECT_FALSE(manager->cancel(id));
}

TEST_F(UploadManagerTest, PurgeExpired) {
    auto now = std::chrono::system_clock::now();
    ASSERT_TRUE(store->save(UploadSession::create("upload_old", FileInfo{"a.wav", 10, "audio/wav"}, 1024,
                                                  now - std::chrono::hours(30))));
    ASSERT_TRUE(store->save(UploadSession::create("upload_new", FileInfo{"b.wav", 10, "audio/wav"}, 1024, now)));

    EXPECT_EQ(manager->purge_expired(), 1u);
    EXPECT_TRUE(store->load("upload_new").has_value());
    EXPECT_FALSE(manager->get_progress("upload_old").has_value());

    auto progress = manager->get_progress("upload_new");
    ASSERT_TRUE(progress.has_value());
    EXPECT_EQ(progress->percentage, 0);
}

TEST_F(UploadManagerTest, RejectedFileNeverReachesTheBackend) {
    auto mock = std::make_shared<MockUploadService>();
    EXPECT_CALL(*mock, validate_file(_))
        .WillOnce(Return(ValidationResult::invalid("File size exceeds maximum limit of 10 bytes (10.00 B)")));
    EXPECT_CALL(*mock, async_upload_chunk(_, _, _)).Times(0);
    EXPECT_CALL(*mock, async_merge_chunks(_, _, _)).Times(0);

    UploadManager mocked(io, mock, store, options);
    auto id = mocked.upload_file(make_source(), capture());
    EXPECT_TRUE(id.empty());
    run();

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->error->kind, UploadErrorKind::VALIDATION_FAILED);
    EXPECT_THAT(outcome->error->message(), HasSubstr("maximum limit"));
}
