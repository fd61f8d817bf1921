#include <gtest/gtest.h>
#include "chunkup/network/remote_upload_service.hpp"
#include "chunkup/network/upload_server.hpp"
#include "chunkup/transfer/upload_manager.hpp"
#include <boost/asio.hpp>
#include <filesystem>
#include <fstream>
#include <iterator>

using namespace chunkup;

class UploadRoundTripTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "chunkup_roundtrip_test";
        std::filesystem::remove_all(test_dir);

        server = std::make_unique<network::UploadServer>(storage::StorageConfig(test_dir / "server"),
                                                         "127.0.0.1", 0);
        ASSERT_TRUE(server->start());
        ASSERT_NE(server->port(), 0);

        store = std::make_shared<storage::SessionStore>(test_dir / "client" / "sessions.db");
        ASSERT_TRUE(store->initialize());

        options.chunk_size = 64 * 1024;
        options.max_concurrency = 3;
        options.max_retries = 1;
    }

    void TearDown() override {
        server->stop();
        server.reset();
        store.reset();
        std::filesystem::remove_all(test_dir);
    }

    std::vector<std::uint8_t> read_file(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    std::filesystem::path test_dir;
    std::unique_ptr<network::UploadServer> server;
    std::shared_ptr<storage::SessionStore> store;
    transfer::ManagerOptions options;
};

TEST_F(UploadRoundTripTest, UploadsAndMergesFile) {
    boost::asio::io_context io;
    auto service = std::make_shared<network::RemoteUploadService>(io, "127.0.0.1", server->port());
    transfer::UploadManager manager(io, service, store, options);

    auto source = std::make_shared<storage::MemoryByteSource>("field recording.wav", 200 * 1024 + 123, "audio/wav");

    std::vector<int> percentages;
    std::optional<transfer::UploadOutcome> outcome;
    auto id = manager.upload_file(source,
        [&outcome](const transfer::UploadOutcome& result) { outcome = result; },
        [&percentages](const transfer::UploadProgress& progress) { percentages.push_back(progress.percentage); },
        {{"mode", "balanced"}});
    ASSERT_FALSE(id.empty());

    io.run_for(std::chrono::seconds(30));

    ASSERT_TRUE(outcome.has_value());
    ASSERT_TRUE(outcome->success()) << outcome->error->message();
    ASSERT_FALSE(outcome->storage_path.empty());

    std::filesystem::path merged(outcome->storage_path);
    ASSERT_TRUE(std::filesystem::exists(merged));
    EXPECT_EQ(read_file(merged), source->data());
    EXPECT_NE(merged.filename().string().find("field_recording.wav"), std::string::npos);

    EXPECT_EQ(percentages.back(), 100);
    EXPECT_FALSE(store->load(id).has_value());
    EXPECT_FALSE(std::filesystem::exists(test_dir / "server" / "staging" / id));
}

TEST_F(UploadRoundTripTest, ResumesAfterClientRestart) {
    auto source = std::make_shared<storage::MemoryByteSource>("take.mp3", 5 * 64 * 1024, "audio/mpeg");
    std::string id;

    {
        boost::asio::io_context io;
        auto service = std::make_shared<network::RemoteUploadService>(io, "127.0.0.1", server->port());
        auto sequential = options;
        sequential.max_concurrency = 1;
        transfer::UploadManager manager(io, service, store, sequential);

        transfer::UploadManager* self = &manager;
        id = manager.upload_file(source, nullptr, [self](const transfer::UploadProgress& progress) {
            if (progress.uploaded_chunks == 2) {
                self->pause(progress.upload_id);
            }
        });
        ASSERT_FALSE(id.empty());
        io.run_for(std::chrono::seconds(30));
    }

    auto stored = store->load(id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->uploaded_chunks.size(), 2u);
    EXPECT_EQ(server->staging().staged_chunk_count(id), 2u);

    boost::asio::io_context io;
    auto service = std::make_shared<network::RemoteUploadService>(io, "127.0.0.1", server->port());
    transfer::UploadManager manager(io, service, store, options);

    std::optional<transfer::UploadOutcome> outcome;
    manager.resume_upload(id, source, [&outcome](const transfer::UploadOutcome& result) { outcome = result; });
    io.run_for(std::chrono::seconds(30));

    ASSERT_TRUE(outcome.has_value());
    ASSERT_TRUE(outcome->success()) << outcome->error->message();
    EXPECT_EQ(read_file(outcome->storage_path), source->data());
}

TEST_F(UploadRoundTripTest, UnreachableServerFailsTheChunk) {
    std::uint16_t closed_port;
    {
        boost::asio::io_context scratch;
        boost::asio::ip::tcp::acceptor acceptor(scratch, {boost::asio::ip::make_address("127.0.0.1"), 0});
        closed_port = acceptor.local_endpoint().port();
    }

    boost::asio::io_context io;
    auto service = std::make_shared<network::RemoteUploadService>(io, "127.0.0.1", closed_port);
    transfer::UploadManager manager(io, service, store, options);

    std::optional<transfer::UploadOutcome> outcome;
    auto source = std::make_shared<storage::MemoryByteSource>("a.wav", 1000, "audio/wav");
    auto id = manager.upload_file(source, [&outcome](const transfer::UploadOutcome& result) { outcome = result; });
    io.run_for(std::chrono::seconds(30));

    ASSERT_TRUE(outcome.has_value());
    ASSERT_TRUE(outcome->error.has_value());
    EXPECT_EQ(outcome->error->kind, transfer::UploadErrorKind::CHUNK_FAILED);
    EXPECT_EQ(outcome->error->chunk_index, 0u);
    EXPECT_EQ(outcome->error->attempts, 2u);
    EXPECT_TRUE(store->load(id).has_value());
}

TEST_F(UploadRoundTripTest, MergeOfUnknownUploadIsRejected) {
    boost::asio::io_context io;
    network::RemoteUploadService service(io, "127.0.0.1", server->port());

    transfer::MergeRequest request{"upload_123_unknownid", "x.wav", "audio/wav", 10, 1, {}};
    std::optional<transfer::MergeResponse> response;
    service.async_merge_chunks(request, transfer::CancellationToken(),
                               [&response](transfer::MergeResponse r) { response = std::move(r); });
    io.run_for(std::chrono::seconds(10));

    ASSERT_TRUE(response.has_value());
    EXPECT_FALSE(response->storage_path.has_value());
    EXPECT_EQ(response->error, "Upload session not found");
}
