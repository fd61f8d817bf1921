#pragma once

#include "chunkup/network/connection.hpp"
#include "chunkup/storage/chunk_staging.hpp"
#include "chunkup/storage/storage_config.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace chunkup::network {

// Receives chunks over TCP into the staging area and assembles them on merge
// requests. Runs its own io_context on a background thread.
class UploadServer {
public:
    UploadServer(storage::StorageConfig config, std::string host, std::uint16_t port);
    ~UploadServer();

    UploadServer(const UploadServer&) = delete;
    UploadServer& operator=(const UploadServer&) = delete;

    bool start();
    void stop();

    bool is_running() const { return running_; }

    // The bound port; differs from the requested one when that was 0.
    std::uint16_t port() const { return port_; }
    const std::string& host() const { return host_; }

    size_t connection_count() const;

    storage::ChunkStaging& staging() { return staging_; }

private:
    void do_accept();
    void handle_new_connection(std::shared_ptr<Connection> connection);
    void handle_connection_closed(std::shared_ptr<Connection> connection);
    void handle_message(std::shared_ptr<Connection> connection, const MessageHeader& header,
                        std::vector<std::uint8_t> payload);

    void handle_upload_chunk(const std::shared_ptr<Connection>& connection, const MessageHeader& header,
                             std::span<const std::uint8_t> payload);
    void handle_merge_request(const std::shared_ptr<Connection>& connection, const MessageHeader& header,
                              std::span<const std::uint8_t> payload);
    void send_error(const std::shared_ptr<Connection>& connection, ErrorCode code,
                    const std::string& message, std::uint64_t request_id);

    storage::StorageConfig config_;
    storage::ChunkStaging staging_;
    std::string host_;
    std::uint16_t port_;
    std::atomic<bool> running_;

    boost::asio::io_context io_context_;
    tcp::acceptor acceptor_;
    std::thread server_thread_;

    std::map<std::shared_ptr<Connection>, bool> connections_;
    mutable std::mutex connections_mutex_;
};

} // namespace chunkup::network
