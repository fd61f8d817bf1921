#include "chunkup/network/upload_server.hpp"
#include "chunkup/core/logger.hpp"
#include "chunkup/crypto/hash.hpp"

namespace chunkup::network {

UploadServer::UploadServer(storage::StorageConfig config, std::string host, std::uint16_t port)
    : config_(std::move(config))
    , staging_(config_)
    , host_(std::move(host))
    , port_(port)
    , running_(false)
    , io_context_()
    , acceptor_(io_context_) {
}

UploadServer::~UploadServer() {
    stop();
}

bool UploadServer::start() {
    if (running_) {
        LOG_WARN("Upload server already running");
        return false;
    }

    if (!config_.validate() || !config_.create_directories()) {
        LOG_ERROR("Invalid storage configuration (staging {}, storage {})",
                  config_.staging_directory.string(), config_.storage_directory.string());
        return false;
    }

    auto stale = staging_.cleanup_stale(config_.stale_staging_after);
    if (stale > 0) {
        LOG_INFO("Removed {} stale staging directories", stale);
    }

    boost::system::error_code ec;
    auto address = boost::asio::ip::make_address(host_, ec);
    if (ec) {
        LOG_ERROR("Invalid listen address {}: {}", host_, ec.message());
        return false;
    }

    tcp::endpoint endpoint(address, port_);
    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
    if (!ec) acceptor_.bind(endpoint, ec);
    if (!ec) acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
        LOG_ERROR("Failed to listen on {}:{}: {}", host_, port_, ec.message());
        acceptor_.close(ec);
        return false;
    }

    port_ = acceptor_.local_endpoint().port();
    running_ = true;
    io_context_.restart();

    do_accept();

    server_thread_ = std::thread([this]() {
        LOG_INFO("Upload server listening on {}:{}", host_, port_);

        while (running_) {
            try {
                io_context_.run();
                break;
            } catch (const std::exception& e) {
                LOG_ERROR("IO context error: {}", e.what());
                if (!running_) break;
                io_context_.restart();
            }
        }

        LOG_INFO("Upload server stopped");
    });

    return true;
}

void UploadServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_INFO("Stopping upload server on port {}", port_);

    boost::asio::post(io_context_, [this]() {
        boost::system::error_code ec;
        acceptor_.close(ec);

        std::map<std::shared_ptr<Connection>, bool> connections;
        {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            connections.swap(connections_);
        }
        for (auto& [connection, _] : connections) {
            connection->close();
        }

        io_context_.stop();
    });

    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

size_t UploadServer::connection_count() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    return connections_.size();
}

void UploadServer::do_accept() {
    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (!running_ || ec == boost::asio::error::operation_aborted) {
                return;
            }

            if (ec) {
                LOG_ERROR("Accept error: {}", ec.message());
            } else {
                handle_new_connection(std::make_shared<Connection>(io_context_, std::move(socket)));
            }

            do_accept();
        });
}

void UploadServer::handle_new_connection(std::shared_ptr<Connection> connection) {
    std::weak_ptr<Connection> weak = connection;

    connection->set_message_handler(
        [this, weak](const MessageHeader& header, std::vector<std::uint8_t> payload) {
            if (auto conn = weak.lock()) {
                handle_message(conn, header, std::move(payload));
            }
        });

    connection->set_disconnect_handler(
        [this](std::shared_ptr<Connection> conn) {
            handle_connection_closed(conn);
        });

    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        connections_[connection] = true;
    }

    connection->start();
}

void UploadServer::handle_connection_closed(std::shared_ptr<Connection> connection) {
    LOG_DEBUG("Connection closed: {}", connection->get_remote_endpoint());

    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_.erase(connection);
}

void UploadServer::handle_message(std::shared_ptr<Connection> connection, const MessageHeader& header,
                                  std::vector<std::uint8_t> payload) {
    try {
        switch (header.type) {
            case MessageType::UPLOAD_CHUNK:
                handle_upload_chunk(connection, header, payload);
                break;
            case MessageType::MERGE_REQUEST:
                handle_merge_request(connection, header, payload);
                break;
            default:
                LOG_WARN("Unexpected message type {} from {}", static_cast<int>(header.type),
                         connection->get_remote_endpoint());
                send_error(connection, ErrorCode::INVALID_MESSAGE, "Unexpected message type", header.message_id);
                break;
        }
    } catch (const std::runtime_error& e) {
        LOG_ERROR("Malformed message from {}: {}", connection->get_remote_endpoint(), e.what());
        send_error(connection, ErrorCode::INVALID_MESSAGE, e.what(), header.message_id);
    }
}

void UploadServer::handle_upload_chunk(const std::shared_ptr<Connection>& connection, const MessageHeader& header,
                                       std::span<const std::uint8_t> payload) {
    auto message = UploadChunkMessage::deserialize(payload);

    ChunkAckMessage ack{message.upload_id, message.chunk_index, false, {}};

    if (!storage::ChunkStaging::is_valid_upload_id(message.upload_id)) {
        send_error(connection, ErrorCode::INVALID_UPLOAD_ID, "Invalid upload id", header.message_id);
        return;
    }

    if (message.data.size() > config_.max_chunk_size) {
        send_error(connection, ErrorCode::PAYLOAD_TOO_LARGE, "Chunk exceeds maximum size", header.message_id);
        return;
    }

    if (!crypto::ChunkHasher::verify(message.data, message.digest)) {
        LOG_WARN("Digest mismatch for chunk {} of {}", message.chunk_index, message.upload_id);
        ack.error = "Chunk digest mismatch";
        connection->send_reply(MessageType::CHUNK_ACK, ack, header.message_id);
        return;
    }

    auto result = staging_.write_chunk(message.upload_id, message.chunk_index,
                                       message.total_chunks, message.data);
    ack.success = result.success();
    ack.error = result.message;

    if (ack.success) {
        LOG_DEBUG("Staged chunk {}/{} of {} ({} bytes)", message.chunk_index + 1, message.total_chunks,
                  message.upload_id, message.data.size());
    } else {
        LOG_WARN("Failed to stage chunk {} of {}: {}", message.chunk_index, message.upload_id, result.message);
    }

    connection->send_reply(MessageType::CHUNK_ACK, ack, header.message_id);
}

void UploadServer::handle_merge_request(const std::shared_ptr<Connection>& connection, const MessageHeader& header,
                                        std::span<const std::uint8_t> payload) {
    auto message = MergeRequestMessage::deserialize(payload);

    if (!storage::ChunkStaging::is_valid_upload_id(message.upload_id)) {
        send_error(connection, ErrorCode::INVALID_UPLOAD_ID, "Invalid upload id", header.message_id);
        return;
    }

    MergeResponseMessage response{message.upload_id, false, {}, {}};

    std::filesystem::path output_path;
    auto result = staging_.merge_chunks(message.upload_id, message.file_name, message.total_chunks, output_path);
    if (result.success()) {
        response.success = true;
        response.storage_path = output_path.string();
        LOG_INFO("Merged {} ({} chunks) into {}", message.upload_id, message.total_chunks, response.storage_path);
    } else {
        response.error = result.message;
        LOG_WARN("Merge of {} failed: {}", message.upload_id, result.message);
    }

    connection->send_reply(MessageType::MERGE_RESPONSE, response, header.message_id);
}

void UploadServer::send_error(const std::shared_ptr<Connection>& connection, ErrorCode code,
                              const std::string& message, std::uint64_t request_id) {
    ErrorMessage error{static_cast<std::uint32_t>(code), message, request_id};
    connection->send_reply(MessageType::ERROR_RESPONSE, error, request_id);
}

} // namespace chunkup::network
