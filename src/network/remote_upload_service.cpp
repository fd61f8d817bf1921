#include "chunkup/network/remote_upload_service.hpp"
#include "chunkup/network/connection.hpp"
#include "chunkup/core/result.hpp"
#include "chunkup/core/logger.hpp"
#include "chunkup/crypto/hash.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

namespace chunkup::network {

namespace {

// One request/reply exchange on a fresh connection. The reply handler runs
// exactly once, posted to the io_context.
class ClientRequest : public std::enable_shared_from_this<ClientRequest> {
public:
    using ReplyHandler = std::function<void(core::Result, MessageType, std::vector<std::uint8_t>)>;

    ClientRequest(boost::asio::io_context& io_context,
                  transfer::CancellationToken token,
                  std::chrono::milliseconds timeout)
        : io_context_(io_context)
        , resolver_(io_context)
        , socket_(io_context)
        , timer_(io_context)
        , token_(std::move(token))
        , timeout_(timeout)
        , registration_(0)
        , request_id_(0)
        , done_(false) {
    }

    void run(const std::string& host, std::uint16_t port, MessageType type,
             std::vector<std::uint8_t> payload, ReplyHandler handler) {
        type_ = type;
        payload_ = std::move(payload);
        handler_ = std::move(handler);

        auto self = shared_from_this();
        std::weak_ptr<ClientRequest> weak = self;

        registration_ = token_.on_cancel([weak, &io = io_context_]() {
            boost::asio::post(io, [weak]() {
                if (auto request = weak.lock()) {
                    request->abort("Request cancelled");
                }
            });
        });
        if (token_.is_cancelled()) {
            abort("Request cancelled");
            return;
        }

        // The pending wait keeps the request alive until finish() cancels it.
        timer_.expires_after(timeout_);
        timer_.async_wait([self](boost::system::error_code ec) {
            if (ec) return;
            self->abort("Request timed out");
        });

        resolver_.async_resolve(host, std::to_string(port),
            [self](boost::system::error_code ec, tcp::resolver::results_type endpoints) {
                if (self->done_) return;
                if (ec) {
                    self->finish(core::Result(core::ErrorCode::NETWORK_ERROR,
                                              "Failed to resolve server: " + ec.message()));
                    return;
                }
                boost::asio::async_connect(self->socket_, endpoints,
                    [self](boost::system::error_code ec, const tcp::endpoint&) {
                        self->on_connect(ec);
                    });
            });
    }

    void abort(const std::string& reason) {
        if (done_) return;

        finish(core::Result(core::ErrorCode::NETWORK_ERROR, reason));

        boost::system::error_code ec;
        resolver_.cancel();
        socket_.close(ec);
        if (connection_) {
            connection_->close();
        }
    }

private:
    void on_connect(const boost::system::error_code& ec) {
        if (done_) return;
        if (ec) {
            finish(core::Result(core::ErrorCode::NETWORK_ERROR, "Failed to connect: " + ec.message()));
            return;
        }

        connection_ = std::make_shared<Connection>(io_context_, std::move(socket_));

        std::weak_ptr<ClientRequest> weak = shared_from_this();
        connection_->set_message_handler(
            [weak](const MessageHeader& header, std::vector<std::uint8_t> payload) {
                if (auto self = weak.lock()) {
                    self->on_reply(header, std::move(payload));
                }
            });
        connection_->set_disconnect_handler(
            [weak](std::shared_ptr<Connection>) {
                if (auto self = weak.lock()) {
                    self->finish(core::Result(core::ErrorCode::NETWORK_ERROR,
                                              "Connection closed before reply"));
                }
            });

        connection_->start();

        MessageHeader header(type_, static_cast<std::uint32_t>(payload_.size()));
        header.calculate_checksum(payload_);
        request_id_ = header.message_id;
        connection_->send_message(header, payload_);
        payload_.clear();
        payload_.shrink_to_fit();
    }

    void on_reply(const MessageHeader& header, std::vector<std::uint8_t> payload) {
        if (header.message_id != request_id_) {
            LOG_WARN("Ignoring reply to unknown request {} from {}", header.message_id,
                     connection_->get_remote_endpoint());
            return;
        }

        finish(core::Result(), header.type, std::move(payload));
        connection_->close();
    }

    void finish(core::Result result, MessageType type = MessageType::ERROR_RESPONSE,
                std::vector<std::uint8_t> payload = {}) {
        if (done_) return;
        done_ = true;

        timer_.cancel();
        if (registration_ != 0) {
            token_.remove(registration_);
        }

        boost::asio::post(io_context_,
            [handler = std::move(handler_), result = std::move(result), type, payload = std::move(payload)]() mutable {
                handler(std::move(result), type, std::move(payload));
            });
    }

    boost::asio::io_context& io_context_;
    tcp::resolver resolver_;
    tcp::socket socket_;
    boost::asio::steady_timer timer_;
    std::shared_ptr<Connection> connection_;

    transfer::CancellationToken token_;
    std::chrono::milliseconds timeout_;
    transfer::CancellationToken::Registration registration_;

    MessageType type_ = MessageType::ERROR_RESPONSE;
    std::vector<std::uint8_t> payload_;
    std::uint64_t request_id_;
    ReplyHandler handler_;
    bool done_;
};

std::string describe_error_reply(std::span<const std::uint8_t> payload) {
    try {
        auto error = ErrorMessage::deserialize(payload);
        return error.error_message;
    } catch (const std::runtime_error& e) {
        return std::string("Malformed error reply: ") + e.what();
    }
}

}

RemoteUploadService::RemoteUploadService(boost::asio::io_context& io_context,
                                         std::string host,
                                         std::uint16_t port,
                                         transfer::FileValidationPolicy policy)
    : io_context_(io_context)
    , host_(std::move(host))
    , port_(port)
    , policy_(std::move(policy))
    , request_timeout_(DEFAULT_REQUEST_TIMEOUT) {
}

transfer::ValidationResult RemoteUploadService::validate_file(const storage::FileInfo& file) {
    return policy_.validate(file);
}

void RemoteUploadService::async_upload_chunk(transfer::ChunkRequest request,
                                             transfer::CancellationToken token,
                                             ChunkHandler handler) {
    UploadChunkMessage message;
    message.upload_id = std::move(request.upload_id);
    message.chunk_index = request.chunk_index;
    message.total_chunks = request.total_chunks;
    message.file_name = std::move(request.file_name);
    message.file_type = std::move(request.file_type);
    message.file_size = request.file_size;
    message.extra_fields = std::move(request.extra_fields);
    message.digest = crypto::ChunkHasher::hash(request.data);
    message.data = std::move(request.data);

    auto payload = message.serialize();
    if (payload.size() > MAX_PAYLOAD_SIZE) {
        boost::asio::post(io_context_, [handler = std::move(handler), size = payload.size()]() {
            handler(transfer::ChunkResponse{false, "Chunk message of " + std::to_string(size) +
                                                   " bytes exceeds the protocol limit"});
        });
        return;
    }

    auto chunk_index = message.chunk_index;
    auto client = std::make_shared<ClientRequest>(io_context_, std::move(token), request_timeout_);
    client->run(host_, port_, MessageType::UPLOAD_CHUNK, std::move(payload),
        [handler = std::move(handler), chunk_index](core::Result result, MessageType type,
                                                    std::vector<std::uint8_t> reply) {
            if (!result.success()) {
                handler(transfer::ChunkResponse{false, result.message});
                return;
            }

            try {
                if (type == MessageType::CHUNK_ACK) {
                    auto ack = ChunkAckMessage::deserialize(reply);
                    if (ack.chunk_index != chunk_index) {
                        handler(transfer::ChunkResponse{false, "Acknowledgement for wrong chunk"});
                        return;
                    }
                    handler(transfer::ChunkResponse{ack.success, ack.error});
                } else if (type == MessageType::ERROR_RESPONSE) {
                    handler(transfer::ChunkResponse{false, describe_error_reply(reply)});
                } else {
                    handler(transfer::ChunkResponse{false, "Unexpected reply type"});
                }
            } catch (const std::runtime_error& e) {
                handler(transfer::ChunkResponse{false, std::string("Malformed reply: ") + e.what()});
            }
        });
}

void RemoteUploadService::async_merge_chunks(transfer::MergeRequest request,
                                             transfer::CancellationToken token,
                                             MergeHandler handler) {
    MergeRequestMessage message;
    message.upload_id = std::move(request.upload_id);
    message.file_name = std::move(request.file_name);
    message.file_type = std::move(request.file_type);
    message.file_size = request.file_size;
    message.total_chunks = request.total_chunks;
    message.extra_fields = std::move(request.extra_fields);

    auto client = std::make_shared<ClientRequest>(io_context_, std::move(token), request_timeout_);
    client->run(host_, port_, MessageType::MERGE_REQUEST, message.serialize(),
        [handler = std::move(handler)](core::Result result, MessageType type, std::vector<std::uint8_t> reply) {
            if (!result.success()) {
                handler(transfer::MergeResponse{std::nullopt, result.message});
                return;
            }

            try {
                if (type == MessageType::MERGE_RESPONSE) {
                    auto response = MergeResponseMessage::deserialize(reply);
                    if (response.success && !response.storage_path.empty()) {
                        handler(transfer::MergeResponse{response.storage_path, {}});
                    } else {
                        handler(transfer::MergeResponse{std::nullopt,
                                                        response.error.empty() ? "No storage path returned"
                                                                               : response.error});
                    }
                } else if (type == MessageType::ERROR_RESPONSE) {
                    handler(transfer::MergeResponse{std::nullopt, describe_error_reply(reply)});
                } else {
                    handler(transfer::MergeResponse{std::nullopt, "Unexpected reply type"});
                }
            } catch (const std::runtime_error& e) {
                handler(transfer::MergeResponse{std::nullopt, std::string("Malformed reply: ") + e.what()});
            }
        });
}

} // namespace chunkup::network
