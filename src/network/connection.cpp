#include "chunkup/network/connection.hpp"
#include "chunkup/core/logger.hpp"
#include <boost/asio/write.hpp>
#include <boost/asio/read.hpp>

namespace chunkup::network {

Connection::Connection(boost::asio::io_context& io_context, tcp::socket socket)
    : io_context_(io_context)
    , socket_(std::move(socket))
    , state_(ConnectionState::CONNECTED)
    , last_activity_(std::chrono::steady_clock::now())
    , write_in_progress_(false) {

    boost::system::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    if (ec) {
        remote_endpoint_ = "unknown";
        LOG_WARN("Failed to get remote endpoint: {}", ec.message());
    } else {
        remote_endpoint_ = endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

    LOG_DEBUG("Connection with {} opened", remote_endpoint_);
}

Connection::~Connection() {
    LOG_TRACE("Connection to {} destroyed", remote_endpoint_);
}

void Connection::start() {
    do_read_header();
}

void Connection::close() {
    if (state_ == ConnectionState::DISCONNECTED || state_ == ConnectionState::CLOSING) {
        return;
    }

    state_ = ConnectionState::CLOSING;
    LOG_DEBUG("Closing connection to {}", remote_endpoint_);

    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);

    state_ = ConnectionState::DISCONNECTED;

    if (disconnect_handler_) {
        auto handler = std::move(disconnect_handler_);
        disconnect_handler_ = nullptr;
        handler(shared_from_this());
    }
}

void Connection::send_message(const MessageHeader& header, const std::vector<std::uint8_t>& payload) {
    if (state_ != ConnectionState::CONNECTED) {
        LOG_WARN("Attempted to send message on inactive connection to {}", remote_endpoint_);
        return;
    }

    auto header_data = header.serialize();
    std::vector<std::uint8_t> message;
    message.reserve(header_data.size() + payload.size());
    message.insert(message.end(), header_data.begin(), header_data.end());
    message.insert(message.end(), payload.begin(), payload.end());

    write_queue_.push(std::move(message));

    if (!write_in_progress_) {
        do_write();
    }

    LOG_TRACE("Queued message type {} ({} bytes) for {}",
              static_cast<int>(header.type), payload.size(), remote_endpoint_);
}

void Connection::do_read_header() {
    if (state_ != ConnectionState::CONNECTED) {
        return;
    }

    auto self = shared_from_this();
    boost::asio::async_read(socket_,
        boost::asio::buffer(read_header_buffer_),
        [this, self](boost::system::error_code ec, std::size_t) {
            if (ec) {
                handle_error(ec);
                return;
            }

            last_activity_ = std::chrono::steady_clock::now();

            try {
                std::span<const std::uint8_t> header_span(read_header_buffer_.data(), MESSAGE_HEADER_SIZE);
                auto header = MessageHeader::deserialize(header_span);

                if (header.payload_size > MAX_PAYLOAD_SIZE) {
                    LOG_ERROR("Payload too large ({} bytes) from {}", static_cast<std::uint32_t>(header.payload_size), remote_endpoint_);
                    close();
                    return;
                }

                if (!header.is_valid()) {
                    LOG_ERROR("Invalid message header from {}", remote_endpoint_);
                    close();
                    return;
                }

                if (header.payload_size > 0) {
                    do_read_payload(header.payload_size);
                } else {
                    handle_message(header, {});
                    do_read_header();
                }
            } catch (const std::exception& e) {
                LOG_ERROR("Failed to parse message header from {}: {}", remote_endpoint_, e.what());
                close();
            }
        });
}

void Connection::do_read_payload(std::uint32_t payload_size) {
    read_payload_buffer_.resize(payload_size);

    auto self = shared_from_this();
    boost::asio::async_read(socket_,
        boost::asio::buffer(read_payload_buffer_),
        [this, self](boost::system::error_code ec, std::size_t) {
            if (ec) {
                handle_error(ec);
                return;
            }

            last_activity_ = std::chrono::steady_clock::now();

            try {
                std::span<const std::uint8_t> header_span(read_header_buffer_.data(), MESSAGE_HEADER_SIZE);
                auto header = MessageHeader::deserialize(header_span);

                if (!header.verify_checksum(read_payload_buffer_)) {
                    LOG_ERROR("Checksum mismatch for message from {}", remote_endpoint_);
                    close();
                    return;
                }

                handle_message(header, std::move(read_payload_buffer_));
                read_payload_buffer_.clear();
                do_read_header();
            } catch (const std::exception& e) {
                LOG_ERROR("Failed to process message payload from {}: {}", remote_endpoint_, e.what());
                close();
            }
        });
}

void Connection::do_write() {
    if (write_queue_.empty() || write_in_progress_ || state_ != ConnectionState::CONNECTED) {
        return;
    }

    write_in_progress_ = true;
    auto& message = write_queue_.front();

    auto self = shared_from_this();
    boost::asio::async_write(socket_,
        boost::asio::buffer(message),
        [this, self](boost::system::error_code ec, std::size_t) {
            write_in_progress_ = false;

            if (ec) {
                handle_error(ec);
                return;
            }

            write_queue_.pop();
            if (!write_queue_.empty()) {
                do_write();
            }
        });
}

void Connection::handle_message(const MessageHeader& header, std::vector<std::uint8_t> payload) {
    LOG_TRACE("Received message type {} ({} bytes) from {}",
              static_cast<int>(header.type), payload.size(), remote_endpoint_);

    if (message_handler_) {
        message_handler_(header, std::move(payload));
    }
}

void Connection::handle_error(const boost::system::error_code& error) {
    if (error == boost::asio::error::eof) {
        LOG_DEBUG("Connection to {} closed by peer", remote_endpoint_);
    } else if (error == boost::asio::error::operation_aborted) {
        LOG_DEBUG("Connection operation aborted for {}", remote_endpoint_);
    } else {
        LOG_WARN("Connection error with {}: {}", remote_endpoint_, error.message());
    }

    close();
}

} // namespace chunkup::network
