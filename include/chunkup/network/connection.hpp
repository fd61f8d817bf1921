#pragma once

#include "chunkup/network/protocol.hpp"
#include <utility>
#include <boost/asio.hpp>
#include <memory>
#include <string>
#include <functional>
#include <chrono>
#include <queue>

namespace chunkup::network {

using boost::asio::ip::tcp;

enum class ConnectionState {
    DISCONNECTED,
    CONNECTED,
    CLOSING
};

// Framed message stream over one TCP socket. Used by the server for accepted
// sockets and by the client for each request it sends.
class Connection : public std::enable_shared_from_this<Connection> {
public:
    using MessageHandler = std::function<void(const MessageHeader&, std::vector<std::uint8_t>)>;
    using DisconnectHandler = std::function<void(std::shared_ptr<Connection>)>;

    Connection(boost::asio::io_context& io_context, tcp::socket socket);
    ~Connection();

    void start();
    void close();

    void send_message(const MessageHeader& header, const std::vector<std::uint8_t>& payload);

    // Returns the message id of the sent header.
    template<MessagePayload T>
    std::uint64_t send_message(MessageType type, const T& payload) {
        auto payload_data = payload.serialize();
        MessageHeader header(type, static_cast<std::uint32_t>(payload_data.size()));
        header.calculate_checksum(payload_data);
        send_message(header, payload_data);
        return header.message_id;
    }

    template<MessagePayload T>
    void send_reply(MessageType type, const T& payload, std::uint64_t request_id) {
        auto payload_data = payload.serialize();
        MessageHeader header(type, static_cast<std::uint32_t>(payload_data.size()));
        header.message_id = request_id;
        header.calculate_checksum(payload_data);
        send_message(header, payload_data);
    }

    void set_message_handler(MessageHandler handler) { message_handler_ = std::move(handler); }
    void set_disconnect_handler(DisconnectHandler handler) { disconnect_handler_ = std::move(handler); }

    ConnectionState get_state() const { return state_; }
    bool is_open() const { return state_ == ConnectionState::CONNECTED; }
    const std::string& get_remote_endpoint() const { return remote_endpoint_; }
    std::chrono::steady_clock::time_point get_last_activity() const { return last_activity_; }

private:
    void do_read_header();
    void do_read_payload(std::uint32_t payload_size);
    void do_write();
    void handle_message(const MessageHeader& header, std::vector<std::uint8_t> payload);
    void handle_error(const boost::system::error_code& error);

    boost::asio::io_context& io_context_;
    tcp::socket socket_;
    ConnectionState state_;
    std::string remote_endpoint_;
    std::chrono::steady_clock::time_point last_activity_;

    MessageHandler message_handler_;
    DisconnectHandler disconnect_handler_;

    std::array<std::uint8_t, MESSAGE_HEADER_SIZE> read_header_buffer_;
    std::vector<std::uint8_t> read_payload_buffer_;

    std::queue<std::vector<std::uint8_t>> write_queue_;
    bool write_in_progress_;
};

} // namespace chunkup::network
