#include "chunkup/network/protocol.hpp"
#include <chrono>
#include <random>
#include <cstring>
#include <algorithm>
#include <stdexcept>

namespace chunkup::network {

namespace {
    std::uint64_t generate_message_id() {
        static std::random_device rd;
        static std::mt19937_64 gen(rd());
        return gen();
    }

    std::uint64_t get_timestamp_ns() {
        auto now = std::chrono::system_clock::now();
        return std::chrono::duration_cast<std::chrono::nanoseconds>(
            now.time_since_epoch()).count();
    }

    // Reflected CRC-32 (polynomial 0xEDB88320).
    constexpr std::array<std::uint32_t, 256> make_crc_table() {
        std::array<std::uint32_t, 256> table{};
        for (std::uint32_t i = 0; i < 256; ++i) {
            std::uint32_t c = i;
            for (int k = 0; k < 8; ++k) {
                c = (c & 1) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
            }
            table[i] = c;
        }
        return table;
    }

    constexpr auto crc_table = make_crc_table();

    void write_uint32(std::vector<std::uint8_t>& buffer, std::uint32_t value) {
        buffer.push_back((value >> 24) & 0xFF);
        buffer.push_back((value >> 16) & 0xFF);
        buffer.push_back((value >> 8) & 0xFF);
        buffer.push_back(value & 0xFF);
    }

    void write_uint64(std::vector<std::uint8_t>& buffer, std::uint64_t value) {
        write_uint32(buffer, static_cast<std::uint32_t>(value >> 32));
        write_uint32(buffer, static_cast<std::uint32_t>(value & 0xFFFFFFFF));
    }

    void write_uint16(std::vector<std::uint8_t>& buffer, std::uint16_t value) {
        buffer.push_back((value >> 8) & 0xFF);
        buffer.push_back(value & 0xFF);
    }

    void write_bool(std::vector<std::uint8_t>& buffer, bool value) {
        buffer.push_back(value ? 1 : 0);
    }

    void write_string(std::vector<std::uint8_t>& buffer, const std::string& str) {
        write_uint32(buffer, static_cast<std::uint32_t>(str.size()));
        buffer.insert(buffer.end(), str.begin(), str.end());
    }

    void write_fields(std::vector<std::uint8_t>& buffer, const FieldMap& fields) {
        write_uint32(buffer, static_cast<std::uint32_t>(fields.size()));
        for (const auto& [key, value] : fields) {
            write_string(buffer, key);
            write_string(buffer, value);
        }
    }

    std::uint32_t read_uint32(std::span<const std::uint8_t>& data) {
        if (data.size() < 4) throw std::runtime_error("Insufficient data for uint32");
        std::uint32_t value = (static_cast<std::uint32_t>(data[0]) << 24) |
                             (static_cast<std::uint32_t>(data[1]) << 16) |
                             (static_cast<std::uint32_t>(data[2]) << 8) |
                             static_cast<std::uint32_t>(data[3]);
        data = data.subspan(4);
        return value;
    }

    std::uint64_t read_uint64(std::span<const std::uint8_t>& data) {
        if (data.size() < 8) throw std::runtime_error("Insufficient data for uint64");
        std::uint64_t high = read_uint32(data);
        std::uint64_t low = read_uint32(data);
        return (high << 32) | low;
    }

    std::uint16_t read_uint16(std::span<const std::uint8_t>& data) {
        if (data.size() < 2) throw std::runtime_error("Insufficient data for uint16");
        std::uint16_t value = (static_cast<std::uint16_t>(data[0]) << 8) |
                             static_cast<std::uint16_t>(data[1]);
        data = data.subspan(2);
        return value;
    }

    bool read_bool(std::span<const std::uint8_t>& data) {
        if (data.empty()) throw std::runtime_error("Insufficient data for bool");
        bool value = data[0] != 0;
        data = data.subspan(1);
        return value;
    }

    std::string read_string(std::span<const std::uint8_t>& data) {
        auto length = read_uint32(data);
        if (data.size() < length) throw std::runtime_error("Insufficient data for string");
        std::string str(reinterpret_cast<const char*>(data.data()), length);
        data = data.subspan(length);
        return str;
    }

    FieldMap read_fields(std::span<const std::uint8_t>& data) {
        FieldMap fields;
        auto count = read_uint32(data);
        for (std::uint32_t i = 0; i < count; ++i) {
            auto key = read_string(data);
            fields[key] = read_string(data);
        }
        return fields;
    }

    void expect_end(std::span<const std::uint8_t> data) {
        if (!data.empty()) throw std::runtime_error("Trailing bytes after message");
    }
}

std::uint32_t crc32(std::span<const std::uint8_t> data) {
    std::uint32_t crc = 0xFFFFFFFF;
    for (auto byte : data) {
        crc = crc_table[(crc ^ byte) & 0xFF] ^ (crc >> 8);
    }
    return crc ^ 0xFFFFFFFF;
}

MessageHeader::MessageHeader()
    : magic(PROTOCOL_MAGIC)
    , version(PROTOCOL_VERSION)
    , type(MessageType::ERROR_RESPONSE)
    , flags(MessageFlags::NONE)
    , message_id(generate_message_id())
    , payload_size(0)
    , timestamp(get_timestamp_ns())
    , checksum{0, 0, 0, 0} {
}

MessageHeader::MessageHeader(MessageType msg_type, std::uint32_t payload_len)
    : magic(PROTOCOL_MAGIC)
    , version(PROTOCOL_VERSION)
    , type(msg_type)
    , flags(MessageFlags::NONE)
    , message_id(generate_message_id())
    , payload_size(payload_len)
    , timestamp(get_timestamp_ns())
    , checksum{0, 0, 0, 0} {
}

bool MessageHeader::is_valid() const {
    return magic == PROTOCOL_MAGIC && version == PROTOCOL_VERSION && payload_size <= MAX_PAYLOAD_SIZE;
}

void MessageHeader::calculate_checksum(std::span<const std::uint8_t> payload) {
    auto crc = crc32(payload);
    checksum[0] = (crc >> 24) & 0xFF;
    checksum[1] = (crc >> 16) & 0xFF;
    checksum[2] = (crc >> 8) & 0xFF;
    checksum[3] = crc & 0xFF;
}

bool MessageHeader::verify_checksum(std::span<const std::uint8_t> payload) const {
    auto expected_crc = crc32(payload);
    auto actual_crc = (static_cast<std::uint32_t>(checksum[0]) << 24) |
                     (static_cast<std::uint32_t>(checksum[1]) << 16) |
                     (static_cast<std::uint32_t>(checksum[2]) << 8) |
                     static_cast<std::uint32_t>(checksum[3]);
    return expected_crc == actual_crc;
}

std::vector<std::uint8_t> MessageHeader::serialize() const {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(MESSAGE_HEADER_SIZE);

    write_uint32(buffer, magic);
    write_uint16(buffer, version);
    buffer.push_back(static_cast<std::uint8_t>(type));
    buffer.push_back(static_cast<std::uint8_t>(flags));
    write_uint64(buffer, message_id);
    write_uint32(buffer, payload_size);
    write_uint64(buffer, timestamp);
    buffer.insert(buffer.end(), checksum.begin(), checksum.end());

    return buffer;
}

MessageHeader MessageHeader::deserialize(std::span<const std::uint8_t> data) {
    if (data.size() < MESSAGE_HEADER_SIZE) {
        throw std::runtime_error("Insufficient data for message header");
    }

    MessageHeader header;
    auto span = data;

    header.magic = read_uint32(span);
    header.version = read_uint16(span);
    header.type = static_cast<MessageType>(span[0]);
    header.flags = static_cast<MessageFlags>(span[1]);
    span = span.subspan(2);
    header.message_id = read_uint64(span);
    header.payload_size = read_uint32(span);
    header.timestamp = read_uint64(span);
    std::copy(span.begin(), span.begin() + 4, header.checksum.begin());

    return header;
}

std::vector<std::uint8_t> UploadChunkMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(data.size() + 256);
    write_string(buffer, upload_id);
    write_uint32(buffer, chunk_index);
    write_uint32(buffer, total_chunks);
    write_string(buffer, file_name);
    write_string(buffer, file_type);
    write_uint64(buffer, file_size);
    write_fields(buffer, extra_fields);
    buffer.insert(buffer.end(), digest.begin(), digest.end());
    write_uint32(buffer, static_cast<std::uint32_t>(data.size()));
    buffer.insert(buffer.end(), data.begin(), data.end());
    return buffer;
}

UploadChunkMessage UploadChunkMessage::deserialize(std::span<const std::uint8_t> data_span) {
    UploadChunkMessage msg;
    auto span = data_span;
    msg.upload_id = read_string(span);
    msg.chunk_index = read_uint32(span);
    msg.total_chunks = read_uint32(span);
    msg.file_name = read_string(span);
    msg.file_type = read_string(span);
    msg.file_size = read_uint64(span);
    msg.extra_fields = read_fields(span);

    if (span.size() < crypto::CHUNK_DIGEST_SIZE) throw std::runtime_error("Insufficient data for digest");
    std::copy(span.begin(), span.begin() + crypto::CHUNK_DIGEST_SIZE, msg.digest.begin());
    span = span.subspan(crypto::CHUNK_DIGEST_SIZE);

    auto data_size = read_uint32(span);
    if (span.size() < data_size) throw std::runtime_error("Insufficient data for chunk");
    msg.data.assign(span.begin(), span.begin() + data_size);
    span = span.subspan(data_size);
    expect_end(span);
    return msg;
}

std::vector<std::uint8_t> ChunkAckMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, upload_id);
    write_uint32(buffer, chunk_index);
    write_bool(buffer, success);
    write_string(buffer, error);
    return buffer;
}

ChunkAckMessage ChunkAckMessage::deserialize(std::span<const std::uint8_t> data) {
    ChunkAckMessage msg;
    auto span = data;
    msg.upload_id = read_string(span);
    msg.chunk_index = read_uint32(span);
    msg.success = read_bool(span);
    msg.error = read_string(span);
    expect_end(span);
    return msg;
}

std::vector<std::uint8_t> MergeRequestMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, upload_id);
    write_string(buffer, file_name);
    write_string(buffer, file_type);
    write_uint64(buffer, file_size);
    write_uint32(buffer, total_chunks);
    write_fields(buffer, extra_fields);
    return buffer;
}

MergeRequestMessage MergeRequestMessage::deserialize(std::span<const std::uint8_t> data) {
    MergeRequestMessage msg;
    auto span = data;
    msg.upload_id = read_string(span);
    msg.file_name = read_string(span);
    msg.file_type = read_string(span);
    msg.file_size = read_uint64(span);
    msg.total_chunks = read_uint32(span);
    msg.extra_fields = read_fields(span);
    expect_end(span);
    return msg;
}

std::vector<std::uint8_t> MergeResponseMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, upload_id);
    write_bool(buffer, success);
    write_string(buffer, storage_path);
    write_string(buffer, error);
    return buffer;
}

MergeResponseMessage MergeResponseMessage::deserialize(std::span<const std::uint8_t> data) {
    MergeResponseMessage msg;
    auto span = data;
    msg.upload_id = read_string(span);
    msg.success = read_bool(span);
    msg.storage_path = read_string(span);
    msg.error = read_string(span);
    expect_end(span);
    return msg;
}

std::vector<std::uint8_t> ErrorMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_uint32(buffer, error_code);
    write_string(buffer, error_message);
    write_uint64(buffer, request_id);
    return buffer;
}

ErrorMessage ErrorMessage::deserialize(std::span<const std::uint8_t> data) {
    ErrorMessage msg;
    auto span = data;
    msg.error_code = read_uint32(span);
    msg.error_message = read_string(span);
    msg.request_id = read_uint64(span);
    return msg;
}

} // namespace chunkup::network
