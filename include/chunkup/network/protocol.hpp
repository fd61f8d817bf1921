#pragma once

#include "chunkup/crypto/hash.hpp"
#include <cstdint>
#include <array>
#include <map>
#include <string>
#include <vector>
#include <span>
#include <concepts>

namespace chunkup::network {

constexpr std::uint32_t PROTOCOL_MAGIC = 0x43484E4B; // "CHNK"
constexpr std::uint16_t PROTOCOL_VERSION = 1;
constexpr std::size_t MESSAGE_HEADER_SIZE = 32;
constexpr std::uint32_t MAX_PAYLOAD_SIZE = 16 * 1024 * 1024;

enum class MessageType : std::uint8_t {
    UPLOAD_CHUNK    = 0x01,
    CHUNK_ACK       = 0x02,
    MERGE_REQUEST   = 0x03,
    MERGE_RESPONSE  = 0x04,

    ERROR_RESPONSE  = 0xFF
};

enum class MessageFlags : std::uint8_t {
    NONE            = 0x00
};

struct MessageHeader {
    std::uint32_t magic;           // Protocol magic number
    std::uint16_t version;         // Protocol version
    MessageType type;              // Message type
    MessageFlags flags;            // Message flags
    std::uint64_t message_id;      // Echoed by the reply
    std::uint32_t payload_size;    // Payload length in bytes
    std::uint64_t timestamp;       // Unix timestamp (nanoseconds)
    std::array<std::uint8_t, 4> checksum; // CRC32 of payload

    MessageHeader();
    MessageHeader(MessageType msg_type, std::uint32_t payload_len);

    bool is_valid() const;
    void calculate_checksum(std::span<const std::uint8_t> payload);
    bool verify_checksum(std::span<const std::uint8_t> payload) const;

    std::vector<std::uint8_t> serialize() const;
    static MessageHeader deserialize(std::span<const std::uint8_t> data);
} __attribute__((packed));

static_assert(sizeof(MessageHeader) == MESSAGE_HEADER_SIZE);

std::uint32_t crc32(std::span<const std::uint8_t> data);

template<typename T>
concept MessagePayload = requires(T t) {
    { t.serialize() } -> std::convertible_to<std::vector<std::uint8_t>>;
    { T::deserialize(std::declval<std::span<const std::uint8_t>>()) } -> std::same_as<T>;
};

using FieldMap = std::map<std::string, std::string>;

struct UploadChunkMessage {
    std::string upload_id;
    std::uint32_t chunk_index;
    std::uint32_t total_chunks;
    std::string file_name;
    std::string file_type;
    std::uint64_t file_size;
    FieldMap extra_fields;
    crypto::ChunkDigest digest;
    std::vector<std::uint8_t> data;

    std::vector<std::uint8_t> serialize() const;
    static UploadChunkMessage deserialize(std::span<const std::uint8_t> data);
};

struct ChunkAckMessage {
    std::string upload_id;
    std::uint32_t chunk_index;
    bool success;
    std::string error;

    std::vector<std::uint8_t> serialize() const;
    static ChunkAckMessage deserialize(std::span<const std::uint8_t> data);
};

struct MergeRequestMessage {
    std::string upload_id;
    std::string file_name;
    std::string file_type;
    std::uint64_t file_size;
    std::uint32_t total_chunks;
    FieldMap extra_fields;

    std::vector<std::uint8_t> serialize() const;
    static MergeRequestMessage deserialize(std::span<const std::uint8_t> data);
};

struct MergeResponseMessage {
    std::string upload_id;
    bool success;
    std::string storage_path;
    std::string error;

    std::vector<std::uint8_t> serialize() const;
    static MergeResponseMessage deserialize(std::span<const std::uint8_t> data);
};

struct ErrorMessage {
    std::uint32_t error_code;
    std::string error_message;
    std::uint64_t request_id;

    std::vector<std::uint8_t> serialize() const;
    static ErrorMessage deserialize(std::span<const std::uint8_t> data);
};

enum class ErrorCode : std::uint32_t {
    NONE                    = 0,
    PROTOCOL_VERSION        = 1,
    INVALID_MESSAGE         = 2,
    INVALID_UPLOAD_ID       = 3,
    PAYLOAD_TOO_LARGE       = 4,
    INTERNAL_ERROR          = 99
};

} // namespace chunkup::network

static_assert(chunkup::network::MessagePayload<chunkup::network::UploadChunkMessage>);
static_assert(chunkup::network::MessagePayload<chunkup::network::ChunkAckMessage>);
static_assert(chunkup::network::MessagePayload<chunkup::network::MergeRequestMessage>);
static_assert(chunkup::network::MessagePayload<chunkup::network::MergeResponseMessage>);
static_assert(chunkup::network::MessagePayload<chunkup::network::ErrorMessage>);
