#include <gtest/gtest.h>
#include "chunkup/network/protocol.hpp"
#include <stdexcept>
#include <string_view>

using namespace chunkup::network;

class ProtocolTest : public ::testing::Test {
protected:
    UploadChunkMessage make_chunk() {
        UploadChunkMessage msg;
        msg.upload_id = "upload_1700000000000_abc123xyz";
        msg.chunk_index = 2;
        msg.total_chunks = 5;
        msg.file_name = "session take 3.wav";
        msg.file_type = "audio/wav";
        msg.file_size = 5 * 1024 * 1024 + 17;
        msg.extra_fields = {{"mode", "precision"}};
        msg.data = {0x52, 0x49, 0x46, 0x46, 0x00, 0xFF};
        msg.digest = chunkup::crypto::ChunkHasher::hash(msg.data);
        return msg;
    }
};

TEST_F(ProtocolTest, HeaderDefaults) {
    MessageHeader header(MessageType::UPLOAD_CHUNK, 100);

    EXPECT_EQ(+header.magic, PROTOCOL_MAGIC);
    EXPECT_EQ(+header.version, PROTOCOL_VERSION);
    EXPECT_EQ(header.type, MessageType::UPLOAD_CHUNK);
    EXPECT_EQ(+header.payload_size, 100u);
    EXPECT_GT(+header.timestamp, 0u);
    EXPECT_TRUE(header.is_valid());
}

TEST_F(ProtocolTest, HeaderWireLayout) {
    MessageHeader original(MessageType::MERGE_REQUEST, 42);
    auto bytes = original.serialize();
    ASSERT_EQ(bytes.size(), MESSAGE_HEADER_SIZE);

    // Big-endian "CHNK", then version 1.
    EXPECT_EQ(bytes[0], 'C');
    EXPECT_EQ(bytes[1], 'H');
    EXPECT_EQ(bytes[2], 'N');
    EXPECT_EQ(bytes[3], 'K');
    EXPECT_EQ(bytes[4], 0x00);
    EXPECT_EQ(bytes[5], 0x01);
    EXPECT_EQ(bytes[6], 0x03);

    auto parsed = MessageHeader::deserialize(bytes);
    EXPECT_EQ(parsed.type, MessageType::MERGE_REQUEST);
    EXPECT_EQ(+parsed.message_id, +original.message_id);
    EXPECT_EQ(+parsed.payload_size, 42u);
    EXPECT_EQ(+parsed.timestamp, +original.timestamp);
}

TEST_F(ProtocolTest, HeaderValidity) {
    MessageHeader header(MessageType::CHUNK_ACK, 0);
    header.magic = 0x12345678;
    EXPECT_FALSE(header.is_valid());

    header = MessageHeader(MessageType::CHUNK_ACK, 0);
    header.version = 2;
    EXPECT_FALSE(header.is_valid());

    header = MessageHeader(MessageType::UPLOAD_CHUNK, MAX_PAYLOAD_SIZE + 1);
    EXPECT_FALSE(header.is_valid());
}

TEST_F(ProtocolTest, ShortHeaderThrows) {
    std::vector<std::uint8_t> bytes(MESSAGE_HEADER_SIZE - 1, 0);
    EXPECT_THROW(MessageHeader::deserialize(bytes), std::runtime_error);
}

TEST_F(ProtocolTest, Crc32KnownVector) {
    std::string_view check = "123456789";
    std::span<const std::uint8_t> bytes(reinterpret_cast<const std::uint8_t*>(check.data()), check.size());
    EXPECT_EQ(crc32(bytes), 0xCBF43926u);
    EXPECT_EQ(crc32({}), 0u);
}

TEST_F(ProtocolTest, ChecksumDetectsCorruption) {
    std::vector<std::uint8_t> payload = {1, 2, 3, 4, 5};
    MessageHeader header(MessageType::UPLOAD_CHUNK, static_cast<std::uint32_t>(payload.size()));
    header.calculate_checksum(payload);
    EXPECT_TRUE(header.verify_checksum(payload));

    payload[2] ^= 0x01;
    EXPECT_FALSE(header.verify_checksum(payload));
}

TEST_F(ProtocolTest, UploadChunkMessage) {
    auto original = make_chunk();
    auto bytes = original.serialize();
    auto parsed = UploadChunkMessage::deserialize(bytes);

    EXPECT_EQ(parsed.upload_id, original.upload_id);
    EXPECT_EQ(parsed.chunk_index, 2u);
    EXPECT_EQ(parsed.total_chunks, 5u);
    EXPECT_EQ(parsed.file_name, "session take 3.wav");
    EXPECT_EQ(parsed.file_type, "audio/wav");
    EXPECT_EQ(parsed.file_size, original.file_size);
    EXPECT_EQ(parsed.extra_fields.at("mode"), "precision");
    EXPECT_EQ(parsed.digest, original.digest);
    EXPECT_EQ(parsed.data, original.data);
}

TEST_F(ProtocolTest, TruncatedChunkThrows) {
    auto bytes = make_chunk().serialize();
    bytes.resize(bytes.size() - 3);
    EXPECT_THROW(UploadChunkMessage::deserialize(bytes), std::runtime_error);
}

TEST_F(ProtocolTest, TrailingBytesRejected) {
    ChunkAckMessage ack{"upload_a", 1, true, ""};
    auto bytes = ack.serialize();
    bytes.push_back(0);
    EXPECT_THROW(ChunkAckMessage::deserialize(bytes), std::runtime_error);
}

TEST_F(ProtocolTest, ChunkAckCarriesError) {
    ChunkAckMessage ack{"upload_a", 4, false, "Chunk digest mismatch"};
    auto parsed = ChunkAckMessage::deserialize(ack.serialize());

    EXPECT_EQ(parsed.upload_id, "upload_a");
    EXPECT_EQ(parsed.chunk_index, 4u);
    EXPECT_FALSE(parsed.success);
    EXPECT_EQ(parsed.error, "Chunk digest mismatch");
}

TEST_F(ProtocolTest, MergeMessages) {
    MergeRequestMessage request{"upload_b", "clip.mp4", "video/mp4", 3072, 3, {{"mode", "fast"}}};
    auto parsed_request = MergeRequestMessage::deserialize(request.serialize());
    EXPECT_EQ(parsed_request.upload_id, "upload_b");
    EXPECT_EQ(parsed_request.file_size, 3072u);
    EXPECT_EQ(parsed_request.total_chunks, 3u);
    EXPECT_EQ(parsed_request.extra_fields, request.extra_fields);

    MergeResponseMessage response{"upload_b", true, "/srv/uploads/clip.mp4", ""};
    auto parsed_response = MergeResponseMessage::deserialize(response.serialize());
    EXPECT_TRUE(parsed_response.success);
    EXPECT_EQ(parsed_response.storage_path, "/srv/uploads/clip.mp4");
}

TEST_F(ProtocolTest, ErrorMessage) {
    ErrorMessage error{static_cast<std::uint32_t>(ErrorCode::INVALID_UPLOAD_ID), "Invalid upload id", 77};
    auto parsed = ErrorMessage::deserialize(error.serialize());

    EXPECT_EQ(parsed.error_code, 3u);
    EXPECT_EQ(parsed.error_message, "Invalid upload id");
    EXPECT_EQ(parsed.request_id, 77u);
}

TEST_F(ProtocolTest, OversizedStringLengthThrows) {
    // Claims a 4 GiB upload id.
    std::vector<std::uint8_t> bytes = {0xFF, 0xFF, 0xFF, 0xFF, 'x'};
    EXPECT_THROW(ChunkAckMessage::deserialize(bytes), std::runtime_error);
}
