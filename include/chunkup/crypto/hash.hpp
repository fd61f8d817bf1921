#pragma once

#include <array>
#include <span>
#include <string>
#include <optional>
#include <cstdint>

namespace chunkup::crypto {

constexpr std::size_t CHUNK_DIGEST_SIZE = 32;

using ChunkDigest = std::array<std::uint8_t, CHUNK_DIGEST_SIZE>;

// BLAKE2b (libsodium generichash) over chunk payloads.
class ChunkHasher {
public:
    static ChunkDigest hash(std::span<const std::uint8_t> data);
    static bool verify(std::span<const std::uint8_t> data, const ChunkDigest& expected);
};

namespace hash_utils {
    std::string digest_to_hex(const ChunkDigest& digest);
    std::optional<ChunkDigest> hex_to_digest(const std::string& hex);
}

} // namespace chunkup::crypto
