#include "chunkup/crypto/hash.hpp"
#include "chunkup/crypto/random.hpp"
#include <sodium.h>
#include <stdexcept>

namespace chunkup::crypto {

ChunkDigest ChunkHasher::hash(std::span<const std::uint8_t> data) {
    if (!SecureRandom::initialize()) {
        throw std::runtime_error("libsodium unavailable");
    }

    ChunkDigest result;
    crypto_generichash(result.data(), result.size(), data.data(), data.size(), nullptr, 0);
    return result;
}

bool ChunkHasher::verify(std::span<const std::uint8_t> data, const ChunkDigest& expected) {
    auto actual = hash(data);
    return sodium_memcmp(actual.data(), expected.data(), CHUNK_DIGEST_SIZE) == 0;
}

namespace hash_utils {

std::string digest_to_hex(const ChunkDigest& digest) {
    std::string hex(CHUNK_DIGEST_SIZE * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), digest.data(), digest.size());
    hex.pop_back();
    return hex;
}

std::optional<ChunkDigest> hex_to_digest(const std::string& hex) {
    if (hex.size() != CHUNK_DIGEST_SIZE * 2) {
        return std::nullopt;
    }

    ChunkDigest digest;
    std::size_t decoded = 0;
    if (sodium_hex2bin(digest.data(), digest.size(), hex.data(), hex.size(),
                       nullptr, &decoded, nullptr) != 0 || decoded != CHUNK_DIGEST_SIZE) {
        return std::nullopt;
    }
    return digest;
}

}

} // namespace chunkup::crypto
