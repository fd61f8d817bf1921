#include "chunkup/crypto/random.hpp"
#include "chunkup/core/logger.hpp"
#include <sodium.h>
#include <vector>
#include <stdexcept>

namespace chunkup::crypto {

bool SecureRandom::initialized_ = false;

bool SecureRandom::initialize() {
    if (initialized_) {
        return true;
    }

    if (sodium_init() < 0) {
        LOG_ERROR("Failed to initialize libsodium");
        return false;
    }

    initialized_ = true;
    LOG_DEBUG("Cryptographic random number generator initialized");
    return true;
}

core::Result SecureRandom::generate_bytes(std::span<std::uint8_t> output) {
    if (!initialize()) {
        return core::Result(core::ErrorCode::INVALID_STATE, "Random generator not initialized");
    }

    if (output.empty()) {
        return core::Result(core::ErrorCode::INVALID_ARGUMENT, "Output buffer is empty");
    }

    randombytes_buf(output.data(), output.size());
    return core::Result();
}

std::uint32_t SecureRandom::generate_uint32() {
    if (!initialize()) {
        throw std::runtime_error("libsodium unavailable");
    }
    return randombytes_random();
}

std::uint32_t SecureRandom::generate_uniform(std::uint32_t upper_bound) {
    if (!initialize()) {
        throw std::runtime_error("libsodium unavailable");
    }
    return randombytes_uniform(upper_bound);
}

std::string SecureRandom::generate_base36(std::size_t length) {
    static constexpr char alphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";

    std::string result;
    result.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        result.push_back(alphabet[generate_uniform(36)]);
    }
    return result;
}

std::string SecureRandom::generate_hex(std::size_t byte_count) {
    std::vector<std::uint8_t> bytes(byte_count);
    auto result = generate_bytes(bytes);
    if (!result.success()) {
        throw std::runtime_error("Failed to generate random bytes: " + result.message);
    }

    std::string hex(byte_count * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), bytes.data(), bytes.size());
    hex.pop_back();
    return hex;
}

} // namespace chunkup::crypto
