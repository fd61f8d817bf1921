#pragma once

#include "chunkup/core/result.hpp"
#include <span>
#include <string>
#include <cstdint>

namespace chunkup::crypto {

class SecureRandom {
public:
    // Must succeed before any other call; safe to call repeatedly.
    static bool initialize();

    static core::Result generate_bytes(std::span<std::uint8_t> output);
    static std::uint32_t generate_uint32();
    static std::uint32_t generate_uniform(std::uint32_t upper_bound);

    // Lowercase [0-9a-z] string of the given length.
    static std::string generate_base36(std::size_t length);
    static std::string generate_hex(std::size_t byte_count);

private:
    static bool initialized_;
};

} // namespace chunkup::crypto
