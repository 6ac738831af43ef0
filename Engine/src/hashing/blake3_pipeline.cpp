/**
 * @file blake3_pipeline.cpp
 * @brief BLAKE3 hashing implementation
 */

#include <hashing/blake3_pipeline.hpp>
#include <cctype>
#include <stdexcept>

namespace Engram {

namespace {

inline constexpr char k_hex_lut[] = "0123456789abcdef";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

} // namespace

BLAKE3Pipeline::Hash BLAKE3Pipeline::hash(const void* data, size_t len) {
    Hash result;

    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    blake3_hasher_update(&hasher, data, len);
    blake3_hasher_finalize(&hasher, result.data(), HASH_SIZE);

    return result;
}

std::string BLAKE3Pipeline::to_hex(const Hash& hash) {
    std::string hex;
    hex.reserve(HASH_SIZE * 2);
    for (uint8_t byte : hash) {
        hex.push_back(k_hex_lut[(byte >> 4) & 0xF]);
        hex.push_back(k_hex_lut[byte & 0xF]);
    }
    return hex;
}

BLAKE3Pipeline::Hash BLAKE3Pipeline::from_hex(const std::string& hex) {
    if (hex.size() != HASH_SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length: " + std::to_string(hex.size()) + ". Expected 32 (128-bit).");
    }

    Hash result = {0};
    for (size_t i = 0; i < HASH_SIZE; ++i) {
        int hi = hex_value(hex[i * 2]);
        int lo = hex_value(hex[i * 2 + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("Invalid hex character near offset " + std::to_string(i * 2));
        }
        result[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return result;
}

} // namespace Engram
