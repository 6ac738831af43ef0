/**
 * @file blake3_pipeline.hpp
 * @brief BLAKE3 checksums for stored blocks and bundle payloads
 */

#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

extern "C" {
#include <blake3.h>
}

namespace Engram {

/**
 * @brief BLAKE3 truncated to 128 bits
 *
 * Used as the block checksum of the checksum-dictionary backend and as
 * the integrity digest of a bundle's counter blob.
 */
class BLAKE3Pipeline {
public:
    static constexpr size_t HASH_SIZE = 16; // 128 bits
    using Hash = std::array<uint8_t, HASH_SIZE>;

    /**
     * @brief Hash single buffer
     * @param data Input data
     * @param len Length in bytes
     * @return 16-byte BLAKE3 hash
     */
    static Hash hash(const void* data, size_t len);

    static Hash hash(std::string_view str) {
        return hash(str.data(), str.size());
    }

    static Hash hash(const std::vector<uint8_t>& data) {
        return hash(data.data(), data.size());
    }

    /**
     * @brief Lowercase hex, 32 characters
     */
    static std::string to_hex(const Hash& hash);

    /**
     * @brief Parse 32 hex characters
     * @throws std::invalid_argument on a wrong length or a non-hex character
     */
    static Hash from_hex(const std::string& hex);
};

} // namespace Engram
