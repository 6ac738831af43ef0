/**
 * @file bit_codec.hpp
 * @brief Conversion between byte payloads and bit sequences
 *
 * Bits are ordered most significant first within each byte.
 */

#pragma once

#include <core/bit_vector.hpp>
#include <cstdint>
#include <vector>

namespace Engram {

/**
 * @brief Expand bytes into 8 bits each, MSB first
 */
BitVector bytes_to_bits(const std::vector<uint8_t>& bytes);

/**
 * @brief Pack bits back into bytes, MSB first
 *
 * A trailing partial group is padded on the right with zero bits.
 * @throws EngramError(MalformedEncoding) on a value other than 0/1
 */
std::vector<uint8_t> bits_to_bytes(const BitVector& bits);

} // namespace Engram
