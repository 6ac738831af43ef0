/**
 * @file run_length.hpp
 * @brief Run-length packing of binary vectors
 *
 * A vector is encoded as a flat byte sequence of (count, value) pairs.
 * count is at most 255; longer runs are split into several pairs.
 * The byte sequence is base64 framed when it travels inside a bundle.
 */

#pragma once

#include <core/bit_vector.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace Engram {

inline constexpr uint8_t k_max_run = 255;

/**
 * @brief Encode to [count1, value1, count2, value2, ...]
 */
std::vector<uint8_t> rle_encode(const BitVector& bits);

/**
 * @brief Expand (count, value) pairs
 * @throws EngramError(MalformedEncoding) on odd length or a value outside {0,1}
 */
BitVector rle_decode(const std::vector<uint8_t>& encoded);

/**
 * @brief RLE + base64, the textual form of a key inside a bundle
 */
std::string encode_key(const BitVector& key);

/**
 * @brief Inverse of encode_key
 * @throws EngramError(MalformedEncoding)
 */
BitVector decode_key(const std::string& encoded);

} // namespace Engram
