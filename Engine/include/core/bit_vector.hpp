/**
 * @file bit_vector.hpp
 * @brief Binary vector type shared by keys, addresses and patterns
 */

#pragma once

#include <core/errors.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace Engram {

// One element per bit, each 0 or 1.
using BitVector = std::vector<uint8_t>;

inline size_t hamming_distance(const BitVector& a, const BitVector& b) {
    if (a.size() != b.size()) {
        throw EngramError(ErrorKind::DimensionMismatch,
            "Hamming distance of vectors with lengths " + std::to_string(a.size()) +
            " and " + std::to_string(b.size()));
    }
    size_t distance = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        if (a[i] != b[i]) ++distance;
    }
    return distance;
}

inline bool is_binary(const BitVector& bits) {
    for (uint8_t bit : bits) {
        if (bit > 1) return false;
    }
    return true;
}

// "10110010" style rendering, for logs and test diagnostics
inline std::string to_bit_string(const BitVector& bits) {
    std::string out;
    out.reserve(bits.size());
    for (uint8_t bit : bits) out.push_back(bit ? '1' : '0');
    return out;
}

} // namespace Engram
