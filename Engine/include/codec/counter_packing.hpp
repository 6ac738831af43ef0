/**
 * @file counter_packing.hpp
 * @brief Signed-byte packing of the counter matrix
 *
 * Counters are flattened row-major. Each must fit a signed byte and is
 * stored as its two's-complement unsigned value (value + 256 when negative).
 */

#pragma once

#include <core/matrix_types.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace Engram {

/**
 * @throws EngramError(CounterOverflow) if any counter is outside [-128, 127]
 */
std::vector<uint8_t> pack_counters(const CounterMatrix& counters);

/**
 * @throws EngramError(MalformedEncoding) if bytes.size() != rows * cols
 */
CounterMatrix unpack_counters(const std::vector<uint8_t>& bytes, size_t rows, size_t cols);

// base64-framed forms used by the bundle
std::string encode_counters(const CounterMatrix& counters);
CounterMatrix decode_counters(const std::string& encoded, size_t rows, size_t cols);

} // namespace Engram
