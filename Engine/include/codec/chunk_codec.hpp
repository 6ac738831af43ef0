/**
 * @file chunk_codec.hpp
 * @brief Fixed-size chunking of bit sequences
 */

#pragma once

#include <core/bit_vector.hpp>
#include <cstddef>
#include <vector>

namespace Engram {

/**
 * @brief A payload split into equal-sized chunks
 */
struct ChunkedPayload {
    std::vector<BitVector> chunks;  // every chunk is exactly chunk_size bits
    size_t original_length = 0;     // payload length in bits, before padding
};

/**
 * @brief Split into consecutive chunk_size windows, zero-padding the last one
 *
 * An empty payload yields no chunks.
 * @throws EngramError(InvalidConfiguration) if chunk_size is 0
 */
ChunkedPayload split_chunks(const BitVector& payload, size_t chunk_size);

/**
 * @brief Concatenate chunks and truncate to original_length bits
 * @throws EngramError(LengthMismatch) if the chunks hold fewer bits
 */
BitVector join_chunks(const std::vector<BitVector>& chunks, size_t original_length);

} // namespace Engram
