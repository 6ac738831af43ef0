#include <codec/chunk_codec.hpp>
#include <algorithm>

namespace Engram {

ChunkedPayload split_chunks(const BitVector& payload, size_t chunk_size) {
    if (chunk_size == 0) {
        throw EngramError(ErrorKind::InvalidConfiguration, "chunk size must be positive");
    }

    ChunkedPayload result;
    result.original_length = payload.size();
    result.chunks.reserve((payload.size() + chunk_size - 1) / chunk_size);

    for (size_t start = 0; start < payload.size(); start += chunk_size) {
        size_t end = std::min(start + chunk_size, payload.size());
        BitVector chunk(payload.begin() + start, payload.begin() + end);
        chunk.resize(chunk_size, 0);
        result.chunks.push_back(std::move(chunk));
    }
    return result;
}

BitVector join_chunks(const std::vector<BitVector>& chunks, size_t original_length) {
    size_t total = 0;
    for (const auto& chunk : chunks) total += chunk.size();

    if (original_length > total) {
        throw EngramError(ErrorKind::LengthMismatch,
            "original length " + std::to_string(original_length) +
            " exceeds the " + std::to_string(total) + " bits held by " +
            std::to_string(chunks.size()) + " chunks");
    }

    BitVector joined;
    joined.reserve(total);
    for (const auto& chunk : chunks) {
        joined.insert(joined.end(), chunk.begin(), chunk.end());
    }
    joined.resize(original_length);
    return joined;
}

} // namespace Engram
