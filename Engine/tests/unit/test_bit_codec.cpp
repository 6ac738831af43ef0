/**
 * @file test_bit_codec.cpp
 * @brief Unit tests for byte <-> bit conversion and chunking
 */

#include <gtest/gtest.h>
#include <codec/bit_codec.hpp>
#include <codec/chunk_codec.hpp>
#include <core/errors.hpp>
#include <vector>

using namespace Engram;

// ============================================================================
// Bit codec
// ============================================================================

TEST(BitCodecTest, MostSignificantBitFirst) {
    auto bits = bytes_to_bits({0xB2});
    EXPECT_EQ(bits, (BitVector{1, 0, 1, 1, 0, 0, 1, 0}));
}

TEST(BitCodecTest, EmptyPayload) {
    EXPECT_TRUE(bytes_to_bits({}).empty());
    EXPECT_TRUE(bits_to_bytes({}).empty());
}

TEST(BitCodecTest, BytesSurviveTheRoundTrip) {
    std::vector<uint8_t> bytes = {0x00, 0xFF, 0x5A, 0x80, 0x01, 0x7F};
    auto bits = bytes_to_bits(bytes);
    EXPECT_EQ(bits.size(), bytes.size() * 8);
    EXPECT_EQ(bits_to_bytes(bits), bytes);
}

TEST(BitCodecTest, PartialByteIsPaddedOnTheRight) {
    auto bytes = bits_to_bytes({1, 0, 1});
    ASSERT_EQ(bytes.size(), 1u);
    EXPECT_EQ(bytes[0], 0xA0);
}

TEST(BitCodecTest, RejectsNonBinaryValue) {
    try {
        bits_to_bytes({1, 0, 2});
        FAIL() << "expected MalformedEncoding";
    } catch (const EngramError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::MalformedEncoding);
    }
}

// ============================================================================
// Chunk codec
// ============================================================================

TEST(ChunkCodecTest, PadsTheLastChunk) {
    BitVector payload(20, 1);
    auto split = split_chunks(payload, 8);

    ASSERT_EQ(split.chunks.size(), 3u);
    EXPECT_EQ(split.original_length, 20u);
    for (const auto& chunk : split.chunks) EXPECT_EQ(chunk.size(), 8u);

    // 4 payload bits, then 4 bits of zero padding
    EXPECT_EQ(split.chunks[2], (BitVector{1, 1, 1, 1, 0, 0, 0, 0}));
}

TEST(ChunkCodecTest, JoinDiscardsPadding) {
    BitVector payload;
    for (int i = 0; i < 20; ++i) payload.push_back(static_cast<uint8_t>((i * 7) % 3 == 0));

    auto split = split_chunks(payload, 8);
    EXPECT_EQ(join_chunks(split.chunks, 20), payload);
}

TEST(ChunkCodecTest, AlignedPayloadHasNoPadding) {
    BitVector payload(24, 0);
    payload[23] = 1;
    auto split = split_chunks(payload, 8);
    ASSERT_EQ(split.chunks.size(), 3u);
    EXPECT_EQ(split.chunks[2].back(), 1);
    EXPECT_EQ(join_chunks(split.chunks, 24), payload);
}

TEST(ChunkCodecTest, EmptyPayloadHasNoChunks) {
    auto split = split_chunks({}, 8);
    EXPECT_TRUE(split.chunks.empty());
    EXPECT_EQ(split.original_length, 0u);
    EXPECT_TRUE(join_chunks(split.chunks, 0).empty());
}

TEST(ChunkCodecTest, LengthBeyondChunksIsAMismatch) {
    auto split = split_chunks(BitVector(20, 1), 8);
    try {
        join_chunks(split.chunks, 25);
        FAIL() << "expected LengthMismatch";
    } catch (const EngramError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::LengthMismatch);
    }
}

TEST(ChunkCodecTest, ZeroChunkSizeIsRejected) {
    try {
        split_chunks(BitVector(4, 1), 0);
        FAIL() << "expected InvalidConfiguration";
    } catch (const EngramError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidConfiguration);
    }
}
