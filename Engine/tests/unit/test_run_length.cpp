/**
 * @file test_run_length.cpp
 * @brief Unit tests for run-length key packing and base64 framing
 */

#include <gtest/gtest.h>
#include <codec/base64.hpp>
#include <codec/run_length.hpp>
#include <core/errors.hpp>
#include <functional>
#include <random>
#include <string>
#include <vector>

using namespace Engram;

static ErrorKind kind_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const EngramError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "no EngramError thrown";
    return ErrorKind::InvalidConfiguration;
}

// ============================================================================
// Run-length encoding
// ============================================================================

TEST(RunLengthTest, EncodesCountValuePairs) {
    EXPECT_EQ(rle_encode({0, 0, 0, 1, 1}), (std::vector<uint8_t>{3, 0, 2, 1}));
}

TEST(RunLengthTest, DecodesCountValuePairs) {
    EXPECT_EQ(rle_decode({3, 0, 2, 1}), (BitVector{0, 0, 0, 1, 1}));
}

TEST(RunLengthTest, EmptyVector) {
    EXPECT_TRUE(rle_encode({}).empty());
    EXPECT_TRUE(rle_decode({}).empty());
}

TEST(RunLengthTest, LongRunsSplitAt255) {
    BitVector ones(300, 1);
    EXPECT_EQ(rle_encode(ones), (std::vector<uint8_t>{255, 1, 45, 1}));

    BitVector zeros(510, 0);
    EXPECT_EQ(rle_encode(zeros), (std::vector<uint8_t>{255, 0, 255, 0}));
}

TEST(RunLengthTest, RandomVectorsRoundTrip) {
    std::mt19937 rng(2024);
    for (size_t length : {1u, 2u, 254u, 255u, 256u, 511u, 4096u, 10000u}) {
        BitVector bits(length);
        for (auto& bit : bits) bit = static_cast<uint8_t>(rng() & 1);
        EXPECT_EQ(rle_decode(rle_encode(bits)), bits) << "length " << length;
    }

    // Long runs mixed with alternation
    BitVector runs;
    runs.insert(runs.end(), 1000, 1);
    runs.insert(runs.end(), {0, 1, 0, 1});
    runs.insert(runs.end(), 777, 0);
    EXPECT_EQ(rle_decode(rle_encode(runs)), runs);
}

TEST(RunLengthTest, OddLengthIsMalformed) {
    EXPECT_EQ(kind_of([] { rle_decode({3, 0, 2}); }), ErrorKind::MalformedEncoding);
}

TEST(RunLengthTest, ValueOutsideBinaryIsMalformed) {
    EXPECT_EQ(kind_of([] { rle_decode({3, 0, 2, 2}); }), ErrorKind::MalformedEncoding);
    EXPECT_EQ(kind_of([] { rle_encode({0, 1, 5}); }), ErrorKind::MalformedEncoding);
}

TEST(RunLengthTest, KeyTextForm) {
    BitVector key = {0, 0, 0, 1, 1};
    EXPECT_EQ(encode_key(key), "AwACAQ==");
    EXPECT_EQ(decode_key("AwACAQ=="), key);
}

// ============================================================================
// Base64
// ============================================================================

static std::vector<uint8_t> bytes_of(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

TEST(Base64Test, Rfc4648Vectors) {
    EXPECT_EQ(base64_encode(bytes_of("")), "");
    EXPECT_EQ(base64_encode(bytes_of("f")), "Zg==");
    EXPECT_EQ(base64_encode(bytes_of("fo")), "Zm8=");
    EXPECT_EQ(base64_encode(bytes_of("foo")), "Zm9v");
    EXPECT_EQ(base64_encode(bytes_of("foob")), "Zm9vYg==");
    EXPECT_EQ(base64_encode(bytes_of("fooba")), "Zm9vYmE=");
    EXPECT_EQ(base64_encode(bytes_of("foobar")), "Zm9vYmFy");

    EXPECT_EQ(base64_decode("Zg=="), bytes_of("f"));
    EXPECT_EQ(base64_decode("Zm8="), bytes_of("fo"));
    EXPECT_EQ(base64_decode("Zm9vYmFy"), bytes_of("foobar"));
}

TEST(Base64Test, AllByteValuesRoundTrip) {
    std::vector<uint8_t> bytes(256);
    for (int i = 0; i < 256; ++i) bytes[i] = static_cast<uint8_t>(i);
    EXPECT_EQ(base64_decode(base64_encode(bytes)), bytes);
}

TEST(Base64Test, RejectsMalformedText) {
    EXPECT_EQ(kind_of([] { base64_decode("Zg="); }), ErrorKind::MalformedEncoding);
    EXPECT_EQ(kind_of([] { base64_decode("Zm9v!A=="); }), ErrorKind::MalformedEncoding);
    EXPECT_EQ(kind_of([] { base64_decode("Zg=a"); }), ErrorKind::MalformedEncoding);
    EXPECT_EQ(kind_of([] { base64_decode("Zg==Zm9v"); }), ErrorKind::MalformedEncoding);
}
