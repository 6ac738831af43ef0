/**
 * @file test_interop_functionality.cpp
 * @brief Functional tests for the C Interop API.
 *
 * Bundles are produced in-process by an Ingestor and handed to the C
 * entry points as text or as a file, the way a foreign caller would.
 */

#include <gtest/gtest.h>
#include <interop_api.h>
#include <bundle/bundle.hpp>
#include <ingestion/ingestor.hpp>
#include <utils/logger.hpp>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <string>
#include <vector>

using namespace Engram;

class InteropTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::set_level(Logger::Level::Silent);

        // One hard location reached by every key: a single-chunk payload reads back exactly
        MemoryConfig config;
        config.address_count = 1;
        config.vector_length = 32;
        config.radius_override = 32;

        Ingestor ingestor(config);
        ingestor.ingest("abcd.txt", {'A', 'B', 'C', 'D'});
        ingestor.ingest("empty.bin", {});
        bundle_text = serialize_bundle(ingestor.build_bundle());

        handle = engram_reader_open(bundle_text.data(), bundle_text.size());
        ASSERT_NE(handle, nullptr) << engram_get_last_error();
    }

    void TearDown() override {
        engram_reader_destroy(handle);
        handle = nullptr;
        Logger::set_level(Logger::Level::Info);
    }

    std::string bundle_text;
    h_bundle_reader_t handle = nullptr;
};

TEST_F(InteropTest, Version) {
    EXPECT_STREQ(engram_get_version(), "1.0.0");
}

TEST_F(InteropTest, ListsFilesInOrder) {
    ASSERT_EQ(engram_reader_file_count(handle), 2u);
    EXPECT_STREQ(engram_reader_file_name(handle, 0), "abcd.txt");
    EXPECT_STREQ(engram_reader_file_name(handle, 1), "empty.bin");

    EXPECT_EQ(engram_reader_file_name(handle, 2), nullptr);
    EXPECT_NE(std::string(engram_get_last_error()).find("out of range"), std::string::npos);
}

TEST_F(InteropTest, ReconstructCycle) {
    uint8_t* data = nullptr;
    size_t len = 0;
    ASSERT_TRUE(engram_reader_reconstruct(handle, "abcd.txt", &data, &len)) << engram_get_last_error();
    ASSERT_EQ(len, 4u);
    EXPECT_EQ(std::memcmp(data, "ABCD", 4), 0);
    engram_free_buffer(data);

    data = nullptr;
    ASSERT_TRUE(engram_reader_reconstruct(handle, "empty.bin", &data, &len));
    EXPECT_EQ(len, 0u);
    EXPECT_NE(data, nullptr);
    engram_free_buffer(data);
}

TEST_F(InteropTest, UnknownFileReportsKind) {
    uint8_t* data = nullptr;
    size_t len = 0;
    EXPECT_FALSE(engram_reader_reconstruct(handle, "nope.txt", &data, &len));
    EXPECT_EQ(std::string(engram_get_last_error()).rfind("UnknownFile:", 0), 0u);
    EXPECT_EQ(data, nullptr);
}

TEST_F(InteropTest, InvalidArguments) {
    size_t len = 0;
    EXPECT_FALSE(engram_reader_reconstruct(handle, "abcd.txt", nullptr, &len));
    EXPECT_FALSE(engram_reader_reconstruct(nullptr, "abcd.txt", nullptr, &len));
    EXPECT_EQ(engram_reader_file_count(nullptr), 0u);
    EXPECT_EQ(engram_reader_open(nullptr, 0), nullptr);
}

TEST_F(InteropTest, MalformedBundleIsRejected) {
    std::string text = "{\"format\": \"engram-bundle\"}";
    EXPECT_EQ(engram_reader_open(text.data(), text.size()), nullptr);
    EXPECT_EQ(std::string(engram_get_last_error()).rfind("MalformedEncoding:", 0), 0u);
}

TEST_F(InteropTest, OpenFromFile) {
    auto path = std::filesystem::temp_directory_path() / "engram_interop_bundle.json";
    save_bundle(parse_bundle(bundle_text), path.string());

    h_bundle_reader_t from_file = engram_reader_open_file(path.string().c_str());
    ASSERT_NE(from_file, nullptr) << engram_get_last_error();
    EXPECT_EQ(engram_reader_file_count(from_file), 2u);
    engram_reader_destroy(from_file);
    std::filesystem::remove(path);

    EXPECT_EQ(engram_reader_open_file(path.string().c_str()), nullptr);
    EXPECT_EQ(std::string(engram_get_last_error()).rfind("SourceUnavailable:", 0), 0u);
}
