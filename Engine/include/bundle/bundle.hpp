/**
 * @file bundle.hpp
 * @brief Portable snapshot of a counter memory plus its file index
 *
 * Physical form is a JSON object:
 *
 *   {
 *     "format": "engram-bundle", "version": 1,
 *     "radius": r, "chunk_size": n, "vector_length": n, "address_count": p,
 *     "address_seed": s, "address_strategy": "mt19937-msb/per-index",
 *     "tie_policy": "zero",
 *     "counters": "<base64 of p*n two's-complement bytes, row-major>",
 *     "counters_blake3": "<hex digest of those bytes>",
 *     "addresses": "<optional base64 of the concatenated RLE addresses>",
 *     "files": { "<name>": { "chunk_keys": ["<base64 RLE key>", ...],
 *                            "original_length": bits } }
 *   }
 */

#pragma once

#include <core/memory_config.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Engram {

inline constexpr const char* k_bundle_format = "engram-bundle";
inline constexpr uint32_t k_bundle_version = 1;

/**
 * @brief One ingested payload: its chunk keys in order and its exact length
 */
struct FileRecord {
    std::string name;
    std::vector<std::string> chunk_keys;  // encode_key() of each chunk's key
    uint64_t original_length = 0;         // in bits
};

struct Bundle {
    uint32_t radius = 0;
    uint32_t chunk_size = 0;
    uint32_t vector_length = 0;
    uint32_t address_count = 0;
    uint32_t address_seed = 0;
    AddressStrategy strategy = AddressStrategy::PerIndex;
    TiePolicy tie_policy = TiePolicy::Zero;
    std::string counters;          // base64
    std::string counters_digest;   // BLAKE3 hex of the decoded counter bytes
    std::optional<std::string> addresses;
    std::vector<FileRecord> files; // ingestion order

    const FileRecord* find(const std::string& name) const;
};

/**
 * @throws EngramError(MalformedEncoding) on any structural problem
 */
Bundle parse_bundle(const std::string& text);
/**
 * @throws EngramError(MalformedEncoding) if a file name is not valid UTF-8
 */
std::string serialize_bundle(const Bundle& bundle, int indent = -1);

// File names are JSON keys and must be valid UTF-8
bool is_valid_file_name(const std::string& name);

Bundle load_bundle(const std::string& path);
void save_bundle(const Bundle& bundle, const std::string& path);

} // namespace Engram
