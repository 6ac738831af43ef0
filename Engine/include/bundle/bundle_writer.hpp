/**
 * @file bundle_writer.hpp
 * @brief Snapshot a counter memory and its file index into a Bundle
 */

#pragma once

#include <bundle/bundle.hpp>
#include <core/counter_memory.hpp>
#include <string>
#include <vector>

namespace Engram {

struct BundleOptions {
    // Also store the address table; readers then skip regeneration.
    bool embed_addresses = false;
};

/**
 * @brief Build a bundle from the memory's current counters
 *
 * The address seed and strategy are those of the generator that built
 * the memory's address space. An adopted address table has no seed to
 * record, so it is always embedded.
 * @throws EngramError(CounterOverflow) if a counter does not fit a signed byte
 */
Bundle build_bundle(const CounterMemory& memory,
                    const std::vector<FileRecord>& files,
                    const BundleOptions& options = BundleOptions());

/**
 * @brief base64 of the concatenated RLE of every address row
 */
std::string encode_address_table(const AddressMatrix& addresses);

/**
 * @throws EngramError(MalformedEncoding) unless it expands to rows x cols bits
 */
AddressMatrix decode_address_table(const std::string& encoded, size_t rows, size_t cols);

} // namespace Engram
