/**
 * @file bundle_reader.hpp
 * @brief Rebuild named payloads from a bundle
 *
 * The reader needs nothing from the process that wrote the bundle: the
 * address space is regenerated from (seed, strategy, p, n) unless the
 * bundle carries an explicit table, and the counters are reloaded from
 * their blob. Reconstruction of a file decodes each chunk key, reads the
 * memory at that key, concatenates the chunks and truncates to the
 * recorded length.
 */

#pragma once

#include <bundle/bundle.hpp>
#include <core/bit_vector.hpp>
#include <core/counter_memory.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace Engram {

class BundleReader {
public:
    /**
     * @throws EngramError(MalformedEncoding) if the counters or addresses
     *         do not decode, or the counter digest does not match
     */
    explicit BundleReader(Bundle bundle);

    std::vector<std::string> file_names() const;
    bool contains(const std::string& name) const { return bundle_.find(name) != nullptr; }

    /**
     * @throws EngramError(UnknownFile), EngramError(LengthMismatch),
     *         EngramError(MalformedEncoding) for a bad chunk key
     */
    BitVector reconstruct_bits(const std::string& name) const;
    std::vector<uint8_t> reconstruct(const std::string& name) const;

    const Bundle& bundle() const { return bundle_; }
    const CounterMemory& memory() const { return *memory_; }

private:
    Bundle bundle_;
    std::unique_ptr<CounterMemory> memory_;
};

/**
 * @brief Write bytes to path, replacing any existing file
 * @throws EngramError(SourceUnavailable)
 */
void save_bytes(const std::string& path, const std::vector<uint8_t>& bytes);

} // namespace Engram
