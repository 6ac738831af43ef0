/**
 * @file checksum_memory.hpp
 * @brief Checksum-dictionary backend
 *
 * Every hard location maps BLAKE3(block) to the exact block last written
 * under that checksum. read() collects the blocks in the neighborhood
 * whose checksum still matches their content and returns the one seen
 * most often; on a tie the block met first in address order wins. An
 * empty vector means nothing in the neighborhood validated.
 */

#pragma once

#include <core/associative_memory.hpp>
#include <hashing/blake3_pipeline.hpp>
#include <map>
#include <shared_mutex>
#include <vector>

namespace Engram {

class ChecksumMemory : public AssociativeMemory {
public:
    ChecksumMemory(AddressSpace space, size_t radius);

    explicit ChecksumMemory(const MemoryConfig& config);

    void write(const BitVector& key, const BitVector& pattern) override;
    BitVector read(const BitVector& key) const override;
    Backend backend() const override { return Backend::Checksum; }

    // Blocks currently stored at one location
    size_t blocks_at(size_t index) const;

private:
    using Slot = std::map<BLAKE3Pipeline::Hash, BitVector>;

    std::vector<Slot> slots_;
    mutable std::shared_mutex mutex_;
};

} // namespace Engram
