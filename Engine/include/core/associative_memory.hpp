/**
 * @file associative_memory.hpp
 * @brief write/read contract shared by the storage backends
 *
 * A write at key K lands on every hard location within the Hamming
 * radius of K; a read at K' gathers from every location within the
 * radius of K'. A write whose neighborhood is empty is a silent no-op,
 * counted in MemoryStats::empty_writes.
 */

#pragma once

#include <core/address_space.hpp>
#include <core/bit_vector.hpp>
#include <core/memory_config.hpp>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>

namespace Engram {

struct MemoryStats {
    uint64_t writes = 0;
    uint64_t empty_writes = 0;   // writes that reached no hard location
    uint64_t reads = 0;
};

class AssociativeMemory {
public:
    virtual ~AssociativeMemory() = default;

    /**
     * @brief Store pattern at every location near key
     * @throws EngramError(DimensionMismatch) unless key and pattern have n bits
     */
    virtual void write(const BitVector& key, const BitVector& pattern) = 0;

    /**
     * @brief Recall the pattern stored near key
     * @throws EngramError(DimensionMismatch) unless key has n bits
     */
    virtual BitVector read(const BitVector& key) const = 0;

    virtual Backend backend() const = 0;

    size_t address_count() const { return space_.count(); }
    size_t vector_length() const { return space_.length(); }
    size_t radius() const { return radius_; }
    const AddressSpace& address_space() const { return space_; }

    MemoryStats stats() const {
        MemoryStats s;
        s.writes = writes_.load();
        s.empty_writes = empty_writes_.load();
        s.reads = reads_.load();
        return s;
    }

protected:
    AssociativeMemory(AddressSpace space, size_t radius)
        : space_(std::move(space)), radius_(radius) {}

    void check_pattern(const BitVector& pattern) const;

    void record_write(size_t neighbors) {
        ++writes_;
        if (neighbors == 0) ++empty_writes_;
    }
    void record_read() const { ++reads_; }

    AddressSpace space_;
    size_t radius_;

private:
    std::atomic<uint64_t> writes_{0};
    std::atomic<uint64_t> empty_writes_{0};
    mutable std::atomic<uint64_t> reads_{0};
};

/**
 * @brief Build the backend selected by config
 * @throws EngramError(InvalidConfiguration)
 */
std::unique_ptr<AssociativeMemory> make_memory(const MemoryConfig& config);

} // namespace Engram
