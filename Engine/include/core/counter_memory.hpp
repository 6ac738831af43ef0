/**
 * @file counter_memory.hpp
 * @brief Counter-superposition backend (Kanerva SDM)
 *
 * Each hard location holds n signed counters. write() adds +1 for a 1 bit
 * and -1 for a 0 bit on every location in the neighborhood; read() sums
 * the neighborhood's counters column-wise and thresholds the sums.
 *
 * Reads may run concurrently; a write excludes readers and other writers
 * of the same instance.
 */

#pragma once

#include <core/associative_memory.hpp>
#include <core/matrix_types.hpp>
#include <shared_mutex>

namespace Engram {

class CounterMemory : public AssociativeMemory {
public:
    CounterMemory(AddressSpace space, size_t radius, TiePolicy tie_policy = TiePolicy::Zero);

    explicit CounterMemory(const MemoryConfig& config);

    void write(const BitVector& key, const BitVector& pattern) override;
    BitVector read(const BitVector& key) const override;
    Backend backend() const override { return Backend::Counter; }

    /**
     * @brief Column sums over the neighborhood, before thresholding
     */
    Accumulator accumulate(const BitVector& key) const;

    TiePolicy tie_policy() const { return tie_policy_; }

    /**
     * @brief Snapshot of the counter matrix
     */
    CounterMatrix counters() const;

    /**
     * @brief Replace all counters, e.g. when a bundle is reopened
     * @throws EngramError(DimensionMismatch) if the shape is not p x n
     */
    void load_counters(CounterMatrix counters);

    int32_t max_abs_counter() const;

private:
    CounterMatrix counters_;
    TiePolicy tie_policy_;
    mutable std::shared_mutex mutex_;
};

} // namespace Engram
