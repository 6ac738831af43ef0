/**
 * @file address_generator.hpp
 * @brief Reproducible pseudorandom binary vectors
 *
 * Bit source is std::mt19937, whose output sequence is fixed by the C++
 * standard, so any conforming implementation regenerates the same
 * vectors. One bit is the most significant bit of one 32-bit output;
 * the bits of a vector are drawn in position order.
 */

#pragma once

#include <core/bit_vector.hpp>
#include <core/matrix_types.hpp>
#include <core/memory_config.hpp>
#include <cstddef>
#include <cstdint>
#include <random>

namespace Engram {

class AddressGenerator {
public:
    AddressGenerator(uint32_t seed, AddressStrategy strategy)
        : seed_(seed), strategy_(strategy) {}

    /**
     * @brief Generate count vectors of length bits as a count x length matrix
     */
    AddressMatrix generate(size_t count, size_t length) const;

    /**
     * @brief Generate only vector index
     *
     * O(length) for PerIndex; SingleStream has to skip the
     * index * length draws that precede it.
     */
    BitVector generate_one(size_t index, size_t length) const;

    uint32_t seed() const { return seed_; }
    AddressStrategy strategy() const { return strategy_; }

private:
    uint32_t seed_;
    AddressStrategy strategy_;
};

/**
 * @brief Session-wide stream of fresh chunk keys
 *
 * Owns its engine; two sources built from the same seed yield the same
 * key sequence. Not shared between threads.
 */
class KeySource {
public:
    explicit KeySource(uint32_t seed) : engine_(seed) {}

    BitVector next(size_t length);

private:
    std::mt19937 engine_;
};

} // namespace Engram
