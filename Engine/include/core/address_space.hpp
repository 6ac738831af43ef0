/**
 * @file address_space.hpp
 * @brief The fixed set of hard locations of a sparse distributed memory
 */

#pragma once

#include <core/address_generator.hpp>
#include <core/bit_vector.hpp>
#include <core/matrix_types.hpp>
#include <cstddef>
#include <optional>
#include <vector>

namespace Engram {

class AddressSpace {
public:
    /**
     * @brief Derive p addresses of n bits from a generator
     */
    AddressSpace(const AddressGenerator& generator, size_t count, size_t length);

    /**
     * @brief Adopt an explicit address table (bundles that carry one)
     * @throws EngramError(MalformedEncoding) if an entry is not 0/1
     */
    explicit AddressSpace(AddressMatrix addresses);

    size_t count() const { return static_cast<size_t>(addresses_.rows()); }
    size_t length() const { return static_cast<size_t>(addresses_.cols()); }

    /**
     * @brief Hamming distance between address index and key
     */
    size_t distance(size_t index, const BitVector& key) const;

    /**
     * @brief Indices of every address within radius of key, ascending
     * @throws EngramError(DimensionMismatch) if key.size() != length()
     */
    std::vector<size_t> neighborhood(const BitVector& key, size_t radius) const;

    BitVector address(size_t index) const;
    const AddressMatrix& matrix() const { return addresses_; }

    /**
     * @brief Generator the table was derived from; empty for an adopted table
     */
    const std::optional<AddressGenerator>& generator() const { return generator_; }

private:
    AddressMatrix addresses_;
    std::optional<AddressGenerator> generator_;
};

} // namespace Engram
