#include <core/address_space.hpp>
#include <core/errors.hpp>

namespace Engram {

AddressSpace::AddressSpace(const AddressGenerator& generator, size_t count, size_t length)
    : addresses_(generator.generate(count, length)), generator_(generator) {}

AddressSpace::AddressSpace(AddressMatrix addresses) : addresses_(std::move(addresses)) {
    if ((addresses_.array() > uint8_t(1)).any()) {
        throw EngramError(ErrorKind::MalformedEncoding, "address table holds a value other than 0/1");
    }
}

size_t AddressSpace::distance(size_t index, const BitVector& key) const {
    Eigen::Map<const Eigen::Matrix<uint8_t, 1, Eigen::Dynamic>> k(key.data(), static_cast<Eigen::Index>(key.size()));
    return static_cast<size_t>((addresses_.row(static_cast<Eigen::Index>(index)).array() != k.array()).count());
}

std::vector<size_t> AddressSpace::neighborhood(const BitVector& key, size_t radius) const {
    if (key.size() != length()) {
        throw EngramError(ErrorKind::DimensionMismatch,
            "key has " + std::to_string(key.size()) + " bits, memory expects " + std::to_string(length()));
    }

    const Eigen::Index rows = addresses_.rows();
    std::vector<uint8_t> active(static_cast<size_t>(rows), 0);

    #pragma omp parallel for schedule(static) if (rows > 4096)
    for (Eigen::Index i = 0; i < rows; ++i) {
        active[static_cast<size_t>(i)] = distance(static_cast<size_t>(i), key) <= radius ? 1 : 0;
    }

    std::vector<size_t> indices;
    for (size_t i = 0; i < active.size(); ++i) {
        if (active[i]) indices.push_back(i);
    }
    return indices;
}

BitVector AddressSpace::address(size_t index) const {
    auto row = addresses_.row(static_cast<Eigen::Index>(index));
    return BitVector(row.data(), row.data() + row.size());
}

} // namespace Engram
