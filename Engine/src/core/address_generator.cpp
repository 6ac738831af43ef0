#include <core/address_generator.hpp>

namespace Engram {

namespace {

inline uint8_t draw_bit(std::mt19937& engine) {
    return static_cast<uint8_t>((engine() >> 31) & 1u);
}

} // namespace

AddressMatrix AddressGenerator::generate(size_t count, size_t length) const {
    AddressMatrix addresses(static_cast<Eigen::Index>(count), static_cast<Eigen::Index>(length));

    if (strategy_ == AddressStrategy::SingleStream) {
        std::mt19937 engine(seed_);
        for (Eigen::Index i = 0; i < addresses.rows(); ++i) {
            for (Eigen::Index j = 0; j < addresses.cols(); ++j) {
                addresses(i, j) = draw_bit(engine);
            }
        }
        return addresses;
    }

    // Rows are independent streams
    #pragma omp parallel for schedule(static)
    for (Eigen::Index i = 0; i < addresses.rows(); ++i) {
        std::mt19937 engine(static_cast<std::mt19937::result_type>(seed_ + static_cast<uint32_t>(i)));
        for (Eigen::Index j = 0; j < addresses.cols(); ++j) {
            addresses(i, j) = draw_bit(engine);
        }
    }
    return addresses;
}

BitVector AddressGenerator::generate_one(size_t index, size_t length) const {
    BitVector address(length);

    if (strategy_ == AddressStrategy::SingleStream) {
        std::mt19937 engine(seed_);
        engine.discard(static_cast<unsigned long long>(index) * length);
        for (auto& bit : address) bit = draw_bit(engine);
        return address;
    }

    std::mt19937 engine(static_cast<std::mt19937::result_type>(seed_ + static_cast<uint32_t>(index)));
    for (auto& bit : address) bit = draw_bit(engine);
    return address;
}

BitVector KeySource::next(size_t length) {
    BitVector key(length);
    for (auto& bit : key) bit = draw_bit(engine_);
    return key;
}

} // namespace Engram
