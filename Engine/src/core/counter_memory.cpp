#include <core/counter_memory.hpp>
#include <core/errors.hpp>
#include <mutex>

namespace Engram {

namespace {

const MemoryConfig& validated(const MemoryConfig& config) {
    config.validate();
    return config;
}

} // namespace

CounterMemory::CounterMemory(AddressSpace space, size_t radius, TiePolicy tie_policy)
    : AssociativeMemory(std::move(space), radius),
      counters_(CounterMatrix::Zero(static_cast<Eigen::Index>(space_.count()),
                                    static_cast<Eigen::Index>(space_.length()))),
      tie_policy_(tie_policy) {}

CounterMemory::CounterMemory(const MemoryConfig& config)
    : CounterMemory(AddressSpace(AddressGenerator(validated(config).address_seed, config.strategy),
                                 config.address_count, config.vector_length),
                    config.radius(), config.tie_policy) {}

void CounterMemory::write(const BitVector& key, const BitVector& pattern) {
    check_pattern(pattern);
    auto neighbors = space_.neighborhood(key, radius_);

    // +1 for a 1 bit, -1 for a 0 bit
    Eigen::Map<const Eigen::Matrix<uint8_t, 1, Eigen::Dynamic>> bits(pattern.data(), static_cast<Eigen::Index>(pattern.size()));
    Eigen::Matrix<int32_t, 1, Eigen::Dynamic> delta = bits.cast<int32_t>() * 2 - Eigen::Matrix<int32_t, 1, Eigen::Dynamic>::Ones(bits.size());

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        for (size_t i : neighbors) {
            counters_.row(static_cast<Eigen::Index>(i)) += delta;
        }
    }
    record_write(neighbors.size());
}

Accumulator CounterMemory::accumulate(const BitVector& key) const {
    auto neighbors = space_.neighborhood(key, radius_);

    Accumulator sum = Accumulator::Zero(static_cast<Eigen::Index>(space_.length()));
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (size_t i : neighbors) {
        sum += counters_.row(static_cast<Eigen::Index>(i)).cast<int64_t>();
    }
    return sum;
}

BitVector CounterMemory::read(const BitVector& key) const {
    Accumulator sum = accumulate(key);
    record_read();

    BitVector result(static_cast<size_t>(sum.size()));
    for (Eigen::Index j = 0; j < sum.size(); ++j) {
        bool set = (tie_policy_ == TiePolicy::One) ? sum(j) >= 0 : sum(j) > 0;
        result[static_cast<size_t>(j)] = set ? 1 : 0;
    }
    return result;
}

CounterMatrix CounterMemory::counters() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return counters_;
}

void CounterMemory::load_counters(CounterMatrix counters) {
    if (counters.rows() != counters_.rows() || counters.cols() != counters_.cols()) {
        throw EngramError(ErrorKind::DimensionMismatch,
            "counter matrix is " + std::to_string(counters.rows()) + " x " + std::to_string(counters.cols()) +
            ", memory is " + std::to_string(counters_.rows()) + " x " + std::to_string(counters_.cols()));
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    counters_ = std::move(counters);
}

int32_t CounterMemory::max_abs_counter() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (counters_.size() == 0) return 0;
    return counters_.cwiseAbs().maxCoeff();
}

} // namespace Engram
