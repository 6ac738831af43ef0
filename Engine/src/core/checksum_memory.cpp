#include <core/checksum_memory.hpp>
#include <mutex>

namespace Engram {

namespace {

const MemoryConfig& validated(const MemoryConfig& config) {
    config.validate();
    return config;
}

} // namespace

ChecksumMemory::ChecksumMemory(AddressSpace space, size_t radius)
    : AssociativeMemory(std::move(space), radius), slots_(space_.count()) {}

ChecksumMemory::ChecksumMemory(const MemoryConfig& config)
    : ChecksumMemory(AddressSpace(AddressGenerator(validated(config).address_seed, config.strategy),
                                  config.address_count, config.vector_length),
                     config.radius()) {}

void ChecksumMemory::write(const BitVector& key, const BitVector& pattern) {
    check_pattern(pattern);
    auto neighbors = space_.neighborhood(key, radius_);
    auto checksum = BLAKE3Pipeline::hash(pattern);

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        for (size_t i : neighbors) {
            slots_[i][checksum] = pattern;
        }
    }
    record_write(neighbors.size());
}

BitVector ChecksumMemory::read(const BitVector& key) const {
    auto neighbors = space_.neighborhood(key, radius_);
    record_read();

    // Candidates in first-seen order with their vote counts
    std::vector<std::pair<const BitVector*, size_t>> votes;
    std::map<BLAKE3Pipeline::Hash, size_t> position;

    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (size_t i : neighbors) {
        for (const auto& [checksum, block] : slots_[i]) {
            if (BLAKE3Pipeline::hash(block) != checksum) continue;

            auto it = position.find(checksum);
            if (it == position.end()) {
                position.emplace(checksum, votes.size());
                votes.emplace_back(&block, 1);
            } else {
                ++votes[it->second].second;
            }
        }
    }

    const BitVector* best = nullptr;
    size_t best_count = 0;
    for (const auto& [block, count] : votes) {
        if (count > best_count) {
            best = block;
            best_count = count;
        }
    }
    return best ? *best : BitVector{};
}

size_t ChecksumMemory::blocks_at(size_t index) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return slots_.at(index).size();
}

} // namespace Engram
