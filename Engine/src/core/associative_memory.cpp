#include <core/associative_memory.hpp>
#include <core/checksum_memory.hpp>
#include <core/counter_memory.hpp>
#include <core/errors.hpp>

namespace Engram {

void AssociativeMemory::check_pattern(const BitVector& pattern) const {
    if (pattern.size() != space_.length()) {
        throw EngramError(ErrorKind::DimensionMismatch,
            "pattern has " + std::to_string(pattern.size()) + " bits, memory expects " +
            std::to_string(space_.length()));
    }
    if (!is_binary(pattern)) {
        throw EngramError(ErrorKind::MalformedEncoding, "pattern holds a value other than 0/1");
    }
}

std::unique_ptr<AssociativeMemory> make_memory(const MemoryConfig& config) {
    config.validate();
    switch (config.backend) {
        case Backend::Counter:  return std::make_unique<CounterMemory>(config);
        case Backend::Checksum: return std::make_unique<ChecksumMemory>(config);
    }
    throw EngramError(ErrorKind::InvalidConfiguration, "unknown backend");
}

} // namespace Engram
