/**
 * @file memory_config.hpp
 * @brief Geometry and policy knobs of a sparse distributed memory
 *
 * Values come from the defaults below, optionally a JSON file, then
 * ENGRAM_* environment overrides.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace Engram {

/**
 * @brief How hard-location addresses are derived from the seed
 */
enum class AddressStrategy {
    PerIndex,      // address i drawn from an engine seeded with seed + i
    SingleStream   // all addresses drawn in order from one engine seeded with seed
};

/**
 * @brief Output bit for an accumulator that sums to exactly zero
 */
enum class TiePolicy {
    Zero,   // bit = 1 only if sum > 0
    One     // bit = 1 if sum >= 0
};

enum class Backend {
    Counter,   // counter superposition
    Checksum   // checksum-validated blocks, majority vote
};

const char* to_string(AddressStrategy strategy);
const char* to_string(TiePolicy policy);
const char* to_string(Backend backend);

// Inverses of to_string; std::nullopt for an unknown name
std::optional<AddressStrategy> parse_address_strategy(const std::string& name);
std::optional<TiePolicy> parse_tie_policy(const std::string& name);
std::optional<Backend> parse_backend(const std::string& name);

struct MemoryConfig {
    uint32_t address_count = 2000;    // p, number of hard locations
    uint32_t vector_length = 512;     // n, bits per address / key / pattern
    double radius_fraction = 0.451;   // radius = floor(fraction * n)
    std::optional<uint32_t> radius_override;
    uint32_t address_seed = 0;
    uint32_t key_seed = 42;           // seed of the per-session chunk key stream
    AddressStrategy strategy = AddressStrategy::PerIndex;
    TiePolicy tie_policy = TiePolicy::Zero;
    Backend backend = Backend::Counter;

    uint32_t radius() const;

    /**
     * @throws EngramError(InvalidConfiguration)
     */
    void validate() const;

    /**
     * @brief Overlay ENGRAM_ADDRESS_COUNT, ENGRAM_VECTOR_LENGTH,
     *        ENGRAM_RADIUS_FRACTION, ENGRAM_ADDRESS_SEED, ENGRAM_KEY_SEED
     */
    void apply_env();

    /**
     * @brief Read a JSON configuration file; absent keys keep their defaults
     * @throws EngramError(InvalidConfiguration)
     */
    static MemoryConfig load_from_file(const std::string& path);

    static MemoryConfig from_json_text(const std::string& text);
};

} // namespace Engram
