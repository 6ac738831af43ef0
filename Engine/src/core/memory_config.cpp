#include <core/memory_config.hpp>
#include <core/errors.hpp>
#include <nlohmann/json.hpp>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <type_traits>

using json = nlohmann::json;

namespace Engram {

const char* to_string(AddressStrategy strategy) {
    switch (strategy) {
        case AddressStrategy::PerIndex:     return "mt19937-msb/per-index";
        case AddressStrategy::SingleStream: return "mt19937-msb/single-stream";
    }
    return "unknown";
}

const char* to_string(TiePolicy policy) {
    return policy == TiePolicy::One ? "one" : "zero";
}

const char* to_string(Backend backend) {
    return backend == Backend::Checksum ? "checksum" : "counter";
}

std::optional<AddressStrategy> parse_address_strategy(const std::string& name) {
    if (name == to_string(AddressStrategy::PerIndex)) return AddressStrategy::PerIndex;
    if (name == to_string(AddressStrategy::SingleStream)) return AddressStrategy::SingleStream;
    return std::nullopt;
}

std::optional<TiePolicy> parse_tie_policy(const std::string& name) {
    if (name == "zero") return TiePolicy::Zero;
    if (name == "one") return TiePolicy::One;
    return std::nullopt;
}

std::optional<Backend> parse_backend(const std::string& name) {
    if (name == "counter") return Backend::Counter;
    if (name == "checksum") return Backend::Checksum;
    return std::nullopt;
}

uint32_t MemoryConfig::radius() const {
    if (radius_override) return *radius_override;
    return static_cast<uint32_t>(std::floor(radius_fraction * vector_length));
}

void MemoryConfig::validate() const {
    if (address_count == 0) {
        throw EngramError(ErrorKind::InvalidConfiguration, "address_count must be positive");
    }
    if (vector_length == 0) {
        throw EngramError(ErrorKind::InvalidConfiguration, "vector_length must be positive");
    }
    if (!(radius_fraction >= 0.0 && radius_fraction <= 1.0)) {
        throw EngramError(ErrorKind::InvalidConfiguration,
            "radius_fraction " + std::to_string(radius_fraction) + " is outside [0, 1]");
    }
    if (radius() > vector_length) {
        throw EngramError(ErrorKind::InvalidConfiguration,
            "radius " + std::to_string(radius()) + " exceeds vector_length " +
            std::to_string(vector_length));
    }
}

namespace {

uint32_t parse_uint32(const char* name, const char* text) {
    std::string value(text);
    try {
        size_t pos = 0;
        unsigned long long parsed = std::stoull(value, &pos);
        if (pos != value.size() || value.find('-') != std::string::npos ||
            parsed > std::numeric_limits<uint32_t>::max()) {
            throw std::invalid_argument(value);
        }
        return static_cast<uint32_t>(parsed);
    } catch (const std::logic_error&) {
        throw EngramError(ErrorKind::InvalidConfiguration,
            std::string(name) + "='" + value + "' is not an unsigned 32-bit integer");
    }
}

double parse_double(const char* name, const char* text) {
    std::string value(text);
    try {
        size_t pos = 0;
        double parsed = std::stod(value, &pos);
        if (pos != value.size()) throw std::invalid_argument(value);
        return parsed;
    } catch (const std::logic_error&) {
        throw EngramError(ErrorKind::InvalidConfiguration,
            std::string(name) + "='" + value + "' is not a number");
    }
}

template <typename T>
T json_field(const json& j, const char* key, T fallback) {
    if (!j.contains(key)) return fallback;
    if constexpr (std::is_same_v<T, uint32_t>) {
        // get<uint32_t>() would wrap negatives and truncate fractions
        const json& value = j.at(key);
        if (!value.is_number_unsigned() || value.get<uint64_t>() > std::numeric_limits<uint32_t>::max()) {
            throw EngramError(ErrorKind::InvalidConfiguration,
                std::string("config field '") + key + "' is not an unsigned 32-bit integer: " + value.dump());
        }
    }
    try {
        return j.at(key).get<T>();
    } catch (const json::exception& e) {
        throw EngramError(ErrorKind::InvalidConfiguration,
            std::string("config field '") + key + "': " + e.what());
    }
}

} // namespace

void MemoryConfig::apply_env() {
    if (const char* v = std::getenv("ENGRAM_ADDRESS_COUNT")) address_count = parse_uint32("ENGRAM_ADDRESS_COUNT", v);
    if (const char* v = std::getenv("ENGRAM_VECTOR_LENGTH")) vector_length = parse_uint32("ENGRAM_VECTOR_LENGTH", v);
    if (const char* v = std::getenv("ENGRAM_RADIUS_FRACTION")) radius_fraction = parse_double("ENGRAM_RADIUS_FRACTION", v);
    if (const char* v = std::getenv("ENGRAM_ADDRESS_SEED")) address_seed = parse_uint32("ENGRAM_ADDRESS_SEED", v);
    if (const char* v = std::getenv("ENGRAM_KEY_SEED")) key_seed = parse_uint32("ENGRAM_KEY_SEED", v);
}

MemoryConfig MemoryConfig::from_json_text(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::exception& e) {
        throw EngramError(ErrorKind::InvalidConfiguration, std::string("config is not valid JSON: ") + e.what());
    }
    if (!j.is_object()) {
        throw EngramError(ErrorKind::InvalidConfiguration, "config must be a JSON object");
    }

    MemoryConfig config;
    config.address_count = json_field<uint32_t>(j, "address_count", config.address_count);
    config.vector_length = json_field<uint32_t>(j, "vector_length", config.vector_length);
    config.radius_fraction = json_field<double>(j, "radius_fraction", config.radius_fraction);
    config.address_seed = json_field<uint32_t>(j, "address_seed", config.address_seed);
    config.key_seed = json_field<uint32_t>(j, "key_seed", config.key_seed);
    if (j.contains("radius")) {
        config.radius_override = json_field<uint32_t>(j, "radius", 0);
    }

    if (j.contains("strategy")) {
        auto name = json_field<std::string>(j, "strategy", "");
        auto strategy = parse_address_strategy(name);
        if (!strategy) throw EngramError(ErrorKind::InvalidConfiguration, "unknown strategy '" + name + "'");
        config.strategy = *strategy;
    }
    if (j.contains("tie_policy")) {
        auto name = json_field<std::string>(j, "tie_policy", "");
        auto policy = parse_tie_policy(name);
        if (!policy) throw EngramError(ErrorKind::InvalidConfiguration, "unknown tie_policy '" + name + "'");
        config.tie_policy = *policy;
    }
    if (j.contains("backend")) {
        auto name = json_field<std::string>(j, "backend", "");
        auto backend = parse_backend(name);
        if (!backend) throw EngramError(ErrorKind::InvalidConfiguration, "unknown backend '" + name + "'");
        config.backend = *backend;
    }
    return config;
}

MemoryConfig MemoryConfig::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw EngramError(ErrorKind::InvalidConfiguration, "cannot open config file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json_text(buffer.str());
}

} // namespace Engram
