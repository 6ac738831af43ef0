/**
 * @file test_memory_config.cpp
 * @brief Configuration defaults, JSON loading and environment overrides
 */

#include <gtest/gtest.h>
#include <core/errors.hpp>
#include <core/memory_config.hpp>
#include <cstdlib>
#include <functional>
#include <string>

using namespace Engram;

namespace {

ErrorKind kind_of(const std::function<void()>& fn) {
    try { fn(); } catch (const EngramError& e) { return e.kind(); }
    ADD_FAILURE() << "no EngramError thrown";
    return ErrorKind::MalformedEncoding;
}

class EnvGuard {
public:
    EnvGuard(const char* name, const char* value) : name_(name) { ::setenv(name, value, 1); }
    ~EnvGuard() { ::unsetenv(name_); }

private:
    const char* name_;
};

} // namespace

TEST(MemoryConfigTest, Defaults) {
    MemoryConfig config;
    EXPECT_EQ(config.address_count, 2000u);
    EXPECT_EQ(config.vector_length, 512u);
    EXPECT_EQ(config.radius(), 230u);   // floor(0.451 * 512)
    EXPECT_EQ(config.key_seed, 42u);
    EXPECT_EQ(config.strategy, AddressStrategy::PerIndex);
    EXPECT_EQ(config.tie_policy, TiePolicy::Zero);
    EXPECT_EQ(config.backend, Backend::Counter);
    EXPECT_NO_THROW(config.validate());
}

TEST(MemoryConfigTest, RadiusOverride) {
    MemoryConfig config;
    config.vector_length = 64;
    EXPECT_EQ(config.radius(), 28u);
    config.radius_override = 10;
    EXPECT_EQ(config.radius(), 10u);
    config.radius_override = 65;
    EXPECT_EQ(kind_of([&] { config.validate(); }), ErrorKind::InvalidConfiguration);
}

TEST(MemoryConfigTest, ValidationRejectsDegenerateGeometry) {
    MemoryConfig config;
    config.address_count = 0;
    EXPECT_EQ(kind_of([&] { config.validate(); }), ErrorKind::InvalidConfiguration);

    config = MemoryConfig();
    config.radius_fraction = 1.5;
    EXPECT_EQ(kind_of([&] { config.validate(); }), ErrorKind::InvalidConfiguration);

    config.radius_fraction = -0.1;
    EXPECT_EQ(kind_of([&] { config.validate(); }), ErrorKind::InvalidConfiguration);
}

TEST(MemoryConfigTest, JsonText) {
    auto config = MemoryConfig::from_json_text(R"({
        "address_count": 4000,
        "vector_length": 64,
        "radius_fraction": 0.35,
        "address_seed": 7,
        "strategy": "mt19937-msb/single-stream",
        "tie_policy": "one",
        "backend": "checksum"
    })");
    EXPECT_EQ(config.address_count, 4000u);
    EXPECT_EQ(config.vector_length, 64u);
    EXPECT_EQ(config.radius(), 22u);
    EXPECT_EQ(config.address_seed, 7u);
    EXPECT_EQ(config.key_seed, 42u);
    EXPECT_EQ(config.strategy, AddressStrategy::SingleStream);
    EXPECT_EQ(config.tie_policy, TiePolicy::One);
    EXPECT_EQ(config.backend, Backend::Checksum);

    EXPECT_EQ(MemoryConfig::from_json_text(R"({"radius": 5})").radius(), 5u);
}

TEST(MemoryConfigTest, JsonErrors) {
    EXPECT_EQ(kind_of([] { MemoryConfig::from_json_text("{"); }), ErrorKind::InvalidConfiguration);
    EXPECT_EQ(kind_of([] { MemoryConfig::from_json_text("[1, 2]"); }), ErrorKind::InvalidConfiguration);
    EXPECT_EQ(kind_of([] { MemoryConfig::from_json_text(R"({"vector_length": "wide"})"); }),
              ErrorKind::InvalidConfiguration);
    EXPECT_EQ(kind_of([] { MemoryConfig::from_json_text(R"({"address_count": -3})"); }),
              ErrorKind::InvalidConfiguration);
    EXPECT_EQ(kind_of([] { MemoryConfig::from_json_text(R"({"address_seed": -1})"); }),
              ErrorKind::InvalidConfiguration);
    EXPECT_EQ(kind_of([] { MemoryConfig::from_json_text(R"({"vector_length": 2.9})"); }),
              ErrorKind::InvalidConfiguration);
    EXPECT_EQ(kind_of([] { MemoryConfig::from_json_text(R"({"radius": 4294967296})"); }),
              ErrorKind::InvalidConfiguration);
    EXPECT_EQ(kind_of([] { MemoryConfig::from_json_text(R"({"strategy": "xorshift"})"); }),
              ErrorKind::InvalidConfiguration);
    EXPECT_EQ(kind_of([] { MemoryConfig::load_from_file("/nonexistent/engram.json"); }),
              ErrorKind::InvalidConfiguration);
}

TEST(MemoryConfigTest, EnvironmentOverrides) {
    EnvGuard count("ENGRAM_ADDRESS_COUNT", "3000");
    EnvGuard fraction("ENGRAM_RADIUS_FRACTION", "0.25");
    EnvGuard seed("ENGRAM_KEY_SEED", "9");

    MemoryConfig config;
    config.apply_env();
    EXPECT_EQ(config.address_count, 3000u);
    EXPECT_EQ(config.radius(), 128u);
    EXPECT_EQ(config.key_seed, 9u);
    EXPECT_EQ(config.vector_length, 512u);
}

TEST(MemoryConfigTest, BadEnvironmentValue) {
    EnvGuard length("ENGRAM_VECTOR_LENGTH", "-4");
    MemoryConfig config;
    EXPECT_EQ(kind_of([&] { config.apply_env(); }), ErrorKind::InvalidConfiguration);
}

TEST(MemoryConfigTest, NamesRoundTrip) {
    for (auto s : {AddressStrategy::PerIndex, AddressStrategy::SingleStream}) {
        EXPECT_EQ(parse_address_strategy(to_string(s)), s);
    }
    for (auto t : {TiePolicy::Zero, TiePolicy::One}) {
        EXPECT_EQ(parse_tie_policy(to_string(t)), t);
    }
    EXPECT_EQ(parse_backend("checksum"), Backend::Checksum);
    EXPECT_FALSE(parse_backend("hnsw").has_value());
}
