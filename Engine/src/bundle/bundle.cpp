/**
 * @file bundle.cpp
 * @brief JSON form of a bundle
 */

#include <bundle/bundle.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

// ordered so files keep their ingestion order through a round trip
using json = nlohmann::ordered_json;

namespace Engram {

const FileRecord* Bundle::find(const std::string& name) const {
    for (const auto& file : files) {
        if (file.name == name) return &file;
    }
    return nullptr;
}

namespace {

[[noreturn]] void malformed(const std::string& what) {
    throw EngramError(ErrorKind::MalformedEncoding, "bundle: " + what);
}

const json& require(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) malformed(std::string("missing field '") + key + "'");
    return *it;
}

uint32_t require_uint(const json& j, const char* key) {
    const json& value = require(j, key);
    if (!value.is_number_unsigned() || value.get<uint64_t>() > 0xFFFFFFFFull) {
        malformed(std::string("field '") + key + "' is not an unsigned 32-bit integer");
    }
    return value.get<uint32_t>();
}

std::string require_string(const json& j, const char* key) {
    const json& value = require(j, key);
    if (!value.is_string()) malformed(std::string("field '") + key + "' is not a string");
    return value.get<std::string>();
}

FileRecord parse_file(const std::string& name, const json& entry) {
    if (!entry.is_object()) malformed("file '" + name + "' is not an object");

    FileRecord record;
    record.name = name;

    const json& length = require(entry, "original_length");
    if (!length.is_number_unsigned()) malformed("file '" + name + "' has a bad original_length");
    record.original_length = length.get<uint64_t>();

    const json& keys = require(entry, "chunk_keys");
    if (!keys.is_array()) malformed("file '" + name + "' chunk_keys is not an array");
    record.chunk_keys.reserve(keys.size());
    for (const auto& key : keys) {
        if (!key.is_string()) malformed("file '" + name + "' has a non-string chunk key");
        record.chunk_keys.push_back(key.get<std::string>());
    }
    return record;
}

} // namespace

Bundle parse_bundle(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::exception& e) {
        malformed(std::string("not valid JSON: ") + e.what());
    }
    if (!j.is_object()) malformed("top level is not an object");

    if (require_string(j, "format") != k_bundle_format) malformed("unexpected format tag");
    uint32_t version = require_uint(j, "version");
    if (version != k_bundle_version) malformed("unsupported version " + std::to_string(version));

    Bundle bundle;
    bundle.radius = require_uint(j, "radius");
    bundle.chunk_size = require_uint(j, "chunk_size");
    bundle.vector_length = require_uint(j, "vector_length");
    bundle.address_count = require_uint(j, "address_count");
    bundle.address_seed = require_uint(j, "address_seed");

    if (bundle.vector_length == 0 || bundle.address_count == 0) malformed("empty geometry");
    if (bundle.chunk_size != bundle.vector_length) {
        malformed("chunk_size " + std::to_string(bundle.chunk_size) +
                  " differs from vector_length " + std::to_string(bundle.vector_length));
    }
    if (bundle.radius > bundle.vector_length) malformed("radius exceeds vector_length");

    auto strategy_name = require_string(j, "address_strategy");
    auto strategy = parse_address_strategy(strategy_name);
    if (!strategy) malformed("unknown address_strategy '" + strategy_name + "'");
    bundle.strategy = *strategy;

    auto tie_name = require_string(j, "tie_policy");
    auto tie = parse_tie_policy(tie_name);
    if (!tie) malformed("unknown tie_policy '" + tie_name + "'");
    bundle.tie_policy = *tie;

    bundle.counters = require_string(j, "counters");
    bundle.counters_digest = require_string(j, "counters_blake3");
    if (j.contains("addresses")) bundle.addresses = require_string(j, "addresses");

    const json& files = require(j, "files");
    if (!files.is_object()) malformed("'files' is not an object");
    for (const auto& [name, entry] : files.items()) {
        bundle.files.push_back(parse_file(name, entry));
    }
    return bundle;
}

std::string serialize_bundle(const Bundle& bundle, int indent) {
    json j;
    j["format"] = k_bundle_format;
    j["version"] = k_bundle_version;
    j["radius"] = bundle.radius;
    j["chunk_size"] = bundle.chunk_size;
    j["vector_length"] = bundle.vector_length;
    j["address_count"] = bundle.address_count;
    j["address_seed"] = bundle.address_seed;
    j["address_strategy"] = to_string(bundle.strategy);
    j["tie_policy"] = to_string(bundle.tie_policy);
    j["counters"] = bundle.counters;
    j["counters_blake3"] = bundle.counters_digest;
    if (bundle.addresses) j["addresses"] = *bundle.addresses;

    json files = json::object();
    for (const auto& file : bundle.files) {
        files[file.name] = {
            {"chunk_keys", file.chunk_keys},
            {"original_length", file.original_length}
        };
    }
    j["files"] = std::move(files);
    try {
        return j.dump(indent, ' ', false, json::error_handler_t::strict);
    } catch (const json::exception& e) {
        throw EngramError(ErrorKind::MalformedEncoding, std::string("bundle: cannot serialize: ") + e.what());
    }
}

bool is_valid_file_name(const std::string& name) {
    try {
        json(name).dump();
        return true;
    } catch (const json::type_error&) {
        return false;
    }
}

Bundle load_bundle(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) throw EngramError(ErrorKind::SourceUnavailable, "cannot open bundle: " + path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    Bundle bundle = parse_bundle(buffer.str());
    Logger::info("Loaded bundle " + path + " (" + std::to_string(bundle.files.size()) + " files)");
    return bundle;
}

void save_bundle(const Bundle& bundle, const std::string& path) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) throw EngramError(ErrorKind::SourceUnavailable, "cannot open for writing: " + path);
    file << serialize_bundle(bundle, 2) << '\n';
    if (!file) throw EngramError(ErrorKind::SourceUnavailable, "failed to write bundle: " + path);
}

} // namespace Engram
