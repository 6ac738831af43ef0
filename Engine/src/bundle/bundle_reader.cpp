#include <bundle/bundle_reader.hpp>
#include <bundle/bundle_writer.hpp>
#include <codec/base64.hpp>
#include <codec/bit_codec.hpp>
#include <codec/chunk_codec.hpp>
#include <codec/counter_packing.hpp>
#include <codec/run_length.hpp>
#include <core/errors.hpp>
#include <hashing/blake3_pipeline.hpp>
#include <utils/logger.hpp>
#include <fstream>

namespace Engram {

BundleReader::BundleReader(Bundle bundle) : bundle_(std::move(bundle)) {
    const size_t p = bundle_.address_count;
    const size_t n = bundle_.vector_length;

    std::vector<uint8_t> counter_bytes = base64_decode(bundle_.counters);
    if (BLAKE3Pipeline::to_hex(BLAKE3Pipeline::hash(counter_bytes)) != bundle_.counters_digest) {
        throw EngramError(ErrorKind::MalformedEncoding, "counter blob does not match its BLAKE3 digest");
    }
    CounterMatrix counters = unpack_counters(counter_bytes, p, n);

    AddressSpace space = bundle_.addresses
        ? AddressSpace(decode_address_table(*bundle_.addresses, p, n))
        : AddressSpace(AddressGenerator(bundle_.address_seed, bundle_.strategy), p, n);

    memory_ = std::make_unique<CounterMemory>(std::move(space), bundle_.radius, bundle_.tie_policy);
    memory_->load_counters(std::move(counters));
}

std::vector<std::string> BundleReader::file_names() const {
    std::vector<std::string> names;
    names.reserve(bundle_.files.size());
    for (const auto& file : bundle_.files) names.push_back(file.name);
    return names;
}

BitVector BundleReader::reconstruct_bits(const std::string& name) const {
    const FileRecord* record = bundle_.find(name);
    if (!record) {
        throw EngramError(ErrorKind::UnknownFile, "'" + name + "' is not in the bundle");
    }

    std::vector<BitVector> chunks;
    chunks.reserve(record->chunk_keys.size());
    for (const auto& encoded : record->chunk_keys) {
        chunks.push_back(memory_->read(decode_key(encoded)));
    }
    return join_chunks(chunks, static_cast<size_t>(record->original_length));
}

std::vector<uint8_t> BundleReader::reconstruct(const std::string& name) const {
    return bits_to_bytes(reconstruct_bits(name));
}

void save_bytes(const std::string& path, const std::vector<uint8_t>& bytes) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) throw EngramError(ErrorKind::SourceUnavailable, "cannot open for writing: " + path);
    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!file) throw EngramError(ErrorKind::SourceUnavailable, "failed to write: " + path);
    Logger::success("Wrote " + std::to_string(bytes.size()) + " bytes to " + path);
}

} // namespace Engram
