#include <bundle/bundle_writer.hpp>
#include <codec/base64.hpp>
#include <codec/counter_packing.hpp>
#include <codec/run_length.hpp>
#include <hashing/blake3_pipeline.hpp>
#include <utils/logger.hpp>
#include <algorithm>

namespace Engram {

std::string encode_address_table(const AddressMatrix& addresses) {
    std::vector<uint8_t> packed;
    for (Eigen::Index i = 0; i < addresses.rows(); ++i) {
        auto row = addresses.row(i);
        auto encoded = rle_encode(BitVector(row.data(), row.data() + row.size()));
        packed.insert(packed.end(), encoded.begin(), encoded.end());
    }
    return base64_encode(packed);
}

AddressMatrix decode_address_table(const std::string& encoded, size_t rows, size_t cols) {
    BitVector bits = rle_decode(base64_decode(encoded));
    if (bits.size() != rows * cols) {
        throw EngramError(ErrorKind::MalformedEncoding,
            "address table expands to " + std::to_string(bits.size()) + " bits, expected " +
            std::to_string(rows) + " x " + std::to_string(cols));
    }
    AddressMatrix addresses(static_cast<Eigen::Index>(rows), static_cast<Eigen::Index>(cols));
    std::copy(bits.begin(), bits.end(), addresses.data());
    return addresses;
}

Bundle build_bundle(const CounterMemory& memory,
                    const std::vector<FileRecord>& files,
                    const BundleOptions& options) {
    const auto& generator = memory.address_space().generator();

    Bundle bundle;
    bundle.radius = static_cast<uint32_t>(memory.radius());
    bundle.vector_length = static_cast<uint32_t>(memory.vector_length());
    bundle.chunk_size = bundle.vector_length;
    bundle.address_count = static_cast<uint32_t>(memory.address_count());
    if (generator) {
        bundle.address_seed = generator->seed();
        bundle.strategy = generator->strategy();
    }
    bundle.tie_policy = memory.tie_policy();

    std::vector<uint8_t> counter_bytes = pack_counters(memory.counters());
    bundle.counters = base64_encode(counter_bytes);
    bundle.counters_digest = BLAKE3Pipeline::to_hex(BLAKE3Pipeline::hash(counter_bytes));

    if (options.embed_addresses || !generator) {
        bundle.addresses = encode_address_table(memory.address_space().matrix());
    }
    bundle.files = files;

    Logger::step("Bundled " + std::to_string(files.size()) + " files, " +
                 std::to_string(counter_bytes.size()) + " counter bytes");
    return bundle;
}

} // namespace Engram
