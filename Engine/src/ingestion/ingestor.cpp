#include <ingestion/ingestor.hpp>
#include <codec/bit_codec.hpp>
#include <codec/chunk_codec.hpp>
#include <codec/run_length.hpp>
#include <core/counter_memory.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace Engram {

std::vector<uint8_t> read_bytes(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw EngramError(ErrorKind::SourceUnavailable, "not a readable file: " + path);
    }
    std::ifstream file(path, std::ios::binary);
    if (!file) throw EngramError(ErrorKind::SourceUnavailable, "open failed: " + path);

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) throw EngramError(ErrorKind::SourceUnavailable, "read failed: " + path);
    return bytes;
}

Ingestor::Ingestor(const MemoryConfig& config)
    : config_(config),
      memory_(make_memory(config)),
      keys_(config.key_seed) {}

const FileRecord& Ingestor::ingest(const std::string& name, const std::vector<uint8_t>& bytes) {
    if (!is_valid_file_name(name)) {
        throw EngramError(ErrorKind::MalformedEncoding, "file name is not valid UTF-8: " + name);
    }

    const size_t n = memory_->vector_length();
    ChunkedPayload payload = split_chunks(bytes_to_bits(bytes), n);

    FileRecord record;
    record.name = name;
    record.original_length = payload.original_length;
    record.chunk_keys.reserve(payload.chunks.size());

    const uint64_t empty_before = memory_->stats().empty_writes;
    for (const auto& chunk : payload.chunks) {
        BitVector key = keys_.next(n);
        memory_->write(key, chunk);
        record.chunk_keys.push_back(encode_key(key));
    }

    const uint64_t empty = memory_->stats().empty_writes - empty_before;
    if (empty > 0) {
        Logger::warn(name + ": " + std::to_string(empty) + " of " + std::to_string(payload.chunks.size()) +
                     " chunks reached no hard location; raise address_count or radius");
    }

    for (auto& existing : records_) {
        if (existing.name == name) {
            Logger::warn("Replacing earlier record for " + name);
            existing = std::move(record);
            return existing;
        }
    }
    records_.push_back(std::move(record));
    return records_.back();
}

const FileRecord& Ingestor::ingest_file(const std::string& path) {
    std::vector<uint8_t> bytes = read_bytes(path);
    std::string name = std::filesystem::path(path).filename().string();
    const FileRecord& record = ingest(name, bytes);
    Logger::success("Stored " + name + " (" + std::to_string(bytes.size()) + " bytes, " +
                    std::to_string(record.chunk_keys.size()) + " chunks)");
    return record;
}

IngestReport Ingestor::ingest_files(const std::vector<std::string>& paths) {
    IngestReport report;
    const MemoryStats before = memory_->stats();

    for (const auto& path : paths) {
        try {
            report.stored.push_back(ingest_file(path).name);
        } catch (const EngramError& e) {
            Logger::error("Skipping " + path + ": " + e.what());
            report.skipped.emplace_back(path, e.what());
        }
    }

    const MemoryStats after = memory_->stats();
    report.chunks_written = after.writes - before.writes;
    report.empty_writes = after.empty_writes - before.empty_writes;
    return report;
}

Bundle Ingestor::build_bundle(const BundleOptions& options) const {
    const auto* counters = dynamic_cast<const CounterMemory*>(memory_.get());
    if (!counters) {
        throw EngramError(ErrorKind::InvalidConfiguration,
            std::string("bundles require the counter backend, session uses '") +
            to_string(memory_->backend()) + "'");
    }
    return Engram::build_bundle(*counters, records_, options);
}

} // namespace Engram
