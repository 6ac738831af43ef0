/**
 * @file ingestor.hpp
 * @brief Payload ingestion into one sparse distributed memory
 *
 * Pipeline per payload:
 *   bytes -> bits -> vector_length-bit chunks (last one zero padded)
 *         -> one fresh key per chunk -> write(key, chunk) -> FileRecord
 *
 * One Ingestor is one session: it owns the memory and the key stream.
 */

#pragma once

#include <bundle/bundle.hpp>
#include <bundle/bundle_writer.hpp>
#include <core/address_generator.hpp>
#include <core/associative_memory.hpp>
#include <core/memory_config.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace Engram {

/**
 * @brief Outcome of a batch ingestion
 */
struct IngestReport {
    std::vector<std::string> stored;                          // record names
    std::vector<std::pair<std::string, std::string>> skipped; // path, reason
    uint64_t chunks_written = 0;
    uint64_t empty_writes = 0;
};

class Ingestor {
public:
    /**
     * @throws EngramError(InvalidConfiguration)
     */
    explicit Ingestor(const MemoryConfig& config);

    /**
     * @brief Store one payload under name
     *
     * A name already present is replaced in the index; its earlier
     * writes remain superimposed in the memory.
     * @throws EngramError(MalformedEncoding) if name is not valid UTF-8;
     *         nothing is written
     */
    const FileRecord& ingest(const std::string& name, const std::vector<uint8_t>& bytes);

    /**
     * @brief Read and store one file, named after its final path component
     * @throws EngramError(SourceUnavailable) if it cannot be read
     */
    const FileRecord& ingest_file(const std::string& path);

    /**
     * @brief Ingest every path; failures are logged and skipped
     */
    IngestReport ingest_files(const std::vector<std::string>& paths);

    /**
     * @brief Snapshot the session
     * @throws EngramError(InvalidConfiguration) for the checksum backend
     * @throws EngramError(CounterOverflow)
     */
    Bundle build_bundle(const BundleOptions& options = BundleOptions()) const;

    const std::vector<FileRecord>& records() const { return records_; }
    const AssociativeMemory& memory() const { return *memory_; }
    const MemoryConfig& config() const { return config_; }

private:
    MemoryConfig config_;
    std::unique_ptr<AssociativeMemory> memory_;
    KeySource keys_;
    std::vector<FileRecord> records_;
};

/**
 * @brief Read a whole file
 * @throws EngramError(SourceUnavailable)
 */
std::vector<uint8_t> read_bytes(const std::string& path);

} // namespace Engram
