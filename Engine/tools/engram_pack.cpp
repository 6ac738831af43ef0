#include <ingestion/ingestor.hpp>
#include <bundle/bundle.hpp>
#include <core/memory_config.hpp>
#include <utils/logger.hpp>
#include <iostream>
#include <string>
#include <vector>

using namespace Engram;

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " [--config file.json] [--embed-addresses] <bundle.json> <file>...\n";
        std::cerr << "\nEnvironment overrides: ENGRAM_ADDRESS_COUNT, ENGRAM_VECTOR_LENGTH,\n"
                  << "  ENGRAM_RADIUS_FRACTION, ENGRAM_ADDRESS_SEED, ENGRAM_KEY_SEED\n";
        std::cerr << "\nExample:\n";
        std::cerr << "  " << argv[0] << " bundle.json notes.txt image.png\n";
        return 1;
    }

    try {
        MemoryConfig config;
        BundleOptions options;
        std::vector<std::string> positional;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                config = MemoryConfig::load_from_file(argv[++i]);
            } else if (arg == "--embed-addresses") {
                options.embed_addresses = true;
            } else {
                positional.push_back(arg);
            }
        }
        config.apply_env();
        config.validate();

        if (positional.size() < 2) {
            std::cerr << "Need an output bundle path and at least one input file.\n";
            return 1;
        }

        Logger::info("SDM p=" + std::to_string(config.address_count) +
                     " n=" + std::to_string(config.vector_length) +
                     " radius=" + std::to_string(config.radius()));

        Ingestor ingestor(config);
        IngestReport report = ingestor.ingest_files({positional.begin() + 1, positional.end()});

        if (report.stored.empty()) {
            Logger::error("No files were processed; no bundle written.");
            return 1;
        }

        Bundle bundle = ingestor.build_bundle(options);
        save_bundle(bundle, positional[0]);

        std::cout << "\n=== Packing Complete ===\n"
                  << "Stored: " << report.stored.size() << " files\n"
                  << "Skipped: " << report.skipped.size() << " files\n"
                  << "Chunks written: " << report.chunks_written << "\n"
                  << "Empty-neighborhood writes: " << report.empty_writes << "\n"
                  << "Bundle: " << positional[0] << "\n";
        return report.skipped.empty() ? 0 : 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
