#include <bundle/bundle.hpp>
#include <bundle/bundle_reader.hpp>
#include <utils/logger.hpp>
#include <cctype>
#include <iostream>
#include <string>

using namespace Engram;

// A bare number selects by 1-based position, like the listing shows.
static std::string resolve_name(const BundleReader& reader, const std::string& selector) {
    if (reader.contains(selector)) return selector;

    bool numeric = !selector.empty();
    for (char c : selector) numeric = numeric && std::isdigit(static_cast<unsigned char>(c));
    if (numeric) {
        auto names = reader.file_names();
        unsigned long choice = std::stoul(selector);
        if (choice >= 1 && choice <= names.size()) return names[choice - 1];
    }
    return selector;  // reconstruct() reports UnknownFile
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <bundle.json> [--list | <name|number> [output]]\n";
        return 1;
    }

    try {
        BundleReader reader(load_bundle(argv[1]));

        if (argc < 3 || std::string(argv[2]) == "--list") {
            std::cout << "Available files for reconstruction:\n";
            auto names = reader.file_names();
            for (size_t i = 0; i < names.size(); ++i) {
                std::cout << "  " << (i + 1) << ". " << names[i] << "\n";
            }
            return 0;
        }

        std::string name = resolve_name(reader, argv[2]);
        std::string output = argc >= 4 ? argv[3] : "reconstructed_" + name;

        Logger::step("Reconstructing " + name);
        save_bytes(output, reader.reconstruct(name));
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
