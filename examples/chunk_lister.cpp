/**
 * @file chunk_lister.cpp
 * @brief Lists the chunks of an IFF/RIFF/RIFX/RF64/W64 file
 *
 * Usage: chunk_lister [--mmap] [--lenient] <file>
 */

#include <riffle/parser.hh>
#include <cstring>
#include <iostream>

int main(int argc, char* argv[]) {
    bool use_mmap = false;
    bool lenient = false;
    const char* path = nullptr;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--mmap") == 0) {
            use_mmap = true;
        } else if (std::strcmp(argv[i], "--lenient") == 0) {
            lenient = true;
        } else if (!path) {
            path = argv[i];
        } else {
            path = nullptr;
            break;
        }
    }

    if (!path) {
        std::cout << "Usage: " << argv[0] << " [--mmap] [--lenient] <file>\n";
        std::cout << "\n";
        std::cout << "Lists all chunks in a chunk-based container file.\n";
        return 1;
    }

    riffle::parse_options options;
    options.strict = !lenient;
    options.on_warning = [](std::uint64_t offset, std::string_view category, std::string_view message) {
        std::cerr << "Warning at offset " << offset
                  << " [" << category << "]: " << message << "\n";
    };

    try {
        auto src = riffle::source::open(std::filesystem::path(path), use_mmap);

        riffle::container_walker walker(*src, options);

        const auto& md = walker.metadata();
        std::cout << md.master_identifier << " (" << riffle::to_string(md.family) << ", "
                  << riffle::to_string(md.order) << "-endian) form " << md.form_type
                  << ", " << md.declared_size << " bytes declared\n";
        std::cout << "====================\n";

        for (const auto& c : walker) {
            std::cout << "Chunk: " << c.identifier
                      << " (" << c.payload_size() << " bytes) at offset " << c.start_offset << "\n";
        }

        if (walker.truncated()) {
            std::cout << "\nSource ended before the declared end of the container\n";
            return 2;
        }
        std::cout << "\nParsing completed successfully!\n";

    } catch (const riffle::riffle_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
