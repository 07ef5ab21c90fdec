/**
 * @file seed_extract.cpp
 * @brief Write the interim file: extracted senses plus raw translation groups
 *
 * Usage: seed_extract [options] <input.jsonl[.gz]> <interim.jsonl>
 */

#include <config/seed_config.hpp>
#include <pipeline/seed_pipeline.hpp>
#include <utils/logger.hpp>

#include <cstring>
#include <iomanip>
#include <iostream>

using namespace Seed;

static void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options] <input.jsonl[.gz]> <interim.jsonl>\n\n"
              << SeedConfig::usage();
}

int main(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        }
    }

    try {
        std::vector<std::string> positional;
        SeedConfig config = SeedConfig::load(argc, argv, positional);
        if (positional.size() != 2) {
            print_usage(argv[0]);
            return 1;
        }

        auto report = extract_entries(positional[0], positional[1], config);

        std::cout << "\n✓ Extraction complete\n";
        std::cout << "  Duration:   " << std::fixed << std::setprecision(2) << report.seconds << "s\n";
        std::cout << "  Lines read: " << report.records_read << "\n";
        std::cout << "  Entries:    " << report.records_written << "\n";
        std::cout << "  Senses:     " << report.senses << "\n";
        std::cout << "  Output:     " << report.output.string() << "\n";
        return 0;

    } catch (const std::exception& e) {
        Logger::error(e.what());
        return 1;
    }
}
