/**
 * @file seed_build.cpp
 * @brief Build the sense-linked seed dataset from a Wiktextract dump
 *
 * Usage: seed_build [options] <input.jsonl[.gz]> <output.jsonl>
 */

#include <config/seed_config.hpp>
#include <ml/embedding_provider.hpp>
#include <pipeline/seed_pipeline.hpp>
#include <utils/logger.hpp>

#include <cstring>
#include <iomanip>
#include <iostream>

using namespace Seed;

static void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options] <input.jsonl[.gz]> <output.jsonl>\n\n"
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

        auto provider = seed::ml::make_embedding_provider(config.embedding);
        auto report = build_seed(positional[0], positional[1], config, *provider);

        std::cout << "\n✓ Seed build complete\n";
        std::cout << "  Duration:   " << std::fixed << std::setprecision(2) << report.seconds << "s\n";
        std::cout << "  Lines read: " << report.records_read << "\n";
        std::cout << "  Lemmas:     " << report.lemmas << "\n";
        std::cout << "  Senses:     " << report.senses << "\n";
        std::cout << "  Assigned:   " << report.matching.assigned << " of "
                  << report.matching.labels_seen << " translation groups\n";
        std::cout << "  Output:     " << report.output.string() << "\n";
        return 0;

    } catch (const std::exception& e) {
        Logger::error(e.what());
        return 1;
    }
}
