/**
 * @file seed_config.hpp
 * @brief Run configuration passed explicitly into every entry point
 *
 * Layering, lowest precedence first:
 *   built-in defaults → JSON config file → SEED_* environment → command line
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace Seed {

enum class GlossSelection {
    First,
    Last
};

enum class MalformedLinePolicy {
    Skip,   ///< Treat the line as an empty record and keep going
    Abort   ///< Throw ParseError
};

struct ExtractionConfig {
    int minimum_year;                       ///< Inclusive; defaults to current year - 25
    int maximum_year;                       ///< Inclusive; defaults to current year
    GlossSelection gloss = GlossSelection::Last;
    std::vector<std::string> languages = {"en", "english"};

    ExtractionConfig();
};

struct MatchingConfig {
    double threshold = 0.75;  ///< Minimum best cosine score
    double gap = 0.10;        ///< Minimum lead of best over second best
};

struct EmbeddingConfig {
    std::string model = "hashing";  ///< "hashing[:dim]" or a model directory
    std::string device = "cpu";
    size_t batch_size = 256;
};

struct IoConfig {
    size_t buffer_size = 1024 * 1024;
    size_t progress_interval = 100000;
    MalformedLinePolicy malformed_lines = MalformedLinePolicy::Skip;
};

struct SeedConfig {
    ExtractionConfig extraction;
    MatchingConfig matching;
    EmbeddingConfig embedding;
    IoConfig io;

    /**
     * @brief Overlay values present in a JSON config file.
     * @throws ConfigError if the file is unreadable or a value has the wrong type
     */
    void apply_file(const std::filesystem::path& path);

    /**
     * @brief Overlay SEED_* environment variables.
     */
    void apply_env();

    /**
     * @brief Overlay command-line flags; returns the positional arguments.
     *
     * `--config` is not handled here; see load().
     */
    std::vector<std::string> apply_arguments(const std::vector<std::string>& args);

    /**
     * @throws ConfigError on inverted year bounds, out-of-range threshold,
     *         negative gap or zero sizes
     */
    void validate() const;

    /**
     * @brief Full layering for a tool's argv. Also applies --no-color/--quiet to the logger.
     */
    static SeedConfig load(int argc, char** argv, std::vector<std::string>& positional);

    static std::string usage();
};

int current_year();

GlossSelection parse_gloss_selection(const std::string& value);
std::string to_string(GlossSelection gloss);

} // namespace Seed
