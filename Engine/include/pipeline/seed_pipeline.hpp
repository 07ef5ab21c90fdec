/**
 * @file seed_pipeline.hpp
 * @brief The three run modes, each streaming one input file into one sink
 *
 *   build_seed             raw dump → extract → match → aggregate → lemmas
 *   extract_entries        raw dump → extract → interim records
 *   associate_translations interim records + mapping file → associated records
 */

#pragma once

#include <export.hpp>
#include <config/seed_config.hpp>
#include <lexicon/record_extractor.hpp>
#include <matching/mapping_resolver.hpp>
#include <matching/similarity_matcher.hpp>
#include <ml/embedding_provider.hpp>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>

namespace Seed {

struct PipelineReport {
    size_t records_read = 0;
    size_t malformed_lines = 0;
    size_t records_written = 0;
    size_t lemmas = 0;
    size_t senses = 0;
    ExtractionStats extraction;
    MatchStats matching;
    ResolveStats resolving;
    std::filesystem::path output;
    double seconds = 0.0;
};

using EntryCallback = std::function<void(ExtractedEntry&)>;

/**
 * @brief Read `input`, extract every record and hand surviving entries to `on_entry`.
 *
 * Fills the read and extraction counters of `report`.
 */
SEED_API void for_each_entry(const std::string& input,
                    const SeedConfig& config,
                    const EntryCallback& on_entry,
                    PipelineReport& report);

/**
 * @brief Full build: one record per normalized headword, in first-seen order.
 */
SEED_API PipelineReport build_seed(const std::string& input,
                          const std::string& output,
                          const SeedConfig& config,
                          seed::ml::EmbeddingProvider& provider);

/**
 * @brief Write one interim record per extracted entry.
 */
SEED_API PipelineReport extract_entries(const std::string& input,
                               const std::string& output,
                               const SeedConfig& config);

/**
 * @brief Resolve every interim record against a mapping file.
 *
 * Every non-empty interim record yields exactly one output record.
 */
SEED_API PipelineReport associate_translations(const std::string& interim,
                                      const std::string& mappings,
                                      const std::string& output,
                                      const SeedConfig& config);

} // namespace Seed
