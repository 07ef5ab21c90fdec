/**
 * @file record_extractor.hpp
 * @brief Turns one raw Wiktextract entry into senses and translation groups
 *
 * Raw entries are nested JSON objects:
 *   { "word", "lang_code"/"lang", "pos", "etymology_text",
 *     "senses": [ { "glosses": [...], "examples": [ { "text", "ref", "type" } ] } ],
 *     "translations": [ { "sense", "word", "lang" } ] }
 *
 * Anything missing or mistyped is dropped at the smallest level that
 * contains it (a sentence, a translation, a sense, or the whole entry).
 */

#pragma once

#include <export.hpp>
#include <config/seed_config.hpp>
#include <lexicon/models.hpp>
#include <lexicon/serialization.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace Seed {

/**
 * @brief Counters accumulated over every extract() call.
 */
struct ExtractionStats {
    size_t entries_seen = 0;
    size_t entries_wrong_language = 0;
    size_t entries_without_headword = 0;
    size_t entries_without_senses = 0;
    size_t entries_extracted = 0;

    size_t senses_kept = 0;
    size_t senses_dropped = 0;

    size_t examples_kept = 0;
    size_t quotations_kept = 0;
    size_t quotations_undated = 0;
    size_t quotations_out_of_range = 0;

    size_t translations_kept = 0;
    size_t translations_incomplete = 0;
    size_t translations_duplicate_language = 0;
};

class SEED_API RecordExtractor {
public:
    explicit RecordExtractor(const ExtractionConfig& config = ExtractionConfig());

    /**
     * @brief First 4-digit year token (1000-2099) in a reference string.
     */
    static std::optional<int> extract_year(const std::string& reference);

    /**
     * @brief Examples unconditionally, quotations only when dated inside the window.
     */
    std::vector<Sentence> extract_sentences(const ojson& raw_examples);

    /**
     * @brief Senses with a non-empty definition and at least one kept sentence.
     *
     * sense_order is the 1-based position in `raw_senses`.
     */
    std::vector<Sense> extract_senses(const ojson& raw_senses);

    /**
     * @brief Group translations by trimmed sense label; first language wins.
     */
    TranslationGroups extract_translations(const ojson& raw_translations);

    /**
     * @brief True if the entry's lang_code (or lang) is a configured source language.
     */
    bool accepts_language(const ojson& entry) const;

    /**
     * @brief Full extraction of one raw entry.
     * @return nullopt when the entry is filtered out or has no surviving sense
     */
    std::optional<ExtractedEntry> extract(const ojson& entry);

    const ExtractionConfig& config() const { return config_; }
    const ExtractionStats& stats() const { return stats_; }

private:
    std::optional<std::string> select_gloss(const ojson& glosses) const;

    ExtractionConfig config_;
    ExtractionStats stats_;
};

} // namespace Seed
