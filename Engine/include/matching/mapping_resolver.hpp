/**
 * @file mapping_resolver.hpp
 * @brief Associates translations with senses from a curated mapping file
 *
 * Mapping lines look like
 *   {"lemma": "run", "etymology": "...", "pos": "verb", "mapping": {"1": "B", "3": "A"}}
 * where the keys are 1-based sense positions and the letters index the
 * entry's translation-group labels in file order (A = first).
 */

#pragma once

#include <export.hpp>
#include <config/seed_config.hpp>
#include <lexicon/models.hpp>
#include <lexicon/serialization.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <tuple>

namespace Seed {

/**
 * @brief (headword, etymology, part of speech).
 *
 * A field absent from the record is "", an explicit null is nullopt; the two
 * never match each other.
 */
struct MappingKey {
    std::optional<std::string> lemma;
    std::optional<std::string> etymology;
    std::optional<std::string> pos;

    static MappingKey from_record(const ojson& record);
    static MappingKey from_entry(const ExtractedEntry& entry);

    bool operator<(const MappingKey& o) const {
        return std::tie(lemma, etymology, pos) < std::tie(o.lemma, o.etymology, o.pos);
    }
    bool operator==(const MappingKey& o) const {
        return std::tie(lemma, etymology, pos) == std::tie(o.lemma, o.etymology, o.pos);
    }
};

using SenseLetters = std::map<std::string, std::string>;

class SEED_API MappingTable {
public:
    /**
     * @brief Register one mapping record.
     *
     * A key already present is reset to an empty mapping. A record whose
     * "mapping" is not an object registers nothing. Non-string letters are
     * ignored.
     */
    void add(const ojson& record);

    /**
     * @brief Read a mapping JSONL file; malformed lines are skipped.
     * @return number of records read
     * @throws IoError if the file cannot be read
     */
    size_t load(const std::string& path, size_t buffer_size = 1024 * 1024);

    const SenseLetters* find(const MappingKey& key) const;

    size_t size() const { return mappings_.size(); }
    size_t collisions() const { return collisions_; }

private:
    std::map<MappingKey, SenseLetters> mappings_;
    size_t collisions_ = 0;
};

struct ResolveStats {
    size_t entries = 0;
    size_t entries_mapped = 0;
    size_t senses = 0;
    size_t senses_resolved = 0;
    size_t bad_letters = 0;
};

class SEED_API MappingResolver {
public:
    explicit MappingResolver(const MappingTable& table) : table_(table) {}

    /**
     * @brief Zero-based group index for a letter code.
     * @return nullopt unless `letter` is a single ASCII letter
     */
    static std::optional<size_t> letter_index(const std::string& letter);

    /**
     * @brief Copy of `entry` whose senses carry their mapped group's translations.
     *
     * Senses without a usable mapping get an empty translation list.
     */
    ExtractedEntry resolve(const ExtractedEntry& entry);

    const ResolveStats& stats() const { return stats_; }

private:
    const MappingTable& table_;
    ResolveStats stats_;
};

} // namespace Seed
