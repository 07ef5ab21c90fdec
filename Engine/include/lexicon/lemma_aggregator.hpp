/**
 * @file lemma_aggregator.hpp
 * @brief Merges senses from repeated headword occurrences into one Lemma each
 */

#pragma once

#include <export.hpp>
#include <lexicon/models.hpp>

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace Seed {

/**
 * @brief Insertion-ordered map from normalized headword to Lemma.
 *
 * Keys are trimmed and lower-cased, so "Run" and "run " land in the same
 * Lemma. Senses are appended as they come; identical definitions from two
 * occurrences stay two senses.
 */
class SEED_API LemmaAggregator {
public:
    /**
     * @brief Append senses to the lemma for `headword`, creating it on first sight.
     * @return false if the headword normalizes to the empty string
     */
    bool add(const std::string& headword, std::vector<Sense> senses);

    /**
     * @brief Lemmas in first-encounter order.
     */
    const std::vector<Lemma>& lemmas() const { return lemmas_; }

    /**
     * @brief Hand the lemmas over and reset the aggregator.
     */
    std::vector<Lemma> release();

    const Lemma* find(const std::string& headword) const;

    size_t size() const { return lemmas_.size(); }
    size_t sense_count() const { return sense_count_; }

private:
    std::vector<Lemma> lemmas_;
    std::unordered_map<std::string, size_t> index_;
    size_t sense_count_ = 0;
};

} // namespace Seed
