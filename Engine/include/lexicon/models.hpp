/**
 * @file models.hpp
 * @brief Lexicon data model: sentences, translations, senses, lemmas
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace Seed {

/**
 * @brief Usage example with no bibliographic source.
 */
struct Example {
    std::string sentence;

    bool operator==(const Example& o) const { return sentence == o.sentence; }
};

/**
 * @brief Dated quotation; `reference` held the year that admitted it.
 */
struct Quotation {
    std::string sentence;
    std::string reference;

    bool operator==(const Quotation& o) const {
        return sentence == o.sentence && reference == o.reference;
    }
};

using Sentence = std::variant<Example, Quotation>;

inline const std::string& sentence_text(const Sentence& s) {
    return std::visit([](const auto& v) -> const std::string& { return v.sentence; }, s);
}

inline bool is_quotation(const Sentence& s) {
    return std::holds_alternative<Quotation>(s);
}

/**
 * @brief Translation of a headword: both fields trimmed and lower-cased.
 */
struct Translation {
    std::string translation;
    std::string language;

    bool operator==(const Translation& o) const {
        return translation == o.translation && language == o.language;
    }
};

/**
 * @brief Translations grouped by their free-text sense label.
 *
 * Labels keep the order in which they were first seen. Inside a group a
 * language appears at most once; the first translation for it wins.
 */
class TranslationGroups {
public:
    using Group = std::pair<std::string, std::vector<Translation>>;

    /**
     * @brief Append a translation under `label`.
     * @return false if the group already holds a translation for that language
     */
    bool add(const std::string& label, Translation translation);

    /**
     * @brief Append a whole group verbatim (used when reading interim files).
     *
     * A label seen before is replaced in place, keeping its position.
     */
    void set_group(const std::string& label, std::vector<Translation> translations);

    const std::vector<Group>& groups() const { return groups_; }
    const Group& operator[](size_t index) const { return groups_[index]; }

    std::vector<std::string> labels() const;
    const std::vector<Translation>* find(const std::string& label) const;

    size_t size() const { return groups_.size(); }
    bool empty() const { return groups_.empty(); }

    bool operator==(const TranslationGroups& o) const { return groups_ == o.groups_; }

private:
    std::vector<Group> groups_;
    std::unordered_map<std::string, size_t> index_;
};

/**
 * @brief One meaning of a headword occurrence.
 *
 * `sense_order` is the 1-based position of the sense in the raw entry and
 * survives filtering unchanged. `translations` starts empty and is only
 * appended to by the matcher or the mapping resolver.
 */
struct Sense {
    int sense_order = 0;
    std::string definition;
    std::vector<Sentence> sentences;
    std::vector<Translation> translations;

    bool operator==(const Sense& o) const {
        return sense_order == o.sense_order && definition == o.definition &&
               sentences == o.sentences && translations == o.translations;
    }
};

/**
 * @brief A headword occurrence after extraction.
 */
struct ExtractedEntry {
    std::string lemma;
    std::optional<std::string> etymology;
    std::optional<std::string> pos;
    std::vector<Sense> senses;
    TranslationGroups translations;
};

/**
 * @brief Aggregation root: a normalized headword and every sense collected for it.
 */
struct Lemma {
    std::string lemma;
    std::vector<Sense> senses;
};

} // namespace Seed
