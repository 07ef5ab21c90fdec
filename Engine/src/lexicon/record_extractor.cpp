#include <lexicon/record_extractor.hpp>
#include <utils/unicode.hpp>

#include <algorithm>
#include <cstdint>
#include <regex>

#include <unicode/utf8.h>

namespace Seed {

RecordExtractor::RecordExtractor(const ExtractionConfig& config) : config_(config) {
    for (auto& language : config_.languages) language = trim_lower(language);
}

namespace {

// Word boundary in the Unicode sense: the codepoint on each side of
// [begin, end) is not a letter, digit or '_'.
bool bounded(const std::string& s, size_t begin, size_t end) {
    const auto* bytes = reinterpret_cast<const uint8_t*>(s.data());
    const int32_t length = static_cast<int32_t>(s.size());
    UChar32 c;

    if (begin > 0) {
        int32_t i = static_cast<int32_t>(begin);
        U8_PREV(bytes, 0, i, c);
        if (c >= 0 && is_word_char(static_cast<char32_t>(c))) return false;
    }
    if (end < s.size()) {
        int32_t i = static_cast<int32_t>(end);
        U8_NEXT(bytes, i, length, c);
        if (c >= 0 && is_word_char(static_cast<char32_t>(c))) return false;
    }
    return true;
}

} // namespace

std::optional<int> RecordExtractor::extract_year(const std::string& reference) {
    if (reference.empty()) return std::nullopt;

    // std::regex \b only knows ASCII word characters, so the boundaries are
    // checked against the neighbouring codepoints instead.
    static const std::regex r_year("1[0-9]{3}|20[0-9]{2}");
    for (auto it = std::sregex_iterator(reference.begin(), reference.end(), r_year);
         it != std::sregex_iterator(); ++it) {
        const size_t begin = static_cast<size_t>(it->position(0));
        if (bounded(reference, begin, begin + static_cast<size_t>(it->length(0)))) {
            return std::stoi(it->str(0));
        }
    }
    return std::nullopt;
}

std::vector<Sentence> RecordExtractor::extract_sentences(const ojson& raw_examples) {
    std::vector<Sentence> sentences;
    if (!raw_examples.is_array()) return sentences;

    for (const auto& example : raw_examples) {
        std::string text = trim(string_field(example, "text"));
        if (text.empty()) continue;

        std::string reference = string_field(example, "ref");
        if (!reference.empty()) {
            auto year = extract_year(reference);
            if (!year) {
                stats_.quotations_undated++;
                continue;
            }
            if (*year < config_.minimum_year || *year > config_.maximum_year) {
                stats_.quotations_out_of_range++;
                continue;
            }
            sentences.push_back(Quotation{std::move(text), trim(reference)});
            stats_.quotations_kept++;
        } else if (string_field(example, "type") == "example") {
            sentences.push_back(Example{std::move(text)});
            stats_.examples_kept++;
        }
    }

    return sentences;
}

std::optional<std::string> RecordExtractor::select_gloss(const ojson& glosses) const {
    if (!glosses.is_array() || glosses.empty()) return std::nullopt;

    const ojson& chosen = (config_.gloss == GlossSelection::First) ? glosses.front() : glosses.back();
    if (!chosen.is_string()) return std::nullopt;

    std::string definition = trim(chosen.get<std::string>());
    if (definition.empty()) return std::nullopt;
    return definition;
}

std::vector<Sense> RecordExtractor::extract_senses(const ojson& raw_senses) {
    std::vector<Sense> senses;
    if (!raw_senses.is_array()) return senses;

    int order = 0;
    for (const auto& raw : raw_senses) {
        ++order;
        if (!raw.is_object()) {
            stats_.senses_dropped++;
            continue;
        }

        auto glosses = raw.find("glosses");
        auto definition = (glosses != raw.end()) ? select_gloss(*glosses) : std::nullopt;
        if (!definition) {
            stats_.senses_dropped++;
            continue;
        }

        auto examples = raw.find("examples");
        std::vector<Sentence> sentences = (examples != raw.end())
            ? extract_sentences(*examples)
            : std::vector<Sentence>{};
        if (sentences.empty()) {
            stats_.senses_dropped++;
            continue;
        }

        Sense sense;
        sense.sense_order = order;
        sense.definition = std::move(*definition);
        sense.sentences = std::move(sentences);
        senses.push_back(std::move(sense));
        stats_.senses_kept++;
    }

    return senses;
}

TranslationGroups RecordExtractor::extract_translations(const ojson& raw_translations) {
    TranslationGroups groups;
    if (!raw_translations.is_array()) return groups;

    for (const auto& raw : raw_translations) {
        std::string label = trim(string_field(raw, "sense"));
        std::string word = trim_lower(string_field(raw, "word"));
        std::string language = trim_lower(string_field(raw, "lang"));

        if (label.empty() || word.empty() || language.empty()) {
            stats_.translations_incomplete++;
            continue;
        }

        if (groups.add(label, Translation{std::move(word), std::move(language)})) {
            stats_.translations_kept++;
        } else {
            stats_.translations_duplicate_language++;
        }
    }

    return groups;
}

bool RecordExtractor::accepts_language(const ojson& entry) const {
    std::string language = string_field(entry, "lang_code");
    if (language.empty()) language = string_field(entry, "lang");
    if (language.empty()) return false;

    language = trim_lower(language);
    return std::find(config_.languages.begin(), config_.languages.end(), language) != config_.languages.end();
}

std::optional<ExtractedEntry> RecordExtractor::extract(const ojson& entry) {
    stats_.entries_seen++;

    if (!accepts_language(entry)) {
        stats_.entries_wrong_language++;
        return std::nullopt;
    }

    std::string headword = trim(string_field(entry, "word"));
    if (headword.empty()) {
        stats_.entries_without_headword++;
        return std::nullopt;
    }

    auto raw_senses = entry.find("senses");
    std::vector<Sense> senses = (raw_senses != entry.end()) ? extract_senses(*raw_senses) : std::vector<Sense>{};
    if (senses.empty()) {
        stats_.entries_without_senses++;
        return std::nullopt;
    }

    ExtractedEntry out;
    out.lemma = std::move(headword);
    out.senses = std::move(senses);

    auto etymology = entry.find("etymology_text");
    if (etymology != entry.end() && etymology->is_string()) out.etymology = etymology->get<std::string>();
    auto pos = entry.find("pos");
    if (pos != entry.end() && pos->is_string()) out.pos = pos->get<std::string>();

    auto raw_translations = entry.find("translations");
    if (raw_translations != entry.end()) out.translations = extract_translations(*raw_translations);

    stats_.entries_extracted++;
    return out;
}

} // namespace Seed
