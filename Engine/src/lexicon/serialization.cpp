#include <lexicon/serialization.hpp>

namespace Seed {

void to_json(ojson& j, const Example& e) {
    j = ojson{{"sentence", e.sentence}};
}

void to_json(ojson& j, const Quotation& q) {
    j = ojson{{"sentence", q.sentence}, {"reference", q.reference}};
}

void to_json(ojson& j, const Sentence& s) {
    std::visit([&j](const auto& v) { to_json(j, v); }, s);
}

void to_json(ojson& j, const Translation& t) {
    j = ojson{{"translation", t.translation}, {"language", t.language}};
}

void to_json(ojson& j, const TranslationGroups& g) {
    j = ojson::object();
    for (const auto& [label, translations] : g.groups()) {
        ojson list = ojson::array();
        for (const auto& t : translations) list.push_back(ojson(t));
        j[label] = std::move(list);
    }
}

ojson sense_to_json(const Sense& sense, bool with_translations) {
    ojson j = ojson::object();
    j["sense_order"] = sense.sense_order;
    j["definition"] = sense.definition;

    ojson sentences = ojson::array();
    for (const auto& s : sense.sentences) sentences.push_back(ojson(s));
    j["sentences"] = std::move(sentences);

    if (with_translations) {
        ojson translations = ojson::array();
        for (const auto& t : sense.translations) translations.push_back(ojson(t));
        j["translations"] = std::move(translations);
    }
    return j;
}

void to_json(ojson& j, const Lemma& l) {
    j = ojson::object();
    j["lemma"] = l.lemma;
    ojson senses = ojson::array();
    for (const auto& s : l.senses) senses.push_back(sense_to_json(s, true));
    j["senses"] = std::move(senses);
}

static ojson optional_to_json(const std::optional<std::string>& value) {
    return value ? ojson(*value) : ojson(nullptr);
}

ojson entry_to_json(const ExtractedEntry& entry) {
    ojson j = ojson::object();
    j["lemma"] = entry.lemma;
    j["etymology"] = optional_to_json(entry.etymology);
    j["pos"] = optional_to_json(entry.pos);

    ojson senses = ojson::array();
    for (const auto& s : entry.senses) senses.push_back(sense_to_json(s, false));
    j["senses"] = std::move(senses);
    j["translations"] = entry.translations;
    return j;
}

static ojson verbatim(const ojson& j, const char* key, const ojson& fallback) {
    if (!j.is_object()) return fallback;
    auto it = j.find(key);
    return it != j.end() ? *it : fallback;
}

ojson resolved_to_json(const ExtractedEntry& entry, const ojson& source) {
    ojson j = ojson::object();
    j["lemma"] = verbatim(source, "lemma", "");
    j["etymology"] = verbatim(source, "etymology", "");
    j["pos"] = verbatim(source, "pos", "");

    static const ojson kNoSenses = ojson::array();
    auto raw_senses = source.find("senses");
    const ojson& raw = (raw_senses != source.end() && raw_senses->is_array()) ? *raw_senses : kNoSenses;

    ojson senses = ojson::array();
    for (size_t i = 0; i < entry.senses.size(); ++i) {
        const ojson& raw_sense = i < raw.size() ? raw[i] : kNoSenses;
        ojson sense = ojson::object();
        sense["sense_order"] = verbatim(raw_sense, "sense_order", nullptr);
        sense["definition"] = verbatim(raw_sense, "definition", nullptr);
        sense["sentences"] = verbatim(raw_sense, "sentences", nullptr);

        ojson translations = ojson::array();
        for (const auto& t : entry.senses[i].translations) translations.push_back(ojson(t));
        sense["translations"] = std::move(translations);
        senses.push_back(std::move(sense));
    }
    j["senses"] = std::move(senses);
    return j;
}

std::string string_field(const ojson& j, const char* key, const std::string& fallback) {
    if (!j.is_object()) return fallback;
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return fallback;
    return it->get<std::string>();
}

std::optional<std::string> optional_field(const ojson& j, const char* key) {
    if (!j.is_object()) return std::string();
    auto it = j.find(key);
    if (it == j.end()) return std::string();
    if (it->is_null()) return std::nullopt;
    if (it->is_string()) return it->get<std::string>();
    return it->dump();
}

std::optional<Sentence> sentence_from_json(const ojson& j) {
    if (!j.is_object()) return std::nullopt;
    std::string text = string_field(j, "sentence");
    auto ref = j.find("reference");
    if (ref != j.end() && ref->is_string()) {
        return Sentence{Quotation{text, ref->get<std::string>()}};
    }
    return Sentence{Example{text}};
}

std::optional<Translation> translation_from_json(const ojson& j) {
    std::string word = string_field(j, "translation");
    std::string language = string_field(j, "language");
    if (word.empty() || language.empty()) return std::nullopt;
    return Translation{word, language};
}

Sense sense_from_json(const ojson& j) {
    Sense sense;
    if (!j.is_object()) return sense;

    auto order = j.find("sense_order");
    if (order != j.end() && order->is_number_integer()) sense.sense_order = order->get<int>();
    sense.definition = string_field(j, "definition");

    auto sentences = j.find("sentences");
    if (sentences != j.end() && sentences->is_array()) {
        for (const auto& raw : *sentences) {
            if (auto s = sentence_from_json(raw)) sense.sentences.push_back(std::move(*s));
        }
    }

    auto translations = j.find("translations");
    if (translations != j.end() && translations->is_array()) {
        for (const auto& raw : *translations) {
            if (auto t = translation_from_json(raw)) sense.translations.push_back(std::move(*t));
        }
    }
    return sense;
}

ExtractedEntry entry_from_json(const ojson& j) {
    ExtractedEntry entry;
    entry.lemma = string_field(j, "lemma");
    entry.etymology = optional_field(j, "etymology");
    entry.pos = optional_field(j, "pos");
    if (!j.is_object()) return entry;

    auto senses = j.find("senses");
    if (senses != j.end() && senses->is_array()) {
        for (const auto& raw : *senses) entry.senses.push_back(sense_from_json(raw));
    }

    auto groups = j.find("translations");
    if (groups != j.end() && groups->is_object()) {
        for (const auto& [label, raw_list] : groups->items()) {
            std::vector<Translation> translations;
            if (raw_list.is_array()) {
                for (const auto& raw : raw_list) {
                    if (auto t = translation_from_json(raw)) translations.push_back(std::move(*t));
                }
            }
            entry.translations.set_group(label, std::move(translations));
        }
    }
    return entry;
}

} // namespace Seed
