/**
 * @file serialization.hpp
 * @brief JSON mapping of the lexicon data model
 *
 * Uses nlohmann::ordered_json throughout: translation-group label order is
 * meaningful (mapping letters index into it) and must survive a round trip.
 */

#pragma once

#include <lexicon/models.hpp>
#include <nlohmann/json.hpp>

namespace Seed {

using ojson = nlohmann::ordered_json;

void to_json(ojson& j, const Example& e);
void to_json(ojson& j, const Quotation& q);
void to_json(ojson& j, const Sentence& s);
void to_json(ojson& j, const Translation& t);
void to_json(ojson& j, const TranslationGroups& g);
void to_json(ojson& j, const Lemma& l);

/**
 * @brief Sense with or without its translation list.
 *
 * Interim files carry translations at entry level, so their senses omit it.
 */
ojson sense_to_json(const Sense& sense, bool with_translations);

/**
 * @brief Interim record: headword, etymology, pos, senses, translation groups.
 */
ojson entry_to_json(const ExtractedEntry& entry);

/**
 * @brief Associated record: headword, etymology, pos, senses with translations.
 *
 * Everything except the translations is copied unchanged from `source`, the
 * interim record `entry` was read from. Missing sense fields become null.
 */
ojson resolved_to_json(const ExtractedEntry& entry, const ojson& source);

// Lenient readers for interim files. Missing or mistyped fields become
// defaults; translations lacking a word or language are dropped.
std::optional<Sentence> sentence_from_json(const ojson& j);
std::optional<Translation> translation_from_json(const ojson& j);
Sense sense_from_json(const ojson& j);
ExtractedEntry entry_from_json(const ojson& j);

/**
 * @brief String value of `key`, or `fallback` when absent or not a string.
 */
std::string string_field(const ojson& j, const char* key, const std::string& fallback = "");

/**
 * @brief Absent → "", null → nullopt, string → itself, anything else → its JSON text.
 */
std::optional<std::string> optional_field(const ojson& j, const char* key);

} // namespace Seed
