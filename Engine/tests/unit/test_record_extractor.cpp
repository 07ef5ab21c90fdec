/**
 * @file test_record_extractor.cpp
 * @brief Sense, sentence and translation extraction from raw entries
 */

#include <gtest/gtest.h>
#include <lexicon/lemma_aggregator.hpp>
#include <lexicon/record_extractor.hpp>
#include <utils/unicode.hpp>

using namespace Seed;

namespace {

ExtractionConfig window(int min_year, int max_year) {
    ExtractionConfig config;
    config.minimum_year = min_year;
    config.maximum_year = max_year;
    return config;
}

ojson run_entry() {
    return ojson::parse(R"({
        "word": "run",
        "lang_code": "en",
        "pos": "verb",
        "etymology_text": "From Old English rinnan.",
        "senses": [
            {"glosses": ["To move.", "To move swiftly on foot."],
             "examples": [{"text": "She runs every morning.", "type": "example"}]},
            {"glosses": ["Without sentences."]},
            {"glosses": ["To manage or be in charge of."],
             "examples": [{"text": "He runs the shop.", "ref": "1995, New York Times"}]}
        ],
        "translations": [
            {"sense": "move swiftly", "word": "Courir", "lang": "French"},
            {"sense": "move swiftly", "word": "correr", "lang": "Spanish"},
            {"sense": "move swiftly", "word": "galoper", "lang": "french"},
            {"sense": "manage", "word": "leiten", "lang": "German"},
            {"sense": "manage", "word": "", "lang": "Italian"}
        ]
    })");
}

} // namespace

// =============================================================================
// Years and sentences
// =============================================================================

TEST(RecordExtractorTest, ExtractYear) {
    EXPECT_EQ(RecordExtractor::extract_year("1995, New York Times").value_or(0), 1995);
    EXPECT_EQ(RecordExtractor::extract_year("Published 2003; reprinted 2010").value_or(0), 2003);
    EXPECT_FALSE(RecordExtractor::extract_year("Shakespeare, Hamlet").has_value());
    EXPECT_FALSE(RecordExtractor::extract_year("page 21345").has_value());
    EXPECT_FALSE(RecordExtractor::extract_year("").has_value());
}

TEST(RecordExtractorTest, ExtractYearUnicodeBoundaries) {
    // Letters outside ASCII are word characters too
    EXPECT_FALSE(RecordExtractor::extract_year("1995年").has_value());
    EXPECT_FALSE(RecordExtractor::extract_year("é1995, Paris").has_value());
    EXPECT_FALSE(RecordExtractor::extract_year("1995ж").has_value());

    // Punctuation and spaces outside ASCII are not
    EXPECT_EQ(RecordExtractor::extract_year("«1995», Paris").value_or(0), 1995);
    EXPECT_EQ(RecordExtractor::extract_year("1995年 and 2001, Tokyo").value_or(0), 2001);
    EXPECT_EQ(RecordExtractor::extract_year("Ấn bản 2004").value_or(0), 2004);
}

TEST(RecordExtractorTest, UndatedNonAsciiReferenceRejected) {
    RecordExtractor extractor(window(1000, 2099));
    auto raw = ojson::parse(R"([{"text": "走る。", "ref": "1995年, 朝日新聞"}])");

    EXPECT_TRUE(extractor.extract_sentences(raw).empty());
    EXPECT_EQ(extractor.stats().quotations_undated, 1u);
}

TEST(RecordExtractorTest, QuotationYearWindow) {
    auto quote = ojson::parse(R"([{"text": "He runs the shop.", "ref": "1995, New York Times"}])");

    RecordExtractor wide(window(1990, 2024));
    auto kept = wide.extract_sentences(quote);
    ASSERT_EQ(kept.size(), 1u);
    ASSERT_TRUE(is_quotation(kept[0]));
    EXPECT_EQ(std::get<Quotation>(kept[0]).reference, "1995, New York Times");

    RecordExtractor narrow(window(2000, 2024));
    EXPECT_TRUE(narrow.extract_sentences(quote).empty());
    EXPECT_EQ(narrow.stats().quotations_out_of_range, 1u);
}

TEST(RecordExtractorTest, UndatedQuotationRejected) {
    RecordExtractor extractor(window(1000, 2099));
    auto raw = ojson::parse(R"([{"text": "To be or not to be.", "ref": "Shakespeare, Hamlet", "type": "example"}])");

    EXPECT_TRUE(extractor.extract_sentences(raw).empty());
    EXPECT_EQ(extractor.stats().quotations_undated, 1u);
}

TEST(RecordExtractorTest, ExamplesNeedTypeAndText) {
    RecordExtractor extractor(window(1990, 2024));
    auto raw = ojson::parse(R"([
        {"text": "  kept  ", "type": "example"},
        {"text": "no type"},
        {"text": "   ", "type": "example"},
        {"type": "example"},
        "not an object"
    ])");

    auto sentences = extractor.extract_sentences(raw);
    ASSERT_EQ(sentences.size(), 1u);
    EXPECT_FALSE(is_quotation(sentences[0]));
    EXPECT_EQ(sentence_text(sentences[0]), "kept");
}

// =============================================================================
// Senses
// =============================================================================

TEST(RecordExtractorTest, SenseOrderSurvivesFiltering) {
    RecordExtractor extractor(window(1990, 2024));
    auto entry = extractor.extract(run_entry());
    ASSERT_TRUE(entry.has_value());

    ASSERT_EQ(entry->senses.size(), 2u);
    EXPECT_EQ(entry->senses[0].sense_order, 1);
    EXPECT_EQ(entry->senses[1].sense_order, 3);
    EXPECT_EQ(extractor.stats().senses_dropped, 1u);
}

TEST(RecordExtractorTest, GlossSelection) {
    auto raw = run_entry()["senses"];

    RecordExtractor last(window(1990, 2024));
    EXPECT_EQ(last.extract_senses(raw)[0].definition, "To move swiftly on foot.");

    auto config = window(1990, 2024);
    config.gloss = GlossSelection::First;
    RecordExtractor first(config);
    EXPECT_EQ(first.extract_senses(raw)[0].definition, "To move.");
}

TEST(RecordExtractorTest, SensesStartWithoutTranslations) {
    RecordExtractor extractor(window(1990, 2024));
    auto entry = extractor.extract(run_entry());
    ASSERT_TRUE(entry.has_value());
    for (const auto& sense : entry->senses) EXPECT_TRUE(sense.translations.empty());
}

TEST(RecordExtractorTest, EmptyGlossDropsSense) {
    RecordExtractor extractor(window(1990, 2024));
    auto raw = ojson::parse(R"([
        {"glosses": [], "examples": [{"text": "x", "type": "example"}]},
        {"glosses": ["   "], "examples": [{"text": "x", "type": "example"}]},
        {"examples": [{"text": "x", "type": "example"}]}
    ])");
    EXPECT_TRUE(extractor.extract_senses(raw).empty());
    EXPECT_EQ(extractor.stats().senses_dropped, 3u);
}

// =============================================================================
// Translations
// =============================================================================

TEST(RecordExtractorTest, FirstLanguageWinsPerGroup) {
    RecordExtractor extractor(window(1990, 2024));
    auto groups = extractor.extract_translations(run_entry()["translations"]);

    ASSERT_EQ(groups.size(), 2u);
    EXPECT_EQ(groups.labels(), (std::vector<std::string>{"move swiftly", "manage"}));

    const auto* move = groups.find("move swiftly");
    ASSERT_NE(move, nullptr);
    ASSERT_EQ(move->size(), 2u);
    EXPECT_EQ((*move)[0], (Translation{"courir", "french"}));
    EXPECT_EQ((*move)[1], (Translation{"correr", "spanish"}));

    const auto* manage = groups.find("manage");
    ASSERT_NE(manage, nullptr);
    ASSERT_EQ(manage->size(), 1u);
    EXPECT_EQ((*manage)[0].translation, "leiten");

    EXPECT_EQ(extractor.stats().translations_duplicate_language, 1u);
    EXPECT_EQ(extractor.stats().translations_incomplete, 1u);
}

TEST(RecordExtractorTest, LabelsTrimmedButNotLowerCased) {
    RecordExtractor extractor(window(1990, 2024));
    auto raw = ojson::parse(R"([
        {"sense": "  To Move ", "word": "a", "lang": "x"},
        {"sense": "To Move", "word": "b", "lang": "y"},
        {"sense": "to move", "word": "c", "lang": "z"},
        {"sense": "   ", "word": "d", "lang": "w"}
    ])");

    auto groups = extractor.extract_translations(raw);
    EXPECT_EQ(groups.labels(), (std::vector<std::string>{"To Move", "to move"}));
    EXPECT_EQ(groups.find("To Move")->size(), 2u);
}

TEST(RecordExtractorTest, NonAsciiTranslationsLowerCased) {
    RecordExtractor extractor(window(1990, 2024));
    auto raw = ojson::parse(R"([
        {"sense": "country", "word": "Ấn Độ", "lang": "Vietnamese"},
        {"sense": "country", "word": "ІНДІЯ", "lang": "Українська"},
        {"sense": "country", "word": "ӂ", "lang": "Moldavian"},
        {"sense": "country", "word": "Ɓ Ӏ ǅ", "lang": "Hausa"},
        {"sense": "country", "word": "ΟΔΟΣ", "lang": "ΕΛΛΗΝΙΚΆ"}
    ])");

    auto groups = extractor.extract_translations(raw);
    const auto* country = groups.find("country");
    ASSERT_NE(country, nullptr);
    ASSERT_EQ(country->size(), 5u);
    EXPECT_EQ((*country)[0], (Translation{"ấn độ", "vietnamese"}));
    EXPECT_EQ((*country)[1], (Translation{"індія", "українська"}));
    EXPECT_EQ((*country)[2], (Translation{"ӂ", "moldavian"}));
    EXPECT_EQ((*country)[3], (Translation{"ɓ ӏ ǆ", "hausa"}));
    EXPECT_EQ((*country)[4], (Translation{"οδος", "ελληνικά"}));
}

TEST(RecordExtractorTest, NonAsciiHeadwordsMerge) {
    RecordExtractor extractor(window(1990, 2024));
    LemmaAggregator aggregator;

    auto upper = run_entry();
    upper["word"] = "ĐI";
    auto lower = run_entry();
    lower["word"] = " đi";

    for (const auto& raw : {upper, lower}) {
        auto entry = extractor.extract(raw);
        ASSERT_TRUE(entry.has_value());
        aggregator.add(entry->lemma, std::move(entry->senses));
    }

    ASSERT_EQ(aggregator.size(), 1u);
    EXPECT_EQ(aggregator.lemmas()[0].lemma, "đi");
    EXPECT_EQ(aggregator.lemmas()[0].senses.size(), 4u);
    EXPECT_EQ(trim_lower("Ǆ"), "ǆ");
}

// =============================================================================
// Whole entries
// =============================================================================

TEST(RecordExtractorTest, LanguageFilter) {
    RecordExtractor extractor(window(1990, 2024));

    auto french = run_entry();
    french["lang_code"] = "fr";
    EXPECT_FALSE(extractor.extract(french).has_value());

    auto by_name = run_entry();
    by_name.erase("lang_code");
    by_name["lang"] = "English";
    EXPECT_TRUE(extractor.extract(by_name).has_value());

    EXPECT_EQ(extractor.stats().entries_wrong_language, 1u);
}

TEST(RecordExtractorTest, EntryFields) {
    RecordExtractor extractor(window(1990, 2024));
    auto entry = extractor.extract(run_entry());
    ASSERT_TRUE(entry.has_value());

    EXPECT_EQ(entry->lemma, "run");
    EXPECT_EQ(entry->pos.value_or(""), "verb");
    EXPECT_EQ(entry->etymology.value_or(""), "From Old English rinnan.");
}

TEST(RecordExtractorTest, EntriesWithoutHeadwordOrSensesSkipped) {
    RecordExtractor extractor(window(1990, 2024));

    auto nameless = run_entry();
    nameless.erase("word");
    EXPECT_FALSE(extractor.extract(nameless).has_value());

    auto bare = run_entry();
    bare["senses"] = ojson::array();
    EXPECT_FALSE(extractor.extract(bare).has_value());

    EXPECT_FALSE(extractor.extract(ojson::object()).has_value());

    EXPECT_EQ(extractor.stats().entries_without_headword, 1u);
    EXPECT_EQ(extractor.stats().entries_without_senses, 1u);
    EXPECT_EQ(extractor.stats().entries_extracted, 0u);
}

TEST(RecordExtractorTest, DeterministicSerialization) {
    RecordExtractor a(window(1990, 2024));
    RecordExtractor b(window(1990, 2024));

    auto first = entry_to_json(*a.extract(run_entry())).dump();
    auto second = entry_to_json(*b.extract(run_entry())).dump();
    EXPECT_EQ(first, second);
}
