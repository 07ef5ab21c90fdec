/**
 * @file test_end_to_end_pipeline.cpp
 * @brief The three run modes over temporary files
 */

#include <gtest/gtest.h>
#include <ml/hashing_embedder.hpp>
#include <pipeline/seed_pipeline.hpp>
#include <utils/errors.hpp>
#include <utils/logger.hpp>

#include "../support/scripted_embedder.hpp"
#include "../support/temp_dir.hpp"

using namespace Seed;
using seed::test::TempDir;

namespace {

const char* kDump =
    R"({"word": "Run", "lang_code": "en", "pos": "verb", "etymology_text": "From Old English.",)"
    R"( "senses": [)"
    R"(   {"glosses": ["To move swiftly on foot."], "examples": [{"text": "She runs.", "type": "example"}]},)"
    R"(   {"glosses": ["To manage."], "examples": [{"text": "He runs the shop.", "ref": "2015, Daily News"}]},)"
    R"(   {"glosses": ["To flow."], "examples": [{"text": "Old quote.", "ref": "1850, Almanac"}]}],)"
    R"( "translations": [)"
    R"(   {"sense": "move quickly", "word": "courir", "lang": "French"},)"
    R"(   {"sense": "be in charge", "word": "leiten", "lang": "German"},)"
    R"(   {"sense": "move quickly", "word": "correr", "lang": "Spanish"}]})" "\n"
    R"({"word": "courir", "lang_code": "fr", "senses": [{"glosses": ["to run"], "examples": [{"text": "x", "type": "example"}]}]})" "\n"
    "{this line is broken\n"
    "\n"
    R"({"word": "run ", "lang_code": "en", "pos": "noun",)"
    R"( "senses": [{"glosses": ["An act of running."], "examples": [{"text": "A morning run.", "type": "example"}]}],)"
    R"( "translations": [{"sense": "act of running", "word": "course", "lang": "French"}]})" "\n"
    R"({"word": "walk", "lang_code": "en", "senses": [{"glosses": ["To stroll."]}]})" "\n";

SeedConfig test_config() {
    SeedConfig config;
    config.extraction.minimum_year = 1990;
    config.extraction.maximum_year = 2024;
    config.io.progress_interval = 0;
    return config;
}

class PipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::set_min_level(Logger::Level::Silent);
        seed::test::write_gzip(dir.file("dump.jsonl.gz"), kDump);
    }
    void TearDown() override {
        Logger::set_min_level(Logger::Level::Progress);
    }

    TempDir dir;
};

} // namespace

TEST_F(PipelineTest, BuildSeedMatchesAndAggregates) {
    seed::test::ScriptedEmbedder embedder(3);
    embedder.set("To move swiftly on foot.", {1, 0, 0});
    embedder.set("move quickly", {0.95f, 0.1f, 0});
    embedder.set("To manage.", {0, 1, 0});
    embedder.set("be in charge", {0, 1, 0.05f});
    embedder.set("An act of running.", {0, 0, 1});
    embedder.set("act of running", {0, 0, 1});

    auto report = build_seed(dir.file("dump.jsonl.gz"), dir.file("out/seed.jsonl"), test_config(), embedder);

    EXPECT_EQ(report.records_read, 5u);
    EXPECT_EQ(report.malformed_lines, 1u);
    EXPECT_EQ(report.lemmas, 1u);
    EXPECT_EQ(report.senses, 3u);
    EXPECT_EQ(report.matching.assigned, 3u);

    auto lines = seed::test::read_lines(report.output.string());
    ASSERT_EQ(lines.size(), 1u);
    auto lemma = ojson::parse(lines[0]);

    EXPECT_EQ(lemma["lemma"], "run");
    ASSERT_EQ(lemma["senses"].size(), 3u);

    const auto& move = lemma["senses"][0];
    EXPECT_EQ(move["sense_order"], 1);
    ASSERT_EQ(move["translations"].size(), 2u);
    EXPECT_EQ(move["translations"][0]["translation"], "courir");
    EXPECT_EQ(move["translations"][1]["language"], "spanish");

    const auto& manage = lemma["senses"][1];
    EXPECT_EQ(manage["sense_order"], 2);
    EXPECT_EQ(manage["sentences"][0]["reference"], "2015, Daily News");
    EXPECT_EQ(manage["translations"][0]["translation"], "leiten");

    const auto& noun = lemma["senses"][2];
    EXPECT_EQ(noun["sense_order"], 1);
    EXPECT_EQ(noun["translations"][0]["translation"], "course");
}

TEST_F(PipelineTest, UnmatchedSensesKeepEmptyLists) {
    seed::test::ScriptedEmbedder embedder(3);  // every vector is zero

    auto report = build_seed(dir.file("dump.jsonl.gz"), dir.file("seed.jsonl"), test_config(), embedder);
    EXPECT_EQ(report.matching.assigned, 0u);

    auto lemma = ojson::parse(seed::test::read_lines(report.output.string()).at(0));
    for (const auto& sense : lemma["senses"]) {
        ASSERT_TRUE(sense.contains("translations"));
        EXPECT_TRUE(sense["translations"].is_array());
        EXPECT_TRUE(sense["translations"].empty());
    }
}

TEST_F(PipelineTest, StrictModeAbortsOnBrokenLine) {
    auto config = test_config();
    config.io.malformed_lines = MalformedLinePolicy::Abort;
    EXPECT_THROW(extract_entries(dir.file("dump.jsonl.gz"), dir.file("interim.jsonl"), config), ParseError);
}

TEST_F(PipelineTest, ExtractionIsDeterministic) {
    auto config = test_config();
    auto first = extract_entries(dir.file("dump.jsonl.gz"), dir.file("a.jsonl"), config);
    auto second = extract_entries(dir.file("dump.jsonl.gz"), dir.file("b.jsonl"), config);

    EXPECT_EQ(first.records_written, 2u);
    EXPECT_EQ(seed::test::read_text(first.output.string()), seed::test::read_text(second.output.string()));
}

TEST_F(PipelineTest, ExtractThenAssociate) {
    auto config = test_config();
    auto extracted = extract_entries(dir.file("dump.jsonl.gz"), dir.file("interim.txt"), config);
    EXPECT_EQ(extracted.output.extension().string(), ".jsonl");

    auto interim = seed::test::read_lines(extracted.output.string());
    ASSERT_EQ(interim.size(), 2u);
    auto first = ojson::parse(interim[0]);
    EXPECT_EQ(first["lemma"], "Run");
    EXPECT_EQ(first["senses"].size(), 2u);
    EXPECT_FALSE(first["senses"][0].contains("translations"));
    EXPECT_EQ(first["translations"].begin().key(), "move quickly");

    seed::test::write_text(dir.file("mappings.jsonl"),
        R"({"lemma": "Run", "etymology": "From Old English.", "pos": "verb", "mapping": {"1": "A", "2": "b"}})" "\n"
        R"({"lemma": "run", "etymology": null, "pos": "noun", "mapping": {"1": "A"}})" "\n"
        R"({"lemma": "run", "etymology": null, "pos": "noun", "mapping": {"1": "A"}})" "\n");

    auto report = associate_translations(extracted.output.string(), dir.file("mappings.jsonl"),
                                         dir.file("associated.jsonl"), config);
    EXPECT_EQ(report.records_written, 2u);

    auto lines = seed::test::read_lines(report.output.string());
    ASSERT_EQ(lines.size(), 2u);

    auto verb = ojson::parse(lines[0]);
    EXPECT_EQ(verb["pos"], "verb");
    EXPECT_FALSE(verb.contains("translations"));
    EXPECT_EQ(verb["senses"][0]["translations"].size(), 2u);
    EXPECT_EQ(verb["senses"][1]["translations"][0]["translation"], "leiten");

    // Duplicate key: degraded to an empty mapping
    auto noun = ojson::parse(lines[1]);
    EXPECT_TRUE(noun["etymology"].is_null());
    EXPECT_TRUE(noun["senses"][0]["translations"].empty());
}

TEST_F(PipelineTest, HashingProviderRunsEndToEnd) {
    seed::ml::HashingEmbedder embedder(256);
    auto config = test_config();
    config.matching.threshold = 0.0;
    config.matching.gap = 0.0;

    auto report = build_seed(dir.file("dump.jsonl.gz"), dir.file("seed.jsonl"), config, embedder);
    EXPECT_EQ(report.lemmas, 1u);
    EXPECT_GE(report.matching.labels_seen, 3u);
}
