/**
 * @file test_jsonl_io.cpp
 * @brief JSONL reading (plain and gzip) and the exporter factory
 */

#include <gtest/gtest.h>
#include <io/exporter.hpp>
#include <io/jsonl_reader.hpp>
#include <utils/errors.hpp>

#include "../support/temp_dir.hpp"

using namespace Seed;
using seed::test::TempDir;

namespace {

const char* kThreeLines =
    "{\"word\": \"a\"}\n"
    "\n"
    "{\"word\": \"b\"}\r\n"
    "{\"word\": \"c\"}";

std::vector<std::string> words(JsonlReader& reader) {
    std::vector<std::string> out;
    ojson record;
    while (reader.next(record)) out.push_back(string_field(record, "word", "<empty>"));
    return out;
}

} // namespace

// =============================================================================
// Reader
// =============================================================================

TEST(JsonlReaderTest, PlainFile) {
    TempDir dir;
    seed::test::write_text(dir.file("in.jsonl"), kThreeLines);

    JsonlReader reader(dir.file("in.jsonl"));
    EXPECT_FALSE(reader.compressed());
    EXPECT_EQ(words(reader), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(reader.records(), 3u);
    EXPECT_EQ(reader.line_number(), 4u);
}

TEST(JsonlReaderTest, GzipFile) {
    TempDir dir;
    // Detection is by content, not by name
    seed::test::write_gzip(dir.file("in.jsonl"), kThreeLines);

    JsonlReader reader(dir.file("in.jsonl"));
    EXPECT_TRUE(reader.compressed());
    EXPECT_EQ(words(reader), (std::vector<std::string>{"a", "b", "c"}));
}

TEST(JsonlReaderTest, LongLines) {
    TempDir dir;
    std::string big(200000, 'x');
    seed::test::write_gzip(dir.file("big.jsonl.gz"), "{\"word\": \"" + big + "\"}\n");

    JsonlReader reader(dir.file("big.jsonl.gz"));
    ojson record;
    ASSERT_TRUE(reader.next(record));
    EXPECT_EQ(record["word"].get<std::string>().size(), big.size());
    EXPECT_FALSE(reader.next(record));
}

TEST(JsonlReaderTest, SkipPolicyYieldsEmptyRecords) {
    TempDir dir;
    seed::test::write_text(dir.file("in.jsonl"), "{\"word\": \"a\"}\n{broken\n[1, 2]\n{\"word\": \"b\"}\n");

    JsonlReader reader(dir.file("in.jsonl"), MalformedLinePolicy::Skip);
    EXPECT_EQ(words(reader), (std::vector<std::string>{"a", "<empty>", "<empty>", "b"}));
    EXPECT_EQ(reader.malformed_lines(), 2u);
}

TEST(JsonlReaderTest, AbortPolicyThrowsWithLineNumber) {
    TempDir dir;
    seed::test::write_text(dir.file("in.jsonl"), "{\"word\": \"a\"}\n\n{broken\n");

    JsonlReader reader(dir.file("in.jsonl"), MalformedLinePolicy::Abort);
    ojson record;
    ASSERT_TRUE(reader.next(record));
    try {
        reader.next(record);
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.line(), 3u);
    }
}

TEST(JsonlReaderTest, MissingFileIsIoError) {
    TempDir dir;
    EXPECT_THROW({ JsonlReader reader(dir.file("absent.jsonl")); }, IoError);
}

// =============================================================================
// Exporter
// =============================================================================

TEST(ExporterTest, JsonlWritesOneCompactObjectPerLine) {
    TempDir dir;
    auto exporter = ExporterFactory::create(dir.file("nested/out/seed.jsonl"), 64);

    ojson first = ojson::object();
    first["lemma"] = "café";
    first["senses"] = ojson::array();
    exporter->write(first);
    exporter->write(ojson{{"lemma", "b"}});
    auto path = exporter->finish();

    EXPECT_EQ(path.string(), (dir.path() / "nested/out/seed.jsonl").string());
    EXPECT_EQ(exporter->records_written(), 2u);

    auto lines = seed::test::read_lines(path.string());
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "{\"lemma\":\"café\",\"senses\":[]}");
    EXPECT_EQ(lines[1], "{\"lemma\":\"b\"}");
}

TEST(ExporterTest, UnknownExtensionFallsBackToJsonl) {
    TempDir dir;
    auto exporter = ExporterFactory::create(dir.file("seed.csv"), 1024);
    exporter->write(ojson{{"lemma", "a"}});
    auto path = exporter->finish();

    EXPECT_EQ(path.extension().string(), ".jsonl");
    EXPECT_EQ(path.stem().string(), "seed");
    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_FALSE(std::filesystem::exists(dir.file("seed.csv")));
}

TEST(ExporterTest, ExtensionMatchIsCaseInsensitive) {
    TempDir dir;
    auto exporter = ExporterFactory::create(dir.file("seed.JSONL"), 1024);
    EXPECT_EQ(exporter->output_path().extension().string(), ".JSONL");
    EXPECT_TRUE(ExporterFactory::supports("jsonl"));
    EXPECT_FALSE(ExporterFactory::supports("parquet"));
}

TEST(ExporterTest, RegisteredExporterIsUsed) {
    TempDir dir;
    ExporterFactory::register_exporter("ndjson", [](const std::filesystem::path& p, size_t size) {
        return std::make_unique<JsonlExporter>(p, size);
    });
    auto exporter = ExporterFactory::create(dir.file("seed.ndjson"), 1024);
    EXPECT_EQ(exporter->output_path().extension().string(), ".ndjson");
}
