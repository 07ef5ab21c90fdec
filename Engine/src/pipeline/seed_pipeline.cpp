#include <pipeline/seed_pipeline.hpp>
#include <io/exporter.hpp>
#include <io/jsonl_reader.hpp>
#include <lexicon/lemma_aggregator.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>

namespace Seed {

namespace {

void log_extraction(const ExtractionStats& s) {
    Logger::info("  entries: " + std::to_string(s.entries_seen) + " seen, " +
                 std::to_string(s.entries_extracted) + " extracted, " +
                 std::to_string(s.entries_wrong_language) + " other language, " +
                 std::to_string(s.entries_without_senses) + " without senses");
    Logger::info("  senses: " + std::to_string(s.senses_kept) + " kept, " +
                 std::to_string(s.senses_dropped) + " dropped");
    Logger::info("  sentences: " + std::to_string(s.examples_kept) + " examples, " +
                 std::to_string(s.quotations_kept) + " quotations (" +
                 std::to_string(s.quotations_undated) + " undated, " +
                 std::to_string(s.quotations_out_of_range) + " out of range)");
    Logger::info("  translations: " + std::to_string(s.translations_kept) + " kept, " +
                 std::to_string(s.translations_incomplete) + " incomplete, " +
                 std::to_string(s.translations_duplicate_language) + " duplicate language");
}

void log_matching(const MatchStats& s) {
    Logger::info("  labels: " + std::to_string(s.labels_seen) + " seen, " +
                 std::to_string(s.assigned) + " assigned, " +
                 std::to_string(s.rejected_threshold) + " below threshold, " +
                 std::to_string(s.rejected_gap) + " ambiguous, " +
                 std::to_string(s.lost_conflict) + " lost to a better label");
}

} // namespace

void for_each_entry(const std::string& input,
                    const SeedConfig& config,
                    const EntryCallback& on_entry,
                    PipelineReport& report) {
    JsonlReader reader(input, config.io.malformed_lines, config.io.buffer_size);
    if (reader.compressed()) Logger::info("Reading gzip input " + input);

    RecordExtractor extractor(config.extraction);
    ProgressMeter meter("Extracting", "lines", config.io.progress_interval);

    ojson record;
    while (reader.next(record)) {
        meter.tick();
        if (record.empty()) continue;
        if (auto entry = extractor.extract(record)) on_entry(*entry);
    }
    meter.finish();

    report.records_read = reader.records();
    report.malformed_lines = reader.malformed_lines();
    report.extraction = extractor.stats();

    if (reader.malformed_lines() > 0) {
        Logger::warn(std::to_string(reader.malformed_lines()) + " malformed lines skipped in " + input);
    }
}

PipelineReport build_seed(const std::string& input,
                          const std::string& output,
                          const SeedConfig& config,
                          seed::ml::EmbeddingProvider& provider) {
    Timer timer;
    PipelineReport report;

    Logger::step("Building seed from " + input + " with " + provider.model_id() + " on " + provider.device());

    SimilarityMatcher matcher(provider, config.matching);
    LemmaAggregator aggregator;

    for_each_entry(input, config, [&](ExtractedEntry& entry) {
        matcher.match(entry.senses, entry.translations);
        aggregator.add(entry.lemma, std::move(entry.senses));
    }, report);

    report.matching = matcher.totals();
    report.lemmas = aggregator.size();
    report.senses = aggregator.sense_count();

    Logger::step("Writing " + std::to_string(aggregator.size()) + " lemmas");
    auto exporter = ExporterFactory::create(output, config.io.buffer_size);
    ProgressMeter meter("Exporting", "lemmas", config.io.progress_interval);
    for (const auto& lemma : aggregator.lemmas()) {
        exporter->write(ojson(lemma));
        meter.tick();
    }
    report.output = exporter->finish();
    report.records_written = exporter->records_written();
    meter.finish();

    log_extraction(report.extraction);
    log_matching(report.matching);
    report.seconds = timer.elapsed_sec();
    Logger::success("Wrote " + report.output.string());
    return report;
}

PipelineReport extract_entries(const std::string& input,
                               const std::string& output,
                               const SeedConfig& config) {
    Timer timer;
    PipelineReport report;

    Logger::step("Extracting " + input);
    auto exporter = ExporterFactory::create(output, config.io.buffer_size);

    for_each_entry(input, config, [&](ExtractedEntry& entry) {
        report.senses += entry.senses.size();
        exporter->write(entry_to_json(entry));
    }, report);

    report.output = exporter->finish();
    report.records_written = exporter->records_written();

    log_extraction(report.extraction);
    report.seconds = timer.elapsed_sec();
    Logger::success("Wrote " + std::to_string(report.records_written) + " entries to " + report.output.string());
    return report;
}

PipelineReport associate_translations(const std::string& interim,
                                      const std::string& mappings,
                                      const std::string& output,
                                      const SeedConfig& config) {
    Timer timer;
    PipelineReport report;

    Logger::step("Loading mappings from " + mappings);
    MappingTable table;
    table.load(mappings, config.io.buffer_size);

    Logger::step("Associating " + interim);
    MappingResolver resolver(table);
    JsonlReader reader(interim, config.io.malformed_lines, config.io.buffer_size);
    auto exporter = ExporterFactory::create(output, config.io.buffer_size);
    ProgressMeter meter("Associating", "lines", config.io.progress_interval);

    ojson record;
    while (reader.next(record)) {
        meter.tick();
        if (record.empty()) continue;
        ExtractedEntry resolved = resolver.resolve(entry_from_json(record));
        report.senses += resolved.senses.size();
        exporter->write(resolved_to_json(resolved, record));
    }
    meter.finish();

    report.records_read = reader.records();
    report.malformed_lines = reader.malformed_lines();
    report.resolving = resolver.stats();
    report.output = exporter->finish();
    report.records_written = exporter->records_written();

    const auto& s = report.resolving;
    Logger::info("  entries: " + std::to_string(s.entries) + " read, " + std::to_string(s.entries_mapped) + " mapped");
    Logger::info("  senses: " + std::to_string(s.senses) + " read, " + std::to_string(s.senses_resolved) +
                 " resolved, " + std::to_string(s.bad_letters) + " unusable letters");
    report.seconds = timer.elapsed_sec();
    Logger::success("Wrote " + report.output.string());
    return report;
}

} // namespace Seed
