#include <matching/mapping_resolver.hpp>
#include <io/jsonl_reader.hpp>
#include <utils/logger.hpp>

#include <cctype>

namespace Seed {

MappingKey MappingKey::from_record(const ojson& record) {
    return {optional_field(record, "lemma"), optional_field(record, "etymology"), optional_field(record, "pos")};
}

MappingKey MappingKey::from_entry(const ExtractedEntry& entry) {
    return {entry.lemma, entry.etymology, entry.pos};
}

void MappingTable::add(const ojson& record) {
    if (!record.is_object() || record.empty()) return;

    MappingKey key = MappingKey::from_record(record);
    auto existing = mappings_.find(key);
    if (existing != mappings_.end()) {
        existing->second.clear();
        ++collisions_;
        return;
    }

    auto raw = record.find("mapping");
    if (raw == record.end() || !raw->is_object()) return;

    SenseLetters letters;
    for (const auto& [index, letter] : raw->items()) {
        if (letter.is_string()) letters.emplace(index, letter.get<std::string>());
    }
    mappings_.emplace(std::move(key), std::move(letters));
}

size_t MappingTable::load(const std::string& path, size_t buffer_size) {
    JsonlReader reader(path, MalformedLinePolicy::Skip, buffer_size);
    ojson record;
    size_t count = 0;
    while (reader.next(record)) {
        add(record);
        ++count;
    }
    Logger::info("Loaded " + std::to_string(mappings_.size()) + " mappings from " + path +
                 " (" + std::to_string(collisions_) + " duplicate keys, " +
                 std::to_string(reader.malformed_lines()) + " malformed lines)");
    return count;
}

const SenseLetters* MappingTable::find(const MappingKey& key) const {
    auto it = mappings_.find(key);
    return it != mappings_.end() ? &it->second : nullptr;
}

std::optional<size_t> MappingResolver::letter_index(const std::string& letter) {
    if (letter.size() != 1) return std::nullopt;
    unsigned char c = static_cast<unsigned char>(letter[0]);
    if (c >= 0x80 || !std::isalpha(c)) return std::nullopt;
    return static_cast<size_t>(std::toupper(c) - 'A');
}

ExtractedEntry MappingResolver::resolve(const ExtractedEntry& entry) {
    ExtractedEntry out = entry;
    ++stats_.entries;

    const SenseLetters* letters = table_.find(MappingKey::from_entry(entry));
    if (letters && !letters->empty()) ++stats_.entries_mapped;

    for (size_t i = 0; i < out.senses.size(); ++i) {
        Sense& sense = out.senses[i];
        sense.translations.clear();
        ++stats_.senses;
        if (!letters) continue;

        auto it = letters->find(std::to_string(i + 1));
        if (it == letters->end()) continue;

        auto index = letter_index(it->second);
        if (!index || *index >= out.translations.size()) {
            ++stats_.bad_letters;
            continue;
        }

        for (const auto& t : out.translations[*index].second) {
            if (t.translation.empty() || t.language.empty()) continue;
            sense.translations.push_back(t);
        }
        ++stats_.senses_resolved;
    }

    return out;
}

} // namespace Seed
