#include <lexicon/lemma_aggregator.hpp>
#include <utils/unicode.hpp>

#include <iterator>

namespace Seed {

bool LemmaAggregator::add(const std::string& headword, std::vector<Sense> senses) {
    std::string key = trim_lower(headword);
    if (key.empty()) return false;

    auto [it, inserted] = index_.try_emplace(key, lemmas_.size());
    if (inserted) {
        lemmas_.push_back(Lemma{key, {}});
    }

    auto& target = lemmas_[it->second].senses;
    sense_count_ += senses.size();
    target.insert(target.end(), std::make_move_iterator(senses.begin()), std::make_move_iterator(senses.end()));
    return true;
}

std::vector<Lemma> LemmaAggregator::release() {
    std::vector<Lemma> out = std::move(lemmas_);
    lemmas_.clear();
    index_.clear();
    sense_count_ = 0;
    return out;
}

const Lemma* LemmaAggregator::find(const std::string& headword) const {
    auto it = index_.find(trim_lower(headword));
    return it != index_.end() ? &lemmas_[it->second] : nullptr;
}

} // namespace Seed
