#include <lexicon/models.hpp>

#include <algorithm>

namespace Seed {

bool TranslationGroups::add(const std::string& label, Translation translation) {
    auto it = index_.find(label);
    if (it == index_.end()) {
        index_.emplace(label, groups_.size());
        groups_.emplace_back(label, std::vector<Translation>{std::move(translation)});
        return true;
    }

    auto& group = groups_[it->second].second;
    bool seen = std::any_of(group.begin(), group.end(), [&](const Translation& t) {
        return t.language == translation.language;
    });
    if (seen) return false;

    group.push_back(std::move(translation));
    return true;
}

void TranslationGroups::set_group(const std::string& label, std::vector<Translation> translations) {
    auto it = index_.find(label);
    if (it != index_.end()) {
        groups_[it->second].second = std::move(translations);
        return;
    }
    index_.emplace(label, groups_.size());
    groups_.emplace_back(label, std::move(translations));
}

std::vector<std::string> TranslationGroups::labels() const {
    std::vector<std::string> out;
    out.reserve(groups_.size());
    for (const auto& [label, _] : groups_) out.push_back(label);
    return out;
}

const std::vector<Translation>* TranslationGroups::find(const std::string& label) const {
    auto it = index_.find(label);
    return it != index_.end() ? &groups_[it->second].second : nullptr;
}

} // namespace Seed
