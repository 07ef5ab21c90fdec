#include <matching/similarity_matcher.hpp>
#include <utils/errors.hpp>

#include <algorithm>
#include <limits>

namespace Seed {

namespace {

Eigen::MatrixXf normalized_rows(const Eigen::MatrixXf& m) {
    Eigen::MatrixXf out = m;
    for (Eigen::Index i = 0; i < out.rows(); ++i) {
        float norm = out.row(i).norm();
        if (norm > 1e-12f) {
            out.row(i) /= norm;
        } else {
            out.row(i).setZero();
        }
    }
    return out;
}

} // namespace

SimilarityMatcher::SimilarityMatcher(seed::ml::EmbeddingProvider& provider, const MatchingConfig& config)
    : provider_(provider), config_(config) {}

Eigen::MatrixXf SimilarityMatcher::score(const Eigen::MatrixXf& label_vecs, const Eigen::MatrixXf& sense_vecs) {
    if (label_vecs.cols() != sense_vecs.cols()) {
        throw EmbeddingError("label vectors have " + std::to_string(label_vecs.cols()) +
                             " columns, sense vectors " + std::to_string(sense_vecs.cols()));
    }
    // One GEMM: (labels × d) * (d × senses)
    return normalized_rows(label_vecs) * normalized_rows(sense_vecs).transpose();
}

MatchSelection SimilarityMatcher::select(const Eigen::MatrixXf& scores, const MatchingConfig& config) {
    MatchSelection result;
    result.stats.labels_seen = static_cast<size_t>(scores.rows());
    if (scores.rows() == 0 || scores.cols() == 0) return result;

    for (Eigen::Index label = 0; label < scores.rows(); ++label) {
        Eigen::Index best_sense = 0;
        float best = scores(label, 0);
        for (Eigen::Index s = 1; s < scores.cols(); ++s) {
            if (scores(label, s) > best) {
                best = scores(label, s);
                best_sense = s;
            }
        }

        if (static_cast<double>(best) < config.threshold) {
            ++result.stats.rejected_threshold;
            continue;
        }

        if (scores.cols() > 1) {
            float second = -std::numeric_limits<float>::infinity();
            for (Eigen::Index s = 0; s < scores.cols(); ++s) {
                if (s != best_sense) second = std::max(second, scores(label, s));
            }
            if (static_cast<double>(best) - static_cast<double>(second) < config.gap) {
                ++result.stats.rejected_gap;
                continue;
            }
        }

        result.candidates.push_back({best, static_cast<size_t>(best_sense), static_cast<size_t>(label)});
    }

    std::stable_sort(result.candidates.begin(), result.candidates.end(),
                     [](const MatchCandidate& a, const MatchCandidate& b) { return a.score > b.score; });

    std::vector<bool> claimed(static_cast<size_t>(scores.cols()), false);
    for (const auto& c : result.candidates) {
        if (claimed[c.sense_index]) {
            ++result.stats.lost_conflict;
            continue;
        }
        claimed[c.sense_index] = true;
        result.assignments.push_back(c);
    }
    result.stats.assigned = result.assignments.size();

    return result;
}

Eigen::MatrixXf SimilarityMatcher::encode_checked(const std::vector<std::string>& texts, const char* what) {
    Eigen::MatrixXf vecs = provider_.encode(texts);
    if (vecs.rows() != static_cast<Eigen::Index>(texts.size())) {
        throw EmbeddingError(provider_.model_id() + " returned " + std::to_string(vecs.rows()) + " rows for " +
                             std::to_string(texts.size()) + " " + what);
    }
    if (vecs.cols() != provider_.dimension()) {
        throw EmbeddingError(provider_.model_id() + " returned dimension " + std::to_string(vecs.cols()) +
                             ", expected " + std::to_string(provider_.dimension()));
    }
    return vecs;
}

MatchStats SimilarityMatcher::match(std::vector<Sense>& senses, const TranslationGroups& groups) {
    MatchStats stats;
    if (senses.empty() || groups.empty()) return stats;

    std::vector<std::string> definitions;
    definitions.reserve(senses.size());
    for (const auto& sense : senses) definitions.push_back(sense.definition);

    std::vector<std::string> labels = groups.labels();

    Eigen::MatrixXf sense_vecs = encode_checked(definitions, "definitions");
    Eigen::MatrixXf label_vecs = encode_checked(labels, "labels");

    const Eigen::MatrixXf scores = score(label_vecs, sense_vecs);
    MatchSelection selection = select(scores, config_);

    for (const auto& a : selection.assignments) {
        const auto& translations = groups[a.label_index].second;
        auto& target = senses[a.sense_index].translations;
        target.insert(target.end(), translations.begin(), translations.end());
    }

    stats = selection.stats;
    stats.headwords = 1;
    totals_ += stats;
    return stats;
}

} // namespace Seed
