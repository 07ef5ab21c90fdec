/**
 * @file similarity_matcher.hpp
 * @brief Assigns translation groups to senses by embedding similarity
 *
 * Per headword:
 *   1. encode every sense definition and every group label (two batches)
 *   2. cosine matrix, labels × senses, computed once and never modified
 *   3. per label: best sense, best score, second-best score
 *   4. reject if best < threshold or best - second < gap
 *   5. stable sort survivors by score, descending
 *   6. greedy walk: a sense takes at most one group
 */

#pragma once

#include <export.hpp>
#include <config/seed_config.hpp>
#include <lexicon/models.hpp>
#include <ml/embedding_provider.hpp>

#include <Eigen/Core>
#include <cstddef>
#include <vector>

namespace Seed {

struct MatchCandidate {
    float score = 0.0f;
    size_t sense_index = 0;
    size_t label_index = 0;
};

struct MatchStats {
    size_t headwords = 0;
    size_t labels_seen = 0;
    size_t rejected_threshold = 0;
    size_t rejected_gap = 0;
    size_t lost_conflict = 0;
    size_t assigned = 0;

    MatchStats& operator+=(const MatchStats& o) {
        headwords += o.headwords;
        labels_seen += o.labels_seen;
        rejected_threshold += o.rejected_threshold;
        rejected_gap += o.rejected_gap;
        lost_conflict += o.lost_conflict;
        assigned += o.assigned;
        return *this;
    }
};

/**
 * @brief Outcome of select(): gated candidates in walk order and the winners.
 */
struct MatchSelection {
    std::vector<MatchCandidate> candidates;
    std::vector<MatchCandidate> assignments;
    MatchStats stats;
};

class SEED_API SimilarityMatcher {
public:
    SimilarityMatcher(seed::ml::EmbeddingProvider& provider, const MatchingConfig& config);

    /**
     * @brief Cosine similarity, one row per label and one column per sense.
     *
     * Rows are normalized here, so providers need not return unit vectors.
     * A zero row scores 0 against everything.
     */
    static Eigen::MatrixXf score(const Eigen::MatrixXf& label_vecs, const Eigen::MatrixXf& sense_vecs);

    /**
     * @brief Threshold and gap gating followed by the greedy walk.
     *
     * Pure function of the score matrix; ties in score keep label order.
     */
    static MatchSelection select(const Eigen::MatrixXf& scores, const MatchingConfig& config);

    /**
     * @brief Append each assigned group's translations to its sense.
     *
     * No-op when either side is empty.
     * @throws EmbeddingError if the provider returns the wrong shape
     */
    MatchStats match(std::vector<Sense>& senses, const TranslationGroups& groups);

    const MatchStats& totals() const { return totals_; }
    const MatchingConfig& config() const { return config_; }

private:
    Eigen::MatrixXf encode_checked(const std::vector<std::string>& texts, const char* what);

    seed::ml::EmbeddingProvider& provider_;
    MatchingConfig config_;
    MatchStats totals_;
};

} // namespace Seed
