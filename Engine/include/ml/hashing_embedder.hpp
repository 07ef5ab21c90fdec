#pragma once

#include <ml/embedding_provider.hpp>

#include <cstdint>
#include <string>
#include <unordered_set>

namespace seed::ml {

/**
 * @brief Model-free encoder: signed feature hashing of word and character n-grams.
 *
 * Each feature is hashed with BLAKE3; the low bits pick a bucket, one hash
 * bit picks the sign. Features:
 *   - word unigrams (stop words skipped)            weight 1.0
 *   - word bigrams                                  weight 0.5
 *   - character trigrams of "<word>"                weight 0.25
 * Rows are L2-normalized; a text with no features encodes to the zero vector.
 */
class HashingEmbedder : public EmbeddingProvider {
public:
    static constexpr Eigen::Index DEFAULT_DIMENSION = 512;

    explicit HashingEmbedder(Eigen::Index dimension = DEFAULT_DIMENSION);

    Matrix encode(const std::vector<std::string>& texts) override;

    Eigen::Index dimension() const override { return dimension_; }
    std::string model_id() const override { return "hashing:" + std::to_string(dimension_); }

    /**
     * @brief Encode a single text (one row of encode()).
     */
    Eigen::VectorXf encode_one(const std::string& text) const;

private:
    void add_feature(Eigen::VectorXf& vec, const std::string& feature, float weight) const;

    Eigen::Index dimension_;
    std::unordered_set<std::u32string> stop_words_;
};

} // namespace seed::ml
