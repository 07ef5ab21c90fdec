#pragma once

#include <ml/embedding_provider.hpp>

#include <string>
#include <unordered_map>
#include <vector>

namespace seed::ml {

/**
 * @brief Sentence encoder over a static token embedding table.
 *
 * Text is split into lower-cased words. A word found whole in the vocabulary
 * maps to its row; otherwise it is split greedily into the longest vocabulary
 * pieces, continuation pieces carrying the tokenizer's subword prefix. A word
 * that cannot be split maps to the unknown token when the vocabulary has one
 * and is dropped otherwise. The sentence vector is the L2-normalized mean of
 * its token rows.
 */
class StaticEmbedder : public EmbeddingProvider {
public:
    /**
     * @throws Seed::EmbeddingError if the model cannot be loaded or the
     *         vocabulary does not match the embedding table
     */
    explicit StaticEmbedder(const std::string& model_dir, size_t batch_size = 256);

    Matrix encode(const std::vector<std::string>& texts) override;

    Eigen::Index dimension() const override { return embeddings_.cols(); }
    std::string model_id() const override { return model_id_; }

    size_t vocab_size() const { return static_cast<size_t>(embeddings_.rows()); }

    /**
     * @brief Token rows for one text, in text order.
     */
    std::vector<Eigen::Index> tokenize(const std::string& text) const;

private:
    bool split_word(const std::string& word, std::vector<Eigen::Index>& out) const;
    Eigen::VectorXf encode_one(const std::string& text) const;

    std::string model_id_;
    size_t batch_size_;
    Eigen::MatrixXf embeddings_;
    std::unordered_map<std::string, Eigen::Index> token_ids_;
    std::string subword_prefix_;
    Eigen::Index unk_id_ = -1;
};

} // namespace seed::ml
