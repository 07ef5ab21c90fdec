#include <ml/static_embedder.hpp>
#include <ml/safetensor_loader.hpp>
#include <utils/errors.hpp>
#include <utils/logger.hpp>
#include <utils/unicode.hpp>

#include <algorithm>
#include <filesystem>

namespace seed::ml {

using Seed::EmbeddingError;
using Seed::Logger;

StaticEmbedder::StaticEmbedder(const std::string& model_dir, size_t batch_size)
    : batch_size_(batch_size == 0 ? 1 : batch_size) {
    SafetensorLoader loader(model_dir);
    embeddings_ = loader.get_embeddings();

    const auto& meta = loader.metadata();
    if (meta.vocab.size() > static_cast<size_t>(embeddings_.rows())) {
        throw EmbeddingError("vocabulary has " + std::to_string(meta.vocab.size()) +
                             " tokens but the embedding table has " +
                             std::to_string(embeddings_.rows()) + " rows");
    }

    token_ids_.reserve(meta.vocab.size());
    for (size_t i = 0; i < meta.vocab.size(); ++i) {
        if (meta.vocab[i].empty()) continue;
        token_ids_.emplace(meta.vocab[i], static_cast<Eigen::Index>(i));
    }
    subword_prefix_ = meta.subword_prefix;
    if (!meta.unk_token.empty()) {
        auto it = token_ids_.find(meta.unk_token);
        if (it != token_ids_.end()) unk_id_ = it->second;
    }

    model_id_ = std::filesystem::path(model_dir).lexically_normal().filename().string();
    if (model_id_.empty()) model_id_ = model_dir;

    Logger::info("Loaded " + model_id_ + ": " + std::to_string(embeddings_.rows()) + " x " +
                 std::to_string(embeddings_.cols()) + " embeddings");
}

bool StaticEmbedder::split_word(const std::string& word, std::vector<Eigen::Index>& out) const {
    std::u32string chars = Seed::utf8_to_utf32(word);
    std::vector<Eigen::Index> pieces;

    size_t start = 0;
    while (start < chars.size()) {
        size_t end = chars.size();
        Eigen::Index piece = -1;
        while (end > start) {
            std::string candidate = Seed::utf32_to_utf8(chars.substr(start, end - start));
            if (start > 0) candidate = subword_prefix_ + candidate;
            auto it = token_ids_.find(candidate);
            if (it != token_ids_.end()) { piece = it->second; break; }
            --end;
        }
        if (piece < 0) return false;
        pieces.push_back(piece);
        start = end;
    }

    out.insert(out.end(), pieces.begin(), pieces.end());
    return true;
}

std::vector<Eigen::Index> StaticEmbedder::tokenize(const std::string& text) const {
    std::vector<Eigen::Index> ids;
    for (const auto& w : Seed::words(text)) {
        std::string word = Seed::utf32_to_utf8(w);
        auto it = token_ids_.find(word);
        if (it != token_ids_.end()) {
            ids.push_back(it->second);
        } else if (!split_word(word, ids) && unk_id_ >= 0) {
            ids.push_back(unk_id_);
        }
    }
    return ids;
}

Eigen::VectorXf StaticEmbedder::encode_one(const std::string& text) const {
    Eigen::VectorXf vec = Eigen::VectorXf::Zero(embeddings_.cols());
    auto ids = tokenize(text);
    if (ids.empty()) return vec;

    for (Eigen::Index id : ids) vec += embeddings_.row(id).transpose();
    vec /= static_cast<float>(ids.size());

    float norm = vec.norm();
    if (norm > 1e-12f) vec /= norm;
    return vec;
}

EmbeddingProvider::Matrix StaticEmbedder::encode(const std::vector<std::string>& texts) {
    const Eigen::Index n = static_cast<Eigen::Index>(texts.size());
    Matrix out(n, embeddings_.cols());

    const Eigen::Index block = static_cast<Eigen::Index>(batch_size_);
    for (Eigen::Index begin = 0; begin < n; begin += block) {
        const Eigen::Index end = std::min(n, begin + block);

        #pragma omp parallel for schedule(dynamic, 16) if (end - begin >= 64)
        for (Eigen::Index i = begin; i < end; ++i) {
            out.row(i) = encode_one(texts[static_cast<size_t>(i)]).transpose();
        }
    }

    return out;
}

} // namespace seed::ml
