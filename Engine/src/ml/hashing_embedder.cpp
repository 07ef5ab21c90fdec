#include <ml/hashing_embedder.hpp>
#include <hashing/blake3_pipeline.hpp>
#include <utils/errors.hpp>
#include <utils/unicode.hpp>

namespace seed::ml {

using Seed::BLAKE3Pipeline;

namespace {

const char32_t* const kStopWords[] = {
    U"a", U"an", U"the", U"of", U"to", U"or", U"and", U"in", U"on", U"at",
    U"by", U"for", U"with", U"from", U"as", U"into", U"that", U"which",
    U"who", U"is", U"be", U"being", U"its", U"it", U"something", U"someone",
    U"one", U"any", U"some", U"etc"
};

} // namespace

HashingEmbedder::HashingEmbedder(Eigen::Index dimension) : dimension_(dimension) {
    if (dimension_ <= 0) {
        throw Seed::EmbeddingError("hashing dimension must be positive, got " + std::to_string(dimension_));
    }
    for (const char32_t* w : kStopWords) stop_words_.insert(w);
}

void HashingEmbedder::add_feature(Eigen::VectorXf& vec, const std::string& feature, float weight) const {
    auto h = BLAKE3Pipeline::hash_seeded(0x5EED, feature);
    uint64_t bucket = BLAKE3Pipeline::to_u64(h) % static_cast<uint64_t>(dimension_);
    float sign = (h[8] & 1) ? 1.0f : -1.0f;
    vec[static_cast<Eigen::Index>(bucket)] += sign * weight;
}

Eigen::VectorXf HashingEmbedder::encode_one(const std::string& text) const {
    Eigen::VectorXf vec = Eigen::VectorXf::Zero(dimension_);

    std::vector<std::u32string> content;
    for (auto& word : Seed::words(text)) {
        if (stop_words_.count(word)) continue;
        content.push_back(std::move(word));
    }

    for (size_t i = 0; i < content.size(); ++i) {
        std::string word = Seed::utf32_to_utf8(content[i]);
        add_feature(vec, "w:" + word, 1.0f);

        if (i + 1 < content.size()) {
            add_feature(vec, "b:" + word + " " + Seed::utf32_to_utf8(content[i + 1]), 0.5f);
        }

        std::u32string padded = U"<" + content[i] + U">";
        for (size_t j = 0; j + 3 <= padded.size(); ++j) {
            add_feature(vec, "c:" + Seed::utf32_to_utf8(padded.substr(j, 3)), 0.25f);
        }
    }

    float norm = vec.norm();
    if (norm > 1e-12f) vec /= norm;
    return vec;
}

EmbeddingProvider::Matrix HashingEmbedder::encode(const std::vector<std::string>& texts) {
    const Eigen::Index n = static_cast<Eigen::Index>(texts.size());
    Matrix out(n, dimension_);

    #pragma omp parallel for schedule(dynamic, 16) if (n >= 64)
    for (Eigen::Index i = 0; i < n; ++i) {
        out.row(i) = encode_one(texts[static_cast<size_t>(i)]).transpose();
    }

    return out;
}

} // namespace seed::ml
