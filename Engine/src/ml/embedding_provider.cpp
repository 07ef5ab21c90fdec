#include <ml/embedding_provider.hpp>
#include <ml/hashing_embedder.hpp>
#include <ml/static_embedder.hpp>
#include <utils/errors.hpp>
#include <utils/unicode.hpp>

#include <stdexcept>

namespace seed::ml {

std::unique_ptr<EmbeddingProvider> make_embedding_provider(const Seed::EmbeddingConfig& config) {
    if (Seed::trim_lower(config.device) != "cpu") {
        throw Seed::EmbeddingError("unsupported device '" + config.device + "' (only cpu is available)");
    }

    const std::string& model = config.model;
    if (model == "hashing") {
        return std::make_unique<HashingEmbedder>();
    }
    if (model.rfind("hashing:", 0) == 0) {
        std::string dim = model.substr(8);
        long long value = 0;
        try {
            size_t pos = 0;
            value = std::stoll(dim, &pos);
            if (pos != dim.size()) throw std::invalid_argument(dim);
        } catch (const std::logic_error&) {
            throw Seed::EmbeddingError("bad hashing dimension '" + dim + "'");
        }
        return std::make_unique<HashingEmbedder>(static_cast<Eigen::Index>(value));
    }

    return std::make_unique<StaticEmbedder>(model, config.batch_size);
}

} // namespace seed::ml
