#pragma once

#include <export.hpp>
#include <config/seed_config.hpp>

#include <Eigen/Core>
#include <memory>
#include <string>
#include <vector>

namespace seed::ml {

/**
 * @brief Maps a batch of strings to fixed-length vectors.
 *
 * Contract:
 *   - encode() returns one row per input string, in input order
 *   - every call on one instance returns the same number of columns
 *   - identical strings give identical rows for a given model and device
 *
 * Failures (model missing, bad device) throw Seed::EmbeddingError and are
 * fatal for the run.
 */
class EmbeddingProvider {
public:
    using Matrix = Eigen::MatrixXf;

    virtual ~EmbeddingProvider() = default;

    virtual Matrix encode(const std::vector<std::string>& texts) = 0;

    virtual Eigen::Index dimension() const = 0;

    /**
     * @brief Model identity, e.g. "hashing:512" or the model directory name.
     */
    virtual std::string model_id() const = 0;

    virtual std::string device() const { return "cpu"; }
};

/**
 * @brief Build the provider named by `config.model`.
 *
 *   "hashing" / "hashing:<dim>"  → HashingEmbedder
 *   anything else                → StaticEmbedder loaded from that directory
 *
 * @throws Seed::EmbeddingError for unsupported devices or unloadable models
 */
SEED_API std::unique_ptr<EmbeddingProvider> make_embedding_provider(const Seed::EmbeddingConfig& config);

} // namespace seed::ml
