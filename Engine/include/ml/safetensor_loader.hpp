/**
 * @file safetensor_loader.hpp
 * @brief Loader for static embedding models stored as safetensors
 *
 * A model directory holds:
 * - model.safetensors or embeddings.safetensors (token embedding matrix)
 * - tokenizer.json, vocab.txt or vocab.json (row index → token)
 */

#pragma once

#include <Eigen/Core>
#include <map>
#include <string>
#include <vector>

namespace seed::ml {

/**
 * @brief Tensor data, converted to float32
 */
struct TensorData {
    std::string name;
    std::vector<size_t> shape;
    std::string dtype;
    std::vector<float> data;

    size_t total_elements() const {
        size_t total = 1;
        for (auto dim : shape) total *= dim;
        return total;
    }
};

struct ModelMetadata {
    std::vector<std::string> vocab;
    std::string unk_token;
    std::string subword_prefix = "##";
};

class SafetensorLoader {
public:
    /**
     * @throws Seed::EmbeddingError if no weights or no vocabulary can be loaded
     */
    explicit SafetensorLoader(const std::string& model_dir);

    const ModelMetadata& metadata() const { return metadata_; }

    const TensorData* get_tensor(const std::string& name) const;

    /**
     * @brief Token embedding matrix, shape (vocab_size, embedding_dim).
     * @throws Seed::EmbeddingError if no 2D embedding tensor is present
     */
    Eigen::MatrixXf get_embeddings() const;

    /**
     * @brief Parse one safetensors file into `tensors`.
     */
    static void read_safetensor_file(const std::string& path, std::map<std::string, TensorData>& tensors);

private:
    void load_tokenizer(const std::string& path);
    void load_vocab(const std::string& path);
    void assign_token(const std::string& token, long long id);

    std::string model_dir_;
    ModelMetadata metadata_;
    std::map<std::string, TensorData> tensors_;
};

} // namespace seed::ml
