/**
 * @file safetensor_loader.cpp
 * @brief Safetensor loader implementation
 */

#include <ml/safetensor_loader.hpp>
#include <utils/errors.hpp>

#include <nlohmann/json.hpp>

#include <cmath>
#include <cstring>
#include <filesystem>
#include <fstream>

using json = nlohmann::json;

namespace seed::ml {

using Seed::EmbeddingError;

namespace {

// IEEE 754 half to single precision
float half_to_float(uint16_t h) {
    uint32_t s = (h >> 15) & 0x0001;
    uint32_t e = (h >> 10) & 0x001F;
    uint32_t m = h & 0x03FF;

    if (e == 0) {
        if (m == 0) {
            uint32_t val = s << 31;
            float f;
            std::memcpy(&f, &val, 4);
            return f;
        }
        return (s ? -1.0f : 1.0f) * std::ldexp(static_cast<float>(m), -24);
    }
    if (e == 31) {
        uint32_t val = (s << 31) | 0x7F800000 | (m << 13);
        float f;
        std::memcpy(&f, &val, 4);
        return f;
    }
    uint32_t val = (s << 31) | ((e + 112) << 23) | (m << 13);
    float f;
    std::memcpy(&f, &val, 4);
    return f;
}

template <typename T>
void convert(const std::vector<uint8_t>& raw, std::vector<float>& out) {
    const size_t n = raw.size() / sizeof(T);
    out.resize(n);
    for (size_t i = 0; i < n; ++i) {
        T v;
        std::memcpy(&v, raw.data() + i * sizeof(T), sizeof(T));
        out[i] = static_cast<float>(v);
    }
}

} // namespace

SafetensorLoader::SafetensorLoader(const std::string& model_dir) : model_dir_(model_dir) {
    namespace fs = std::filesystem;

    if (!fs::is_directory(model_dir_)) {
        throw EmbeddingError("model directory not found: " + model_dir_);
    }

    if (fs::exists(model_dir_ + "/tokenizer.json")) {
        load_tokenizer(model_dir_ + "/tokenizer.json");
    } else if (fs::exists(model_dir_ + "/vocab.txt")) {
        load_vocab(model_dir_ + "/vocab.txt");
    } else if (fs::exists(model_dir_ + "/vocab.json")) {
        load_vocab(model_dir_ + "/vocab.json");
    }
    if (metadata_.vocab.empty()) {
        throw EmbeddingError("no tokenizer.json, vocab.txt or vocab.json in " + model_dir_);
    }

    for (const char* name : {"model.safetensors", "embeddings.safetensors"}) {
        std::string path = model_dir_ + "/" + name;
        if (fs::exists(path)) {
            read_safetensor_file(path, tensors_);
            return;
        }
    }
    throw EmbeddingError("no model.safetensors or embeddings.safetensors in " + model_dir_);
}

void SafetensorLoader::assign_token(const std::string& token, long long id) {
    if (id < 0) return;
    size_t idx = static_cast<size_t>(id);
    if (idx >= metadata_.vocab.size()) {
        metadata_.vocab.resize(idx + 1);
    }
    metadata_.vocab[idx] = token;
}

void SafetensorLoader::load_tokenizer(const std::string& path) {
    std::ifstream file(path);
    if (!file) return;

    json tokenizer;
    try {
        file >> tokenizer;
    } catch (const json::exception& e) {
        throw EmbeddingError(path + ": " + e.what());
    }

    if (!tokenizer.contains("model") || !tokenizer["model"].is_object()) return;
    const json& model = tokenizer["model"];

    if (model.contains("vocab") && model["vocab"].is_object()) {
        for (auto& [token, id] : model["vocab"].items()) {
            if (id.is_number_integer()) assign_token(token, id.get<long long>());
        }
    }
    if (model.contains("unk_token") && model["unk_token"].is_string()) {
        metadata_.unk_token = model["unk_token"];
    }
    if (model.contains("continuing_subword_prefix") && model["continuing_subword_prefix"].is_string()) {
        metadata_.subword_prefix = model["continuing_subword_prefix"];
    }

    if (tokenizer.contains("added_tokens") && tokenizer["added_tokens"].is_array()) {
        for (auto& token_obj : tokenizer["added_tokens"]) {
            if (token_obj.contains("content") && token_obj.contains("id") &&
                token_obj["content"].is_string() && token_obj["id"].is_number_integer()) {
                assign_token(token_obj["content"].get<std::string>(), token_obj["id"].get<long long>());
            }
        }
    }
}

void SafetensorLoader::load_vocab(const std::string& path) {
    std::ifstream file(path);
    if (!file) return;

    std::string first_line;
    std::getline(file, first_line);
    file.clear();
    file.seekg(0);

    if (!first_line.empty() && first_line[0] == '{') {
        json vocab;
        try {
            file >> vocab;
        } catch (const json::exception& e) {
            throw EmbeddingError(path + ": " + e.what());
        }
        for (auto& [token, id] : vocab.items()) {
            if (id.is_number_integer()) assign_token(token, id.get<long long>());
        }
    } else {
        // One token per line
        std::string line;
        while (std::getline(file, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            metadata_.vocab.push_back(line);
        }
    }

    if (metadata_.unk_token.empty()) {
        for (const auto& token : metadata_.vocab) {
            if (token == "[UNK]" || token == "<unk>") { metadata_.unk_token = token; break; }
        }
    }
}

void SafetensorLoader::read_safetensor_file(const std::string& path, std::map<std::string, TensorData>& tensors) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw EmbeddingError("failed to open safetensor file: " + path);
    }

    file.seekg(0, std::ios::end);
    const uint64_t file_size = static_cast<uint64_t>(file.tellg());
    file.seekg(0);

    // Header size: first 8 bytes, little-endian uint64
    uint8_t size_bytes[8] = {0};
    file.read(reinterpret_cast<char*>(size_bytes), 8);
    if (file.gcount() != 8) {
        throw EmbeddingError("truncated safetensor file: " + path);
    }
    uint64_t header_size = 0;
    for (int i = 7; i >= 0; --i) header_size = (header_size << 8) | size_bytes[i];

    if (header_size > 100 * 1024 * 1024 || 8 + header_size > file_size) {
        throw EmbeddingError("invalid safetensor header size in " + path);
    }

    std::vector<char> header_data(header_size);
    file.read(header_data.data(), static_cast<std::streamsize>(header_size));

    json header;
    try {
        header = json::parse(header_data.begin(), header_data.end());
    } catch (const json::exception& e) {
        throw EmbeddingError(path + ": bad header: " + e.what());
    }

    const uint64_t data_start = 8 + header_size;

    for (auto& [name, info] : header.items()) {
        if (name == "__metadata__") continue;

        TensorData tensor;
        tensor.name = name;
        uint64_t begin = 0;
        uint64_t end = 0;
        try {
            tensor.dtype = info.at("dtype").get<std::string>();
            for (auto& dim : info.at("shape")) tensor.shape.push_back(dim.get<size_t>());
            begin = info.at("data_offsets").at(0).get<uint64_t>();
            end = info.at("data_offsets").at(1).get<uint64_t>();
        } catch (const json::exception& e) {
            throw EmbeddingError(path + ": tensor " + name + ": " + e.what());
        }

        if (end < begin || data_start + end > file_size) {
            throw EmbeddingError(path + ": tensor " + name + " lies outside the file");
        }

        std::vector<uint8_t> raw(end - begin);
        file.seekg(static_cast<std::streamoff>(data_start + begin));
        file.read(reinterpret_cast<char*>(raw.data()), static_cast<std::streamsize>(raw.size()));

        if (tensor.dtype == "F32") {
            convert<float>(raw, tensor.data);
        } else if (tensor.dtype == "F64") {
            convert<double>(raw, tensor.data);
        } else if (tensor.dtype == "F16") {
            tensor.data.resize(raw.size() / 2);
            for (size_t i = 0; i < tensor.data.size(); ++i) {
                uint16_t h;
                std::memcpy(&h, raw.data() + i * 2, 2);
                tensor.data[i] = half_to_float(h);
            }
        } else if (tensor.dtype == "BF16") {
            // Same exponent range as F32, truncated mantissa
            tensor.data.resize(raw.size() / 2);
            for (size_t i = 0; i < tensor.data.size(); ++i) {
                uint16_t h;
                std::memcpy(&h, raw.data() + i * 2, 2);
                uint32_t val = static_cast<uint32_t>(h) << 16;
                std::memcpy(&tensor.data[i], &val, 4);
            }
        } else {
            // Integer tensors (token ids, norms) are not needed for embedding lookup
            continue;
        }

        if (tensor.data.size() != tensor.total_elements()) {
            throw EmbeddingError(path + ": tensor " + name + " has " + std::to_string(tensor.data.size()) +
                                 " elements, shape says " + std::to_string(tensor.total_elements()));
        }

        tensors[name] = std::move(tensor);
    }
}

const TensorData* SafetensorLoader::get_tensor(const std::string& name) const {
    auto it = tensors_.find(name);
    return it != tensors_.end() ? &it->second : nullptr;
}

Eigen::MatrixXf SafetensorLoader::get_embeddings() const {
    // Common embedding tensor names, static-embedding formats first
    const char* embedding_names[] = {
        "embeddings",
        "embedding.weight",
        "embeddings.word_embeddings.weight",
        "bert.embeddings.word_embeddings.weight",
        "0.auto_model.embeddings.word_embeddings.weight",
        "model.embed_tokens.weight",
        "embed_tokens.weight",
        "token_embedding.weight",
        "word_embeddings.weight"
    };

    const TensorData* found = nullptr;
    for (const char* name : embedding_names) {
        auto* tensor = get_tensor(name);
        if (tensor && tensor->shape.size() == 2) { found = tensor; break; }
    }

    if (!found) {
        // Fallback: any 2D tensor with "embed" in its name
        for (const auto& [name, tensor] : tensors_) {
            if (tensor.shape.size() == 2 && name.find("embed") != std::string::npos) {
                found = &tensor;
                break;
            }
        }
    }

    if (!found) {
        throw EmbeddingError("no 2D embedding tensor in " + model_dir_);
    }

    const Eigen::Index rows = static_cast<Eigen::Index>(found->shape[0]);
    const Eigen::Index cols = static_cast<Eigen::Index>(found->shape[1]);
    // Safetensors is row-major
    return Eigen::Map<const Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>>(
        found->data.data(), rows, cols);
}

} // namespace seed::ml
