/**
 * @file exporter.hpp
 * @brief Output sinks for produced records, chosen by file extension
 */

#pragma once

#include <lexicon/serialization.hpp>

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace Seed {

/**
 * @brief Base sink. Records are written in the order they are given.
 *
 * The output's parent directories are created on construction.
 */
class Exporter {
public:
    Exporter(std::filesystem::path output_path, size_t buffer_size);
    virtual ~Exporter() = default;

    Exporter(const Exporter&) = delete;
    Exporter& operator=(const Exporter&) = delete;

    virtual void write(const ojson& record) = 0;

    /**
     * @brief Flush and close; returns the path actually written.
     * @throws IoError if the data could not be written out
     */
    virtual std::filesystem::path finish() = 0;

    const std::filesystem::path& output_path() const { return output_path_; }
    size_t buffer_size() const { return buffer_size_; }
    size_t records_written() const { return records_written_; }

protected:
    std::filesystem::path output_path_;
    size_t buffer_size_;
    size_t records_written_ = 0;
};

/**
 * @brief One compact UTF-8 JSON object per line, non-ASCII written as-is.
 */
class JsonlExporter : public Exporter {
public:
    JsonlExporter(std::filesystem::path output_path, size_t buffer_size);
    ~JsonlExporter() override;

    void write(const ojson& record) override;
    std::filesystem::path finish() override;

private:
    std::vector<char> buffer_;
    std::ofstream out_;
    bool finished_ = false;
};

class ExporterFactory {
public:
    using Creator = std::function<std::unique_ptr<Exporter>(const std::filesystem::path&, size_t)>;

    static constexpr const char* DEFAULT_EXTENSION = "jsonl";

    /**
     * @brief Register a creator for an extension (without dot, case-insensitive).
     */
    static void register_exporter(const std::string& extension, Creator creator);

    static bool supports(const std::string& extension);

    /**
     * @brief Exporter for the path's extension.
     *
     * Unknown extensions fall back to JSONL with the extension rewritten to
     * ".jsonl"; the exporter's output_path() reports the final path.
     */
    static std::unique_ptr<Exporter> create(std::filesystem::path output_path, size_t buffer_size);

private:
    static std::map<std::string, Creator>& registry();
};

} // namespace Seed
