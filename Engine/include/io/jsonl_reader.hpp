/**
 * @file jsonl_reader.hpp
 * @brief Line-by-line JSON reader for .jsonl and .jsonl.gz files
 *
 * Files are opened through zlib, which reads uncompressed input verbatim,
 * so gzip is detected from the magic bytes rather than the file name.
 */

#pragma once

#include <config/seed_config.hpp>
#include <lexicon/serialization.hpp>

#include <zlib.h>

#include <cstddef>
#include <string>

namespace Seed {

class JsonlReader {
public:
    /**
     * @throws IoError if the file cannot be opened
     */
    explicit JsonlReader(const std::string& path,
                         MalformedLinePolicy policy = MalformedLinePolicy::Skip,
                         size_t buffer_size = 1024 * 1024);
    ~JsonlReader();

    JsonlReader(const JsonlReader&) = delete;
    JsonlReader& operator=(const JsonlReader&) = delete;

    /**
     * @brief Decode the next non-blank line into `record`.
     *
     * Under Skip, a line that is not a JSON object yields an empty object.
     *
     * @return false at end of file
     * @throws ParseError under Abort when a line is malformed
     * @throws IoError on a read error
     */
    bool next(ojson& record);

    size_t line_number() const { return line_number_; }
    size_t records() const { return records_; }
    size_t malformed_lines() const { return malformed_; }
    bool compressed() const { return compressed_; }
    const std::string& path() const { return path_; }

private:
    bool read_line(std::string& line);

    std::string path_;
    MalformedLinePolicy policy_;
    gzFile file_ = nullptr;
    bool compressed_ = false;
    std::string chunk_;
    size_t line_number_ = 0;
    size_t records_ = 0;
    size_t malformed_ = 0;
};

} // namespace Seed
