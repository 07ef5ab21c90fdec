#pragma once

#include <stdexcept>
#include <string>
#include <cstddef>

namespace Seed {

/**
 * @brief Root of every error raised by the seed library.
 */
class SeedError : public std::runtime_error {
public:
    explicit SeedError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief A line of structured input could not be decoded.
 */
class ParseError : public SeedError {
public:
    ParseError(const std::string& source, size_t line, const std::string& detail)
        : SeedError(source + ":" + std::to_string(line) + ": " + detail), line_(line) {}

    size_t line() const { return line_; }

private:
    size_t line_;
};

class ConfigError : public SeedError {
public:
    explicit ConfigError(const std::string& what) : SeedError("config: " + what) {}
};

/**
 * @brief Embedding model unavailable, unsupported device or inconsistent output.
 *
 * Always fatal: the provider is initialized once per run.
 */
class EmbeddingError : public SeedError {
public:
    explicit EmbeddingError(const std::string& what) : SeedError("embedding: " + what) {}
};

class IoError : public SeedError {
public:
    explicit IoError(const std::string& what) : SeedError(what) {}
};

} // namespace Seed
