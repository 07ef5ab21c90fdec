/**
 * @file blake3_pipeline.hpp
 * @brief BLAKE3 hashing for feature hashing
 */

#pragma once

#include <array>
#include <cstdint>
#include <string_view>

extern "C" {
#include <blake3.h>
}

namespace Seed {

/**
 * @brief Thin wrapper over the BLAKE3 C API.
 *
 * SAME INPUT = SAME HASH, on every platform: feature buckets and signs
 * derived from it are stable across runs.
 */
class BLAKE3Pipeline {
public:
    static constexpr size_t HASH_SIZE = 16; // 128 bits
    using Hash = std::array<uint8_t, HASH_SIZE>;

    static Hash hash(const void* data, size_t len);

    static Hash hash(std::string_view str) {
        return hash(str.data(), str.size());
    }

    /**
     * @brief Keyed hash: the seed is absorbed before the data.
     *
     * Distinct seeds give independent hash families over the same input.
     */
    static Hash hash_seeded(uint64_t seed, std::string_view str);

    /**
     * @brief First 8 bytes of the hash as a little-endian integer.
     */
    static uint64_t to_u64(const Hash& hash);
};

} // namespace Seed
