/**
 * @file blake3_pipeline.cpp
 * @brief BLAKE3 hashing implementation
 */

#include <hashing/blake3_pipeline.hpp>

namespace Seed {

BLAKE3Pipeline::Hash BLAKE3Pipeline::hash(const void* data, size_t len) {
    Hash result;

    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    blake3_hasher_update(&hasher, data, len);
    blake3_hasher_finalize(&hasher, result.data(), HASH_SIZE);

    return result;
}

BLAKE3Pipeline::Hash BLAKE3Pipeline::hash_seeded(uint64_t seed, std::string_view str) {
    Hash result;

    uint8_t seed_bytes[8];
    for (int i = 0; i < 8; ++i) {
        seed_bytes[i] = static_cast<uint8_t>((seed >> (8 * i)) & 0xFF);
    }

    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    blake3_hasher_update(&hasher, seed_bytes, sizeof(seed_bytes));
    blake3_hasher_update(&hasher, str.data(), str.size());
    blake3_hasher_finalize(&hasher, result.data(), HASH_SIZE);

    return result;
}

uint64_t BLAKE3Pipeline::to_u64(const Hash& hash) {
    uint64_t value = 0;
    for (int i = 7; i >= 0; --i) {
        value = (value << 8) | hash[i];
    }
    return value;
}

} // namespace Seed
