#pragma once

#include <cstdint>

#include "chunk_store.hpp"
#include "digest.hpp"

/**
 * Hashes the stream held by `store` in offset order and returns the digest.
 *
 * The runs must tile [0, store.total_length()) exactly; a gap, an overlap or
 * a short total throws AssemblyInvariantViolation and nothing is finalized.
 *
 * @param bytes_hashed Receives the number of bytes fed to `hasher`
 */
digest_t assemble(const ChunkStore &store, Hasher &hasher,
                  std::uint64_t &bytes_hashed);

inline digest_t assemble(const ChunkStore &store, Hasher &hasher)
{
    std::uint64_t bytes_hashed = 0;
    return assemble(store, hasher, bytes_hashed);
}
