#pragma once

#include <cstdint>
#include <string>

/// Cache key of one block of an object.
///
/// The key depends only on the object identity, the block size and the block
/// index, never on the client range, so every request touching the same block
/// shares one cache entry. The identity is length-prefixed, which keeps keys
/// of distinct (identity, block_size, index) triples distinct.
/// Format: "blk/<len>:<identity>/<block_size>/<index>"
std::string blockCacheKey(const std::string& object_identity,
                          int64_t block_size,
                          int64_t block_index);

/// Cache key under which the discovered total size of an object is recorded.
std::string objectSizeKey(const std::string& object_identity);

/// 64-bit FNV-1a hash. Stable across processes and platforms.
uint64_t fnv1a64(const std::string& data);
