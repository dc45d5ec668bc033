#include "cache_key.h"

namespace {

std::string identityPrefix(const char* kind, const std::string& object_identity) {
    std::string key(kind);
    key += '/';
    key += std::to_string(object_identity.size());
    key += ':';
    key += object_identity;
    return key;
}

} // anonymous namespace

std::string blockCacheKey(const std::string& object_identity,
                          int64_t block_size,
                          int64_t block_index) {
    std::string key = identityPrefix("blk", object_identity);
    key += '/';
    key += std::to_string(block_size);
    key += '/';
    key += std::to_string(block_index);
    return key;
}

std::string objectSizeKey(const std::string& object_identity) {
    return identityPrefix("size", object_identity);
}

uint64_t fnv1a64(const std::string& data) {
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : data) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}
