#pragma once

#include <cstdint>
#include <string>

#include "proxy_errors.h"

class BlockStore;
class Origin;

/// Result of resolving one block: its bytes, or why they are missing.
struct FetchOutcome {
    int64_t block_index = -1;
    bool ok = false;
    std::string bytes;
    int64_t total_size = -1;     // as reported by the origin; -1 for cache hits
    bool from_cache = false;

    FetchErrorKind error = FetchErrorKind::None;
    long http_status = 0;
    std::string error_message;

    static FetchOutcome success(int64_t index, std::string bytes,
                                int64_t total_size, bool from_cache);
    static FetchOutcome failure(int64_t index, FetchErrorKind kind,
                                std::string message, long http_status = 0,
                                int64_t total_size = -1);
};

/// Resolves single blocks of an object: cache first, origin on a miss.
///
/// Holds non-owning pointers; both collaborators must outlive the fetcher
/// and tolerate concurrent calls. fetch() never throws for origin or cache
/// problems: they come back as a failed FetchOutcome. There is no retry.
class BlockFetcher {
public:
    BlockFetcher(BlockStore* store, Origin* origin, int64_t block_size);

    /// Resolve block @p index, spanning [offset, offset + length).
    ///
    /// When @p expected_total is -1 the object size is not known yet and
    /// @p length is an upper bound (the final block may be shorter). When it
    /// is known, the block must have exactly @p length bytes and the origin
    /// must report the same total, otherwise the outcome is a failure.
    FetchOutcome fetch(const std::string& object_identity,
                       int64_t index,
                       int64_t offset,
                       int64_t length,
                       int64_t expected_total = -1);

    /// Same as fetch() but skips the cache lookup. Used when the caller needs
    /// the authoritative total size only the origin can report.
    FetchOutcome fetchFromOrigin(const std::string& object_identity,
                                 int64_t index,
                                 int64_t offset,
                                 int64_t length,
                                 int64_t expected_total = -1);

    int64_t blockSize() const { return block_size_; }

private:
    /// Best-effort cache write. Failures are logged, never propagated.
    void storeBlock(const std::string& key, const std::string& bytes);

    BlockStore* store_;   // non-owning
    Origin* origin_;      // non-owning
    int64_t block_size_;
};
