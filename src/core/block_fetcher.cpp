#include "block_fetcher.h"
#include "block_store.h"
#include "cache_key.h"
#include "logger.h"
#include "origin.h"

#include <stdexcept>
#include <utility>

// ── FetchOutcome ───────────────────────────────────────────────

FetchOutcome FetchOutcome::success(int64_t index, std::string bytes,
                                   int64_t total_size, bool from_cache) {
    FetchOutcome o;
    o.block_index = index;
    o.ok = true;
    o.bytes = std::move(bytes);
    o.total_size = total_size;
    o.from_cache = from_cache;
    return o;
}

FetchOutcome FetchOutcome::failure(int64_t index, FetchErrorKind kind,
                                   std::string message, long http_status,
                                   int64_t total_size) {
    FetchOutcome o;
    o.block_index = index;
    o.ok = false;
    o.error = kind;
    o.error_message = std::move(message);
    o.http_status = http_status;
    o.total_size = total_size;
    return o;
}

// ── BlockFetcher ───────────────────────────────────────────────

BlockFetcher::BlockFetcher(BlockStore* store, Origin* origin, int64_t block_size)
    : store_(store)
    , origin_(origin)
    , block_size_(block_size)
{
    if (!origin_) {
        throw std::invalid_argument("BlockFetcher: origin is required");
    }
    if (block_size_ <= 0) {
        throw std::invalid_argument("BlockFetcher: block_size must be > 0");
    }
}

FetchOutcome BlockFetcher::fetch(const std::string& object_identity,
                                 int64_t index,
                                 int64_t offset,
                                 int64_t length,
                                 int64_t expected_total) {
    if (store_) {
        const std::string key = blockCacheKey(object_identity, block_size_, index);
        std::optional<std::string> cached;
        try {
            cached = store_->get(key);
        } catch (const std::exception& e) {
            Logger::instance().warn("cache get failed for " + key + ": " + e.what());
        }

        if (cached) {
            const int64_t size = static_cast<int64_t>(cached->size());
            bool usable = expected_total >= 0 ? size == length
                                              : size > 0 && size <= length;
            if (usable) {
                Logger::instance().debug("cache hit " + key);
                return FetchOutcome::success(index, std::move(*cached), -1, true);
            }
            Logger::instance().warn("cache entry " + key + " has " + std::to_string(size)
                + " bytes, expected " + std::to_string(length) + "; refetching");
        } else {
            Logger::instance().debug("cache miss " + key);
        }
    }

    return fetchFromOrigin(object_identity, index, offset, length, expected_total);
}

FetchOutcome BlockFetcher::fetchFromOrigin(const std::string& object_identity,
                                           int64_t index,
                                           int64_t offset,
                                           int64_t length,
                                           int64_t expected_total) {
    OriginChunk chunk;
    try {
        chunk = origin_->fetchRange(object_identity, offset, length);
    } catch (const OriginError& e) {
        Logger::instance().warn("origin fetch of block " + std::to_string(index)
            + " of " + object_identity + " failed (" + fetchErrorKindName(e.kind())
            + "): " + e.what());
        return FetchOutcome::failure(index, e.kind(), e.what(), e.httpStatus(), e.totalSize());
    } catch (const std::exception& e) {
        Logger::instance().warn("origin fetch of block " + std::to_string(index)
            + " of " + object_identity + " failed: " + e.what());
        return FetchOutcome::failure(index, FetchErrorKind::Connection, e.what());
    }

    if (expected_total >= 0 && chunk.total_size != expected_total) {
        return FetchOutcome::failure(index, FetchErrorKind::SizeMismatch,
            "complete length inconsistent between fragments: "
            + std::to_string(chunk.total_size) + " vs " + std::to_string(expected_total),
            0, chunk.total_size);
    }

    // The block must end where the object or the block ends, whichever is first.
    const int64_t size = static_cast<int64_t>(chunk.bytes.size());
    const int64_t total = chunk.total_size;
    const int64_t want = (total >= 0 && total - offset < length) ? total - offset : length;
    if (size != want) {
        return FetchOutcome::failure(index, FetchErrorKind::Protocol,
            "block " + std::to_string(index) + " has " + std::to_string(size)
            + " bytes, expected " + std::to_string(want), 0, total);
    }

    if (store_ && size > 0) {
        storeBlock(blockCacheKey(object_identity, block_size_, index), chunk.bytes);
    }
    return FetchOutcome::success(index, std::move(chunk.bytes), total, false);
}

void BlockFetcher::storeBlock(const std::string& key, const std::string& bytes) {
    try {
        if (!store_->put(key, bytes)) {
            Logger::instance().warn("cache put failed for " + key);
        }
    } catch (const std::exception& e) {
        Logger::instance().warn("cache put failed for " + key + ": " + e.what());
    }
}
