#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "block_fetcher.h"
#include "block_geometry.h"

class ThreadPool;

/// Fetches every block of a plan on a thread pool, at most max_parallel at
/// a time, and returns the outcomes in plan order.
///
/// All or nothing: the first failed block closes admission, so no further
/// block is dispatched; fetches already running are allowed to finish (their
/// cache writes still land) and then the failure is thrown.
class ParallelFetcher {
public:
    /// Outcomes already obtained by the caller, keyed by block index.
    using Prefetched = std::map<int64_t, FetchOutcome>;

    ParallelFetcher(ThreadPool* pool, BlockFetcher* fetcher, size_t max_parallel);

    /// @return one successful outcome per plan block, in plan order.
    /// @throws OriginFetchFailed describing the first block that failed.
    std::vector<FetchOutcome> fetchAll(const std::string& object_identity,
                                       const BlockPlan& plan,
                                       Prefetched prefetched = {});

    size_t maxParallel() const { return max_parallel_; }

private:
    ThreadPool* pool_;         // non-owning
    BlockFetcher* fetcher_;    // non-owning
    size_t max_parallel_;
};
