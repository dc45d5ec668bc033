#include "parallel_fetcher.h"
#include "admission_gate.h"
#include "logger.h"
#include "proxy_errors.h"
#include "thread_pool.h"

#include <future>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

ParallelFetcher::ParallelFetcher(ThreadPool* pool, BlockFetcher* fetcher, size_t max_parallel)
    : pool_(pool)
    , fetcher_(fetcher)
    , max_parallel_(max_parallel)
{
    if (!pool_ || !fetcher_) {
        throw std::invalid_argument("ParallelFetcher: pool and fetcher are required");
    }
    if (max_parallel_ == 0) {
        throw std::invalid_argument("ParallelFetcher: max_parallel must be >= 1");
    }
}

std::vector<FetchOutcome> ParallelFetcher::fetchAll(const std::string& object_identity,
                                                    const BlockPlan& plan,
                                                    Prefetched prefetched) {
    const size_t n = plan.blocks.size();
    std::vector<FetchOutcome> slots(n);
    if (n == 0) {
        return slots;
    }

    AdmissionGate gate(max_parallel_);
    std::mutex failure_mutex;
    std::optional<FetchOutcome> first_failure;

    auto recordFailure = [&](const FetchOutcome& outcome) {
        {
            std::lock_guard<std::mutex> lock(failure_mutex);
            if (!first_failure) {
                first_failure = outcome;
            }
        }
        gate.close();
    };

    std::vector<std::future<void>> in_flight;
    in_flight.reserve(n);

    for (size_t pos = 0; pos < n; ++pos) {
        const PlannedBlock block = plan.blocks[pos];

        auto ready = prefetched.find(block.index);
        if (ready != prefetched.end()) {
            slots[pos] = std::move(ready->second);
            if (!slots[pos].ok) {
                recordFailure(slots[pos]);
                break;
            }
            continue;
        }

        if (!gate.acquire()) {
            break;  // a sibling failed; dispatch nothing new
        }

        try {
            in_flight.push_back(pool_->submit(
                [this, &slots, &gate, &recordFailure, &object_identity, &plan, pos, block] {
                    FetchOutcome outcome;
                    try {
                        outcome = fetcher_->fetch(object_identity, block.index,
                                                  block.offset, block.length,
                                                  plan.object_size);
                    } catch (const std::exception& e) {
                        outcome = FetchOutcome::failure(block.index,
                            FetchErrorKind::Connection, e.what());
                    }
                    if (!outcome.ok) {
                        recordFailure(outcome);
                    }
                    slots[pos] = std::move(outcome);
                    gate.release();
                }));
        } catch (const std::runtime_error& e) {
            gate.release();
            recordFailure(FetchOutcome::failure(block.index,
                FetchErrorKind::Connection, e.what()));
            break;
        }
    }

    // Drain: every dispatched fetch finishes before the slots go away.
    for (auto& f : in_flight) {
        f.get();
    }

    if (first_failure) {
        const FetchOutcome& failed = *first_failure;
        throw OriginFetchFailed("block " + std::to_string(failed.block_index) + " of "
                                + object_identity + ": " + failed.error_message,
                                failed.error, failed.block_index, failed.http_status);
    }

    if (Logger::instance().enabled(LogLevel::LVL_DEBUG)) {
        int hits = 0;
        for (const auto& o : slots) {
            if (o.from_cache) ++hits;
        }
        Logger::instance().debug("fetched " + std::to_string(n) + " blocks of " + object_identity
            + " (" + std::to_string(hits) + " from cache, parallel "
            + std::to_string(max_parallel_) + ")");
    }

    return slots;
}
