#include "range_service.h"
#include "block_fetcher.h"
#include "block_geometry.h"
#include "block_store.h"
#include "cache_key.h"
#include "http_engine.h"
#include "logger.h"
#include "origin.h"
#include "parallel_fetcher.h"
#include "proxy_errors.h"

#include <algorithm>
#include <stdexcept>

namespace {

std::string describeRange(const std::optional<RequestedRange>& range) {
    if (!range) return "whole";
    std::string s = std::to_string(range->first) + "-";
    if (!range->isOpen()) s += std::to_string(range->last);
    return s;
}

} // anonymous namespace

// ── ProxyRequest ───────────────────────────────────────────────

std::vector<std::string> ProxyRequest::headerValues(const std::string& name) const {
    std::vector<std::string> values;
    for (const auto& [field, value] : headers) {
        if (headerNameEquals(field, name)) {
            values.push_back(value);
        }
    }
    return values;
}

// ── Construction ───────────────────────────────────────────────

RangeService::RangeService(const ServiceConfig& config,
                           std::shared_ptr<BlockStore> store,
                           std::shared_ptr<Origin> origin)
    : config_(config)
    , store_(std::move(store))
    , origin_(std::move(origin))
{
    if (!origin_) {
        throw std::invalid_argument("RangeService: origin is required");
    }
    if (config_.block_size <= 0) {
        throw std::invalid_argument("RangeService: block_size must be > 0");
    }
    if (config_.max_parallel < 1) {
        throw std::invalid_argument("RangeService: max_parallel must be >= 1");
    }
    size_t threads = static_cast<size_t>(std::max(config_.fetch_threads, config_.max_parallel));
    fetch_pool_ = std::make_unique<ThreadPool>(threads, "block-fetch");
}

RangeService::~RangeService() = default;

// ── handle ─────────────────────────────────────────────────────

ProxyResponse RangeService::handle(const ProxyRequest& request) {
    bool header_only = false;
    if (request.method == "HEAD") {
        header_only = true;
    } else if (request.method != "GET") {
        ProxyResponse resp = errorResponse(405, "Method not allowed");
        resp.setHeader("Allow", "GET, HEAD");
        return resp;
    }

    if (request.has_body) {
        return errorResponse(403, "Request body not allowed");
    }

    try {
        ProxyResponse resp = serve(request, header_only);
        if (header_only) {
            resp.body.clear();
        }
        return resp;
    } catch (const RangeNotSatisfiable& e) {
        Logger::instance().info(request.method + " " + request.target
            + " -> 416: " + e.what());
        return rangeNotSatisfiableResponse(e.objectSize());
    } catch (const OriginFetchFailed& e) {
        const int status = e.isTimeout() ? 504 : 502;
        Logger::instance().warn(request.method + " " + request.target + " -> "
            + std::to_string(status) + " (" + fetchErrorKindName(e.kind()) + "): " + e.what());
        return errorResponse(status, e.what());
    } catch (const AssemblyMismatch& e) {
        Logger::instance().error(request.method + " " + request.target
            + " -> 500 assembly mismatch: " + e.what());
        return errorResponse(500, "Internal assembly error");
    } catch (const std::exception& e) {
        Logger::instance().error(request.method + " " + request.target
            + " -> 500: " + e.what());
        return errorResponse(500, e.what());
    }
}

// ── serve ──────────────────────────────────────────────────────

ProxyResponse RangeService::serve(const ProxyRequest& request, bool header_only) {
    const std::string identity = request.target.empty() ? "/" : request.target;
    const RequestTunables tunables = tunablesFor(request);
    const std::optional<RequestedRange> range = parseRangeHeader(request.headerValues("Range"));

    BlockFetcher fetcher(store_.get(), origin_.get(), tunables.block_size);
    ParallelFetcher::Prefetched prefetched;

    int64_t object_size = lookupObjectSize(identity);
    if (object_size < 0) {
        // Size unknown: the block holding the first requested byte tells us.
        const int64_t index = firstBlockIndex(tunables.block_size, range);
        FetchOutcome probe = fetcher.fetchFromOrigin(identity, index,
                                                     index * tunables.block_size,
                                                     tunables.block_size);
        if (probe.ok) {
            object_size = probe.total_size;
            prefetched.emplace(index, std::move(probe));
        } else if (probe.error == FetchErrorKind::Unsatisfiable && probe.total_size >= 0) {
            // Range starts past the end; planning below reports it as 416.
            object_size = probe.total_size;
        } else {
            throw OriginFetchFailed("block " + std::to_string(index) + " of " + identity
                                    + ": " + probe.error_message,
                                    probe.error, index, probe.http_status);
        }
        recordObjectSize(identity, object_size);
    }

    // Validate against the (possibly just discovered) size.
    BlockPlan plan = planBlocks(object_size, tunables.block_size, range);

    Logger::instance().info(request.method + " " + identity + " range=" + describeRange(range)
        + " size=" + std::to_string(object_size)
        + " blocks=" + std::to_string(plan.blocks.size())
        + " bs=" + std::to_string(tunables.block_size)
        + " p=" + std::to_string(tunables.max_parallel));

    if (header_only) {
        return assembleHeaders(plan);
    }

    ParallelFetcher parallel(fetch_pool_.get(), &fetcher,
                             static_cast<size_t>(tunables.max_parallel));
    std::vector<FetchOutcome> outcomes = parallel.fetchAll(identity, plan, std::move(prefetched));
    return assembleResponse(plan, outcomes);
}

// ── Helpers ────────────────────────────────────────────────────

RequestTunables RangeService::tunablesFor(const ProxyRequest& request) const {
    RequestTunables t;
    t.block_size = config_.block_size;
    t.max_parallel = config_.max_parallel;
    if (config_.allow_request_overrides) {
        auto values = request.headerValues("x-sc-conf");
        if (!values.empty()) {
            t = applyConfHeader(t, values.front());
        }
    }
    return t;
}

int64_t RangeService::lookupObjectSize(const std::string& identity) {
    if (!store_) return -1;
    std::optional<std::string> record;
    try {
        record = store_->get(objectSizeKey(identity));
    } catch (const std::exception& e) {
        Logger::instance().warn("size lookup failed for " + identity + ": " + e.what());
        return -1;
    }
    if (!record || record->empty() || record->size() > 18 ||
        !std::all_of(record->begin(), record->end(),
                     [](unsigned char c) { return c >= '0' && c <= '9'; })) {
        return -1;
    }
    return std::stoll(*record);
}

void RangeService::recordObjectSize(const std::string& identity, int64_t size) {
    if (!store_) return;
    try {
        if (!store_->put(objectSizeKey(identity), std::to_string(size))) {
            Logger::instance().warn("cannot record size of " + identity);
        }
    } catch (const std::exception& e) {
        Logger::instance().warn("cannot record size of " + identity + ": " + e.what());
    }
}
