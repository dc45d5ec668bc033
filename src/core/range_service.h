#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "config.h"
#include "response_assembler.h"
#include "thread_pool.h"

class BlockFetcher;
class BlockStore;
class Origin;

/// Inbound request as seen by the service.
struct ProxyRequest {
    std::string method = "GET";
    std::string target = "/";       // request path; used as the object identity
    std::vector<std::pair<std::string, std::string>> headers;
    bool has_body = false;

    std::vector<std::string> headerValues(const std::string& name) const;
};

/// Serves byte ranges of origin objects through the block cache.
///
/// Pipeline per request: parse the Range header, learn the object size
/// (cached size record, else a probe of the first needed block), plan the
/// blocks, fetch them in parallel, and stitch the response. handle() never
/// throws; every failure becomes an HTTP error response.
class RangeService {
public:
    /// @throws std::invalid_argument on a missing collaborator or a
    ///         non-positive block size / parallelism.
    RangeService(const ServiceConfig& config,
                 std::shared_ptr<BlockStore> store,
                 std::shared_ptr<Origin> origin);
    ~RangeService();

    RangeService(const RangeService&) = delete;
    RangeService& operator=(const RangeService&) = delete;

    ProxyResponse handle(const ProxyRequest& request);

    const ServiceConfig& config() const { return config_; }

private:
    /// Runs the pipeline; failures propagate as exceptions.
    ProxyResponse serve(const ProxyRequest& request, bool header_only);

    /// Size recorded for the object by an earlier request, or -1.
    int64_t lookupObjectSize(const std::string& identity);
    void recordObjectSize(const std::string& identity, int64_t size);

    RequestTunables tunablesFor(const ProxyRequest& request) const;

    ServiceConfig config_;
    std::shared_ptr<BlockStore> store_;
    std::shared_ptr<Origin> origin_;
    std::unique_ptr<ThreadPool> fetch_pool_;
};
