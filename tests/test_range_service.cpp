#include <gtest/gtest.h>
#include "range_service.h"
#include "block_store.h"
#include "cache_key.h"
#include "fake_origin.h"

#include <memory>
#include <thread>
#include <vector>

namespace {

constexpr int64_t kMiB = 1024 * 1024;

ServiceConfig smallBlocks() {
    ServiceConfig config;
    config.block_size = 100;
    config.max_parallel = 4;
    config.fetch_threads = 8;
    return config;
}

ProxyRequest get(const std::string& target, const std::string& range = "") {
    ProxyRequest req;
    req.method = "GET";
    req.target = target;
    if (!range.empty()) {
        req.headers.emplace_back("Range", range);
    }
    return req;
}

class RangeServiceTest : public ::testing::Test {
protected:
    void start(int64_t object_size, ServiceConfig config = smallBlocks()) {
        store_ = std::make_shared<MemoryBlockStore>();
        origin_ = std::make_shared<FakeOrigin>(makePayload(object_size));
        service_ = std::make_unique<RangeService>(config, store_, origin_);
    }

    std::string slice(int64_t first, int64_t last) const {
        return origin_->payload().substr(static_cast<size_t>(first),
                                         static_cast<size_t>(last - first + 1));
    }

    std::shared_ptr<MemoryBlockStore> store_;
    std::shared_ptr<FakeOrigin> origin_;
    std::unique_ptr<RangeService> service_;
};

} // namespace

// ── Successful responses ───────────────────────────────────────

TEST_F(RangeServiceTest, ClosedRangeReturnsPartialContent) {
    start(1000);
    ProxyResponse resp = service_->handle(get("/obj", "bytes=250-649"));

    EXPECT_EQ(resp.status, 206);
    EXPECT_EQ(resp.header("Content-Range"), "bytes 250-649/1000");
    EXPECT_EQ(resp.header("Content-Length"), "400");
    EXPECT_EQ(resp.body, slice(250, 649));
}

TEST_F(RangeServiceTest, NoRangeReturnsWholeObject) {
    start(1000);
    ProxyResponse resp = service_->handle(get("/obj"));

    EXPECT_EQ(resp.status, 200);
    EXPECT_FALSE(resp.hasHeader("Content-Range"));
    EXPECT_EQ(resp.header("Accept-Ranges"), "bytes");
    EXPECT_EQ(resp.body, origin_->payload());
}

TEST_F(RangeServiceTest, OpenEndedRangeRunsToEndOfObject) {
    start(1000);
    ProxyResponse resp = service_->handle(get("/obj", "bytes=905-"));

    EXPECT_EQ(resp.status, 206);
    EXPECT_EQ(resp.header("Content-Range"), "bytes 905-999/1000");
    EXPECT_EQ(resp.body, slice(905, 999));
}

TEST_F(RangeServiceTest, RepeatedRequestIsServedFromCache) {
    start(1000);
    ProxyResponse first = service_->handle(get("/obj", "bytes=120-480"));
    const int calls = origin_->calls();
    ProxyResponse second = service_->handle(get("/obj", "bytes=120-480"));

    EXPECT_EQ(origin_->calls(), calls);
    EXPECT_EQ(second.status, first.status);
    EXPECT_EQ(second.body, first.body);
}

TEST_F(RangeServiceTest, SizeIsRecordedAfterFirstRequest) {
    start(1000);
    service_->handle(get("/obj", "bytes=0-99"));
    auto record = store_->get(objectSizeKey("/obj"));
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(*record, "1000");

    // Known size: only the covering blocks go to the origin.
    const int before = origin_->calls();
    ProxyResponse resp = service_->handle(get("/obj", "bytes=510-689"));
    EXPECT_EQ(resp.status, 206);
    EXPECT_EQ(origin_->calls() - before, 2);
}

TEST_F(RangeServiceTest, ConfHeaderOverridesBlockSizeAndParallelism) {
    start(3 * kMiB + 10);
    ProxyRequest req = get("/big", "bytes=0-1048576");
    req.headers.emplace_back("x-sc-conf", "b=1048576,p=2");

    ProxyResponse resp = service_->handle(req);

    EXPECT_EQ(resp.status, 206);
    EXPECT_EQ(resp.body.size(), static_cast<size_t>(kMiB + 1));
    EXPECT_EQ(origin_->calls(), 2);
    EXPECT_LE(origin_->maxConcurrent(), 2);
    EXPECT_TRUE(store_->get(blockCacheKey("/big", kMiB, 1)).has_value());
}

TEST_F(RangeServiceTest, ConfHeaderIgnoredWhenOverridesDisabled) {
    ServiceConfig config = smallBlocks();
    config.allow_request_overrides = false;
    start(1000, config);
    ProxyRequest req = get("/obj", "bytes=0-199");
    req.headers.emplace_back("x-sc-conf", "b=1048576");

    ProxyResponse resp = service_->handle(req);

    EXPECT_EQ(resp.status, 206);
    EXPECT_TRUE(store_->get(blockCacheKey("/obj", 100, 1)).has_value());
    EXPECT_FALSE(store_->get(blockCacheKey("/obj", kMiB, 0)).has_value());
}

TEST_F(RangeServiceTest, ZeroLengthObject) {
    start(0);
    ProxyResponse whole = service_->handle(get("/empty"));
    EXPECT_EQ(whole.status, 200);
    EXPECT_TRUE(whole.body.empty());
    EXPECT_EQ(whole.header("Content-Length"), "0");

    ProxyResponse ranged = service_->handle(get("/empty", "bytes=0-0"));
    EXPECT_EQ(ranged.status, 416);
    EXPECT_EQ(ranged.header("Content-Range"), "bytes */0");
}

TEST_F(RangeServiceTest, HeadReturnsHeadersWithoutBody) {
    start(1000);
    ProxyRequest req = get("/obj", "bytes=100-299");
    req.method = "HEAD";

    ProxyResponse resp = service_->handle(req);

    EXPECT_EQ(resp.status, 206);
    EXPECT_EQ(resp.header("Content-Length"), "200");
    EXPECT_EQ(resp.header("Content-Range"), "bytes 100-299/1000");
    EXPECT_TRUE(resp.body.empty());
}

TEST_F(RangeServiceTest, WorksWithoutStore) {
    origin_ = std::make_shared<FakeOrigin>(makePayload(500));
    service_ = std::make_unique<RangeService>(smallBlocks(), nullptr, origin_);

    ProxyResponse resp = service_->handle(get("/obj", "bytes=10-410"));
    EXPECT_EQ(resp.status, 206);
    EXPECT_EQ(resp.body, slice(10, 410));
}

TEST_F(RangeServiceTest, ConcurrentRequestsGetExactBytes) {
    start(5000);
    std::vector<std::thread> clients;
    std::vector<int> ok(8, 0);
    for (int c = 0; c < 8; ++c) {
        clients.emplace_back([this, c, &ok] {
            const int64_t first = c * 300;
            const int64_t last = first + 1234;
            ProxyResponse resp = service_->handle(
                get("/obj", "bytes=" + std::to_string(first) + "-" + std::to_string(last)));
            ok[static_cast<size_t>(c)] =
                resp.status == 206 && resp.body == slice(first, last);
        });
    }
    for (auto& t : clients) t.join();
    for (int c = 0; c < 8; ++c) {
        EXPECT_EQ(ok[static_cast<size_t>(c)], 1) << "client " << c;
    }
}

// ── Range errors ───────────────────────────────────────────────

TEST_F(RangeServiceTest, RangePastEndOfUnknownObjectIs416WithSize) {
    start(1000);
    ProxyResponse resp = service_->handle(get("/obj", "bytes=5000-6000"));

    EXPECT_EQ(resp.status, 416);
    EXPECT_EQ(resp.header("Content-Range"), "bytes */1000");
}

TEST_F(RangeServiceTest, RangePastEndOfKnownObjectSkipsOrigin) {
    start(1000);
    service_->handle(get("/obj", "bytes=0-9"));
    const int calls = origin_->calls();

    ProxyResponse resp = service_->handle(get("/obj", "bytes=990-1000"));

    EXPECT_EQ(resp.status, 416);
    EXPECT_EQ(resp.header("Content-Range"), "bytes */1000");
    EXPECT_EQ(origin_->calls(), calls);
}

TEST_F(RangeServiceTest, MalformedRangeIs416WithoutOriginContact) {
    start(1000);
    for (const char* bad : {"bytes=-100", "items=0-10", "bytes=0-1,5-9", "bytes=20-10", "bytes=x-"}) {
        ProxyResponse resp = service_->handle(get("/obj", bad));
        EXPECT_EQ(resp.status, 416) << bad;
    }
    EXPECT_EQ(origin_->calls(), 0);
}

// ── Request validation ─────────────────────────────────────────

TEST_F(RangeServiceTest, UnsupportedMethodIs405) {
    start(1000);
    ProxyRequest req = get("/obj");
    req.method = "POST";

    ProxyResponse resp = service_->handle(req);

    EXPECT_EQ(resp.status, 405);
    EXPECT_EQ(resp.header("Allow"), "GET, HEAD");
    EXPECT_EQ(origin_->calls(), 0);
}

TEST_F(RangeServiceTest, RequestBodyIs403) {
    start(1000);
    ProxyRequest req = get("/obj", "bytes=0-10");
    req.has_body = true;

    EXPECT_EQ(service_->handle(req).status, 403);
    EXPECT_EQ(origin_->calls(), 0);
}

// ── Origin failures ────────────────────────────────────────────

TEST_F(RangeServiceTest, OriginErrorOnLaterBlockIs502) {
    start(1000);
    origin_->failAt(300, FetchErrorKind::HttpStatus);

    ProxyResponse resp = service_->handle(get("/obj"));

    EXPECT_EQ(resp.status, 502);
    EXPECT_EQ(resp.header("Content-Type").rfind("text/plain", 0), 0u);
}

TEST_F(RangeServiceTest, OriginTimeoutIs504) {
    start(1000);
    origin_->failAt(500, FetchErrorKind::Timeout);
    EXPECT_EQ(service_->handle(get("/obj", "bytes=450-550")).status, 504);
}

TEST_F(RangeServiceTest, FailedSizeProbeIs502) {
    start(1000);
    origin_->failAt(0, FetchErrorKind::Connection);

    EXPECT_EQ(service_->handle(get("/obj", "bytes=0-10")).status, 502);
    EXPECT_FALSE(store_->get(objectSizeKey("/obj")).has_value());
}

TEST_F(RangeServiceTest, SizeChangeMidRequestIs502) {
    start(1000);
    origin_->reportTotalFrom(500, 1200);

    EXPECT_EQ(service_->handle(get("/obj")).status, 502);
}

TEST_F(RangeServiceTest, FailureDoesNotPoisonLaterRequests) {
    start(1000);
    origin_->failAt(200, FetchErrorKind::Connection);
    EXPECT_EQ(service_->handle(get("/obj", "bytes=0-299")).status, 502);

    // Blocks that did arrive stay usable for other ranges.
    ProxyResponse resp = service_->handle(get("/obj", "bytes=0-150"));
    EXPECT_EQ(resp.status, 206);
    EXPECT_EQ(resp.body, slice(0, 150));
}

TEST(RangeServiceConstructionTest, RejectsMissingOriginAndBadTunables) {
    auto origin = std::make_shared<FakeOrigin>(makePayload(10));
    EXPECT_THROW(RangeService(smallBlocks(), nullptr, nullptr), std::invalid_argument);

    ServiceConfig zero_block = smallBlocks();
    zero_block.block_size = 0;
    EXPECT_THROW(RangeService(zero_block, nullptr, origin), std::invalid_argument);

    ServiceConfig zero_parallel = smallBlocks();
    zero_parallel.max_parallel = 0;
    EXPECT_THROW(RangeService(zero_parallel, nullptr, origin), std::invalid_argument);
}
