#include <gtest/gtest.h>
#include "config.h"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

constexpr int64_t kMiB = 1024 * 1024;

// ── Parsing ────────────────────────────────────────────────────

TEST(ConfigFileTest, EmptyObjectYieldsDefaults) {
    auto config = ConfigFile::parse("{}");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->block_size, kMiB);
    EXPECT_EQ(config->max_parallel, 5);
    EXPECT_EQ(config->read_chunk_size, 65536);
    EXPECT_EQ(config->listen_address, "127.0.0.1");
    EXPECT_EQ(config->listen_port, 8080);
    EXPECT_TRUE(config->allow_request_overrides);
    EXPECT_EQ(config->cache.type, "memory");
    EXPECT_TRUE(config->origin.base_url.empty());
}

TEST(ConfigFileTest, ReadsNestedSections) {
    auto config = ConfigFile::parse(R"({
        "block_size": 4194304,
        "max_parallel": 8,
        "listen_port": 9000,
        "log_level": "debug",
        "origin": {
            "base_url": "https://objects.example.com/bucket",
            "host_header": "objects.internal",
            "connect_timeout_sec": 3,
            "verify_ssl": false
        },
        "cache": { "type": "disk", "directory": "/var/cache/blocks" }
    })");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->block_size, 4 * kMiB);
    EXPECT_EQ(config->max_parallel, 8);
    EXPECT_EQ(config->listen_port, 9000);
    EXPECT_EQ(config->log_level, "debug");
    EXPECT_EQ(config->origin.base_url, "https://objects.example.com/bucket");
    EXPECT_EQ(config->origin.host_header, "objects.internal");
    EXPECT_EQ(config->origin.connect_timeout_sec, 3);
    EXPECT_EQ(config->origin.transfer_timeout_sec, 60);
    EXPECT_FALSE(config->origin.verify_ssl);
    EXPECT_EQ(config->cache.type, "disk");
    EXPECT_EQ(config->cache.directory, "/var/cache/blocks");
}

TEST(ConfigFileTest, RejectsInvalidDocuments) {
    EXPECT_FALSE(ConfigFile::parse("not json").has_value());
    EXPECT_FALSE(ConfigFile::parse("[1, 2]").has_value());
    EXPECT_FALSE(ConfigFile::parse(R"({"block_size": "big"})").has_value());
}

TEST(ConfigFileTest, ParseClampsOutOfRangeValues) {
    auto config = ConfigFile::parse(R"({"block_size": 1000, "max_parallel": 64})");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->block_size, kMinBlockSize);
    EXPECT_EQ(config->max_parallel, kMaxParallel);
}

TEST(ConfigFileTest, ClampBoundsEveryTunable) {
    ServiceConfig c;
    c.block_size = 500 * kMiB;
    c.max_parallel = 0;
    c.read_chunk_size = 1;
    c.fetch_threads = 1;
    c.request_threads = 0;
    c.listen_port = 70000;
    c.origin.connect_timeout_sec = 0;
    c.cache.memory_capacity_bytes = -5;

    ServiceConfig out = ConfigFile::clamp(c);

    EXPECT_EQ(out.block_size, kMaxBlockSize);
    EXPECT_EQ(out.max_parallel, kMinParallel);
    EXPECT_EQ(out.read_chunk_size, kMinReadChunk);
    EXPECT_EQ(out.fetch_threads, out.max_parallel);
    EXPECT_EQ(out.request_threads, 1);
    EXPECT_EQ(out.listen_port, 65535);
    EXPECT_EQ(out.origin.connect_timeout_sec, 10);
    EXPECT_EQ(out.cache.memory_capacity_bytes, 0);
}

TEST(ConfigFileTest, FetchThreadsCoverParallelism) {
    ServiceConfig c;
    c.max_parallel = 10;
    c.fetch_threads = 4;
    EXPECT_EQ(ConfigFile::clamp(c).fetch_threads, 10);
}

// ── Files ──────────────────────────────────────────────────────

class ConfigFileIoTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = (fs::temp_directory_path() / "blockrange_test_config.json").string();
        fs::remove(path_);
    }
    void TearDown() override { fs::remove(path_); }

    std::string path_;
};

TEST_F(ConfigFileIoTest, SaveThenLoad) {
    ServiceConfig c;
    c.block_size = 2 * kMiB;
    c.max_parallel = 3;
    c.listen_port = 18080;
    c.origin.base_url = "http://origin.local:9000/data";
    c.cache.type = "disk";
    c.cache.directory = "/tmp/blocks";

    ASSERT_TRUE(ConfigFile::save(path_, c));
    auto loaded = ConfigFile::load(path_);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->block_size, c.block_size);
    EXPECT_EQ(loaded->max_parallel, c.max_parallel);
    EXPECT_EQ(loaded->listen_port, c.listen_port);
    EXPECT_EQ(loaded->origin.base_url, c.origin.base_url);
    EXPECT_EQ(loaded->cache.type, "disk");
    EXPECT_EQ(loaded->cache.directory, "/tmp/blocks");
}

TEST_F(ConfigFileIoTest, MissingFileIsNullopt) {
    EXPECT_FALSE(ConfigFile::load(path_).has_value());
}

TEST_F(ConfigFileIoTest, CorruptFileIsNullopt) {
    {
        std::ofstream ofs(path_);
        ofs << "{ \"block_size\": ";
    }
    EXPECT_FALSE(ConfigFile::load(path_).has_value());
}

// ── x-sc-conf ──────────────────────────────────────────────────

TEST(ConfHeaderTest, AppliesBothKeys) {
    RequestTunables defaults;
    RequestTunables t = applyConfHeader(defaults, "b=2097152,p=3");
    EXPECT_EQ(t.block_size, 2 * kMiB);
    EXPECT_EQ(t.max_parallel, 3);
}

TEST(ConfHeaderTest, ToleratesWhitespace) {
    RequestTunables t = applyConfHeader(RequestTunables{}, " p = 7 , b= 1048576 ");
    EXPECT_EQ(t.max_parallel, 7);
    EXPECT_EQ(t.block_size, kMiB);
}

TEST(ConfHeaderTest, OutOfRangeValuesAreIgnored) {
    RequestTunables defaults;
    defaults.block_size = 4 * kMiB;
    defaults.max_parallel = 2;

    RequestTunables t = applyConfHeader(defaults, "b=1024,p=11");
    EXPECT_EQ(t.block_size, 4 * kMiB);
    EXPECT_EQ(t.max_parallel, 2);

    t = applyConfHeader(defaults, "b=52428801,p=0");
    EXPECT_EQ(t.block_size, 4 * kMiB);
    EXPECT_EQ(t.max_parallel, 2);
}

TEST(ConfHeaderTest, BoundsAreInclusive) {
    RequestTunables t = applyConfHeader(RequestTunables{}, "b=52428800,p=10");
    EXPECT_EQ(t.block_size, kMaxBlockSize);
    EXPECT_EQ(t.max_parallel, kMaxParallel);
    t = applyConfHeader(RequestTunables{}, "p=1");
    EXPECT_EQ(t.max_parallel, 1);
}

TEST(ConfHeaderTest, GarbageAndUnknownKeysAreIgnored) {
    RequestTunables defaults;
    RequestTunables t = applyConfHeader(defaults, "r=65536,p=abc,b=-1,x,=5,b=");
    EXPECT_EQ(t.block_size, defaults.block_size);
    EXPECT_EQ(t.max_parallel, defaults.max_parallel);
    EXPECT_EQ(applyConfHeader(defaults, "").block_size, defaults.block_size);
}
