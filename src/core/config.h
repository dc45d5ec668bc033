#pragma once
#include <string>
#include <cstdint>
#include <optional>

struct OriginConfig {
    std::string base_url;           // identity (request path) is appended
    std::string host_header;        // Host sent to the origin; empty = from URL
    int connect_timeout_sec = 10;
    int transfer_timeout_sec = 60;
    bool verify_ssl = true;
};

struct CacheConfig {
    std::string type = "memory";    // "memory" or "disk"
    std::string directory;          // disk store location
    int64_t memory_capacity_bytes = 512LL * 1024 * 1024;
};

struct ServiceConfig {
    int64_t block_size = 1024 * 1024;
    int max_parallel = 5;
    int64_t read_chunk_size = 65536;
    int fetch_threads = 32;
    int request_threads = 8;
    std::string listen_address = "127.0.0.1";
    int listen_port = 8080;
    std::string log_file;
    std::string log_level = "info";
    bool allow_request_overrides = true;
    OriginConfig origin;
    CacheConfig cache;
};

// Allowed ranges for the tunables.
constexpr int64_t kMinBlockSize = 1024 * 1024;
constexpr int64_t kMaxBlockSize = 50 * 1024 * 1024;
constexpr int kMinParallel = 1;
constexpr int kMaxParallel = 10;
constexpr int64_t kMinReadChunk = 1024;
constexpr int64_t kMaxReadChunk = 1024 * 1024;

class ConfigFile {
public:
    /// Serialize a ServiceConfig to JSON and write it to a file.
    static bool save(const std::string& path, const ServiceConfig& config);

    /// Read a ServiceConfig from a JSON file. Absent keys keep their defaults;
    /// out-of-range values are clamped (see clamp()).
    static std::optional<ServiceConfig> load(const std::string& path);

    /// Parse a ServiceConfig from JSON text.
    static std::optional<ServiceConfig> parse(const std::string& text);

    /// Clamp every tunable into its allowed range.
    static ServiceConfig clamp(ServiceConfig config);
};

/// Tunables a single request may override.
struct RequestTunables {
    int64_t block_size = 1024 * 1024;
    int max_parallel = 5;
};

/// Apply an "x-sc-conf: b=<block>,p=<parallel>" header value on top of the
/// defaults. A key is applied only when its value parses and lies in the
/// allowed range; anything else, including unknown keys, is ignored.
RequestTunables applyConfHeader(const RequestTunables& defaults, const std::string& value);
