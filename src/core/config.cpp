#include "config.h"
#include "logger.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

// ── JSON serialization helpers ─────────────────────────────────

static json originToJson(const OriginConfig& o) {
    return json{
        {"base_url",             o.base_url},
        {"host_header",          o.host_header},
        {"connect_timeout_sec",  o.connect_timeout_sec},
        {"transfer_timeout_sec", o.transfer_timeout_sec},
        {"verify_ssl",           o.verify_ssl}
    };
}

static OriginConfig originFromJson(const json& j) {
    OriginConfig o;
    o.base_url             = j.value("base_url", o.base_url);
    o.host_header          = j.value("host_header", o.host_header);
    o.connect_timeout_sec  = j.value("connect_timeout_sec", o.connect_timeout_sec);
    o.transfer_timeout_sec = j.value("transfer_timeout_sec", o.transfer_timeout_sec);
    o.verify_ssl           = j.value("verify_ssl", o.verify_ssl);
    return o;
}

static json cacheToJson(const CacheConfig& c) {
    return json{
        {"type",                  c.type},
        {"directory",             c.directory},
        {"memory_capacity_bytes", c.memory_capacity_bytes}
    };
}

static CacheConfig cacheFromJson(const json& j) {
    CacheConfig c;
    c.type                  = j.value("type", c.type);
    c.directory             = j.value("directory", c.directory);
    c.memory_capacity_bytes = j.value("memory_capacity_bytes", c.memory_capacity_bytes);
    return c;
}

static json serviceToJson(const ServiceConfig& s) {
    return json{
        {"block_size",              s.block_size},
        {"max_parallel",            s.max_parallel},
        {"read_chunk_size",         s.read_chunk_size},
        {"fetch_threads",           s.fetch_threads},
        {"request_threads",         s.request_threads},
        {"listen_address",          s.listen_address},
        {"listen_port",             s.listen_port},
        {"log_file",                s.log_file},
        {"log_level",               s.log_level},
        {"allow_request_overrides", s.allow_request_overrides},
        {"origin",                  originToJson(s.origin)},
        {"cache",                   cacheToJson(s.cache)}
    };
}

static ServiceConfig serviceFromJson(const json& j) {
    ServiceConfig s;
    s.block_size              = j.value("block_size", s.block_size);
    s.max_parallel            = j.value("max_parallel", s.max_parallel);
    s.read_chunk_size         = j.value("read_chunk_size", s.read_chunk_size);
    s.fetch_threads           = j.value("fetch_threads", s.fetch_threads);
    s.request_threads         = j.value("request_threads", s.request_threads);
    s.listen_address          = j.value("listen_address", s.listen_address);
    s.listen_port             = j.value("listen_port", s.listen_port);
    s.log_file                = j.value("log_file", s.log_file);
    s.log_level               = j.value("log_level", s.log_level);
    s.allow_request_overrides = j.value("allow_request_overrides", s.allow_request_overrides);
    if (j.contains("origin")) {
        s.origin = originFromJson(j.at("origin"));
    }
    if (j.contains("cache")) {
        s.cache = cacheFromJson(j.at("cache"));
    }
    return s;
}

// ── ConfigFile implementation ──────────────────────────────────

bool ConfigFile::save(const std::string& path, const ServiceConfig& config) {
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        return false;
    }
    ofs << serviceToJson(config).dump(4);
    return ofs.good();
}

std::optional<ServiceConfig> ConfigFile::load(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        Logger::instance().error("cannot open config file " + path);
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << ifs.rdbuf();
    return parse(ss.str());
}

std::optional<ServiceConfig> ConfigFile::parse(const std::string& text) {
    try {
        json j = json::parse(text);
        if (!j.is_object()) {
            Logger::instance().error("config must be a JSON object");
            return std::nullopt;
        }
        return clamp(serviceFromJson(j));
    } catch (const json::exception& e) {
        Logger::instance().error(std::string("invalid config: ") + e.what());
        return std::nullopt;
    }
}

ServiceConfig ConfigFile::clamp(ServiceConfig config) {
    config.block_size = std::clamp(config.block_size, kMinBlockSize, kMaxBlockSize);
    config.max_parallel = std::clamp(config.max_parallel, kMinParallel, kMaxParallel);
    config.read_chunk_size = std::clamp(config.read_chunk_size, kMinReadChunk, kMaxReadChunk);
    // The fetch pool must hold max_parallel fetches of at least one request.
    config.fetch_threads = std::clamp(config.fetch_threads, config.max_parallel, 256);
    config.request_threads = std::clamp(config.request_threads, 1, 256);
    config.listen_port = std::clamp(config.listen_port, 0, 65535);
    if (config.origin.connect_timeout_sec < 1) {
        config.origin.connect_timeout_sec = 10;
    }
    if (config.origin.transfer_timeout_sec < 0) {
        config.origin.transfer_timeout_sec = 0;
    }
    if (config.cache.memory_capacity_bytes < 0) {
        config.cache.memory_capacity_bytes = 0;
    }
    return config;
}

// ── Per-request overrides ──────────────────────────────────────

namespace {

bool parseInt(const std::string& s, int64_t& out) {
    if (s.empty() || s.size() > 18) return false;
    if (!std::all_of(s.begin(), s.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return false;
    }
    out = std::stoll(s);
    return true;
}

} // anonymous namespace

RequestTunables applyConfHeader(const RequestTunables& defaults, const std::string& value) {
    RequestTunables t = defaults;

    std::istringstream parts(value);
    std::string part;
    while (std::getline(parts, part, ',')) {
        auto eq = part.find('=');
        if (eq == std::string::npos) continue;
        std::string key = part.substr(0, eq);
        key.erase(std::remove_if(key.begin(), key.end(),
                                 [](unsigned char c) { return std::isspace(c) != 0; }),
                  key.end());
        std::string val = part.substr(eq + 1);
        val.erase(std::remove_if(val.begin(), val.end(),
                                 [](unsigned char c) { return std::isspace(c) != 0; }),
                  val.end());

        int64_t n = 0;
        if (!parseInt(val, n)) continue;

        if (key == "b") {
            if (kMinBlockSize <= n && n <= kMaxBlockSize) t.block_size = n;
        } else if (key == "p") {
            if (kMinParallel <= n && n <= kMaxParallel) t.max_parallel = static_cast<int>(n);
        }
    }
    return t;
}
