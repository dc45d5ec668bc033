#include "http_engine.h"

#include <atomic>
#include <cctype>
#include <mutex>
#include <curl/curl.h>

namespace {

std::once_flag g_curl_init;

} // anonymous namespace

// ── Pimpl ──────────────────────────────────────────────────────

struct HttpEngine::Impl {
    CURL* curl = nullptr;
    struct curl_slist* headers = nullptr;
    std::atomic<bool> cancelled{false};

    Impl() {
        std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
        curl = curl_easy_init();
        if (!curl) {
            throw HttpError("Failed to initialise CURL easy handle");
        }
    }

    ~Impl() {
        freeHeaders();
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }

    void freeHeaders() {
        if (headers) {
            curl_slist_free_all(headers);
            headers = nullptr;
        }
    }

    void reset() {
        curl_easy_reset(curl);
        freeHeaders();
    }

    // ── Common configuration applied to every request ──────────
    void applyConfig(const HttpConfig& config) {
        curl_easy_setopt(curl, CURLOPT_USERAGENT, config.user_agent.c_str());

        headers = curl_slist_append(headers, "Accept: */*");
        // Blocks are cached byte-exact; never let the origin compress them.
        headers = curl_slist_append(headers, "Accept-Encoding: identity");
        if (!config.host_header.empty()) {
            std::string host = "Host: " + config.host_header;
            headers = curl_slist_append(headers, host.c_str());
        }
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

        curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, config.max_redirects > 0 ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(config.max_redirects));

        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, config.verify_ssl ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, config.verify_ssl ? 2L : 0L);

        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(config.connect_timeout_sec));
        if (config.transfer_timeout_sec > 0)
            curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(config.transfer_timeout_sec));

        // Low-speed abort: detect stalled connections
        if (config.low_speed_limit > 0) {
            curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, static_cast<long>(config.low_speed_limit));
            curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(config.low_speed_time));
        }

        if (config.buffer_size > 0) {
            curl_easy_setopt(curl, CURLOPT_BUFFERSIZE, config.buffer_size);
        }
    }
};

// ── Static helpers ─────────────────────────────────────────────

namespace {

/// Trim leading/trailing whitespace.
std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return {};
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

struct ResponseContext {
    HttpResponse response;
    int64_t max_body_bytes = 0;
    bool body_overflow = false;
    std::atomic<bool>* cancelled = nullptr;
};

size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total = size * nitems;
    auto* ctx = static_cast<ResponseContext*>(userdata);
    std::string line(buffer, total);

    // A new status line starts a new response (redirect or 100-continue).
    if (line.compare(0, 5, "HTTP/") == 0) {
        ctx->response.headers.clear();
        return total;
    }

    auto colon = line.find(':');
    if (colon == std::string::npos) return total;

    ctx->response.headers.emplace_back(trim(line.substr(0, colon)),
                                       trim(line.substr(colon + 1)));
    return total;
}

size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<ResponseContext*>(userdata);
    size_t total = size * nmemb;

    if (ctx->cancelled && ctx->cancelled->load(std::memory_order_relaxed)) {
        return 0; // returning 0 aborts the transfer
    }

    if (ctx->max_body_bytes > 0 &&
        static_cast<int64_t>(ctx->response.body.size() + total) > ctx->max_body_bytes) {
        ctx->body_overflow = true;
        return 0;
    }

    ctx->response.body.append(ptr, total);
    return total;
}

/// CURL progress callback – used solely to check the cancel flag.
int progressFunction(void* clientp,
                     curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                     curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    auto* cancelled = static_cast<std::atomic<bool>*>(clientp);
    if (cancelled && cancelled->load(std::memory_order_relaxed)) {
        return 1; // non-zero aborts the transfer
    }
    return 0;
}

bool isTimeoutCurlCode(CURLcode code) {
    return code == CURLE_OPERATION_TIMEDOUT;
}

} // anonymous namespace

bool headerNameEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::vector<std::string> HttpResponse::headerValues(const std::string& name) const {
    std::vector<std::string> values;
    for (const auto& [field, value] : headers) {
        if (headerNameEquals(field, name)) {
            values.push_back(value);
        }
    }
    return values;
}

// ── HttpEngine public API ──────────────────────────────────────

HttpEngine::HttpEngine() : impl_(std::make_unique<Impl>()) {}

HttpEngine::~HttpEngine() = default;

HttpResponse HttpEngine::get(const std::string& url,
                             int64_t range_first,
                             int64_t range_last,
                             const HttpConfig& config) {
    if (impl_->cancelled.load(std::memory_order_relaxed)) {
        throw HttpError("Request cancelled");
    }

    impl_->reset();
    CURL* curl = impl_->curl;

    ResponseContext ctx;
    ctx.max_body_bytes = config.max_body_bytes;
    ctx.cancelled = &impl_->cancelled;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);

    // Cancel support
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progressFunction);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &impl_->cancelled);

    // Range header; must outlive curl_easy_perform
    std::string range;
    if (range_first >= 0) {
        range = std::to_string(range_first) + "-";
        if (range_last >= 0) {
            range += std::to_string(range_last);
        }
        curl_easy_setopt(curl, CURLOPT_RANGE, range.c_str());
    }

    impl_->applyConfig(config);

    CURLcode res = curl_easy_perform(curl);

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    if (res != CURLE_OK) {
        if (impl_->cancelled.load()) {
            throw HttpError("Request cancelled", static_cast<int>(res), http_code);
        }
        if (ctx.body_overflow) {
            throw HttpError("Response body exceeds " + std::to_string(config.max_body_bytes)
                            + " bytes", static_cast<int>(res), http_code);
        }
        throw HttpError(std::string("Request failed: ") + curl_easy_strerror(res),
                        static_cast<int>(res), http_code, isTimeoutCurlCode(res));
    }

    ctx.response.status = http_code;
    return std::move(ctx.response);
}

void HttpEngine::cancel() {
    impl_->cancelled.store(true, std::memory_order_relaxed);
}
