#pragma once

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

/// Per-request HTTP configuration.
struct HttpConfig {
    int connect_timeout_sec = 10;
    int transfer_timeout_sec = 60;   // 0 = no total transfer timeout
    int low_speed_limit = 1000;      // abort if speed drops below 1000 bytes/sec
    int low_speed_time = 30;         // ... for 30 seconds
    int max_redirects = 5;
    long buffer_size = 65536;        // libcurl receive buffer (CURLOPT_BUFFERSIZE)
    int64_t max_body_bytes = 0;      // abort once the body grows past this; 0 = unlimited
    bool verify_ssl = true;
    std::string host_header;         // overrides the Host header when set
    std::string user_agent = "blockrange_proxy/1.0";
};

/// Status line, header fields and body of one HTTP response.
struct HttpResponse {
    long status = 0;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    /// All values of a header field (case-insensitive name match), in order.
    std::vector<std::string> headerValues(const std::string& name) const;
};

/// Exception thrown on transport errors. HTTP error statuses are not
/// exceptions; they are returned in HttpResponse::status.
class HttpError : public std::runtime_error {
public:
    explicit HttpError(const std::string& what,
                       int curl_code = 0,
                       long http_status = 0,
                       bool timed_out = false)
        : std::runtime_error(what),
          curl_code_(curl_code),
          http_status_(http_status),
          timed_out_(timed_out) {}

    int curlCode() const noexcept { return curl_code_; }
    long httpStatus() const noexcept { return http_status_; }
    bool isTimeout() const noexcept { return timed_out_; }

private:
    int curl_code_;
    long http_status_;
    bool timed_out_;
};

/// Case-insensitive ASCII comparison of header names.
bool headerNameEquals(const std::string& a, const std::string& b);

/// Synchronous HTTP engine wrapping a libcurl easy handle (Pimpl).
/// Each instance owns one CURL handle – not thread-safe; use one per thread.
/// A single attempt is made per call: retry policy belongs to the caller.
class HttpEngine {
public:
    HttpEngine();
    ~HttpEngine();

    HttpEngine(const HttpEngine&) = delete;
    HttpEngine& operator=(const HttpEngine&) = delete;

    /// GET url, optionally restricted to bytes [range_first, range_last].
    /// range_first < 0 requests the whole resource; range_last < 0 leaves
    /// the range open-ended.
    /// @throws HttpError on transport failure, timeout or cancellation.
    HttpResponse get(const std::string& url,
                     int64_t range_first,
                     int64_t range_last,
                     const HttpConfig& config);

    /// Cancel the current in-flight request (safe to call from another thread).
    void cancel();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
