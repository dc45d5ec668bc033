#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

/// Why a block could not be produced.
enum class FetchErrorKind {
    None,
    Timeout,        // origin did not answer in time
    Connection,     // transport-level failure (DNS, refused, reset, TLS)
    HttpStatus,     // origin answered with an error status
    Protocol,       // origin answer was malformed or did not match the request
    SizeMismatch,   // origin reported a different total size mid-request
    Unsatisfiable   // origin says the requested range lies beyond the object
};

const char* fetchErrorKindName(FetchErrorKind kind);

/// The requested range is malformed or lies outside the object (HTTP 416).
class RangeNotSatisfiable : public std::runtime_error {
public:
    explicit RangeNotSatisfiable(const std::string& what,
                                 int64_t object_size = -1)
        : std::runtime_error(what),
          object_size_(object_size) {}

    /// Total object size, or -1 when it was not known at the time of failure.
    int64_t objectSize() const noexcept { return object_size_; }

private:
    int64_t object_size_;
};

/// A block of the plan could not be obtained (HTTP 502 / 504).
class OriginFetchFailed : public std::runtime_error {
public:
    explicit OriginFetchFailed(const std::string& what,
                               FetchErrorKind kind = FetchErrorKind::Connection,
                               int64_t block_index = -1,
                               long http_status = 0)
        : std::runtime_error(what),
          kind_(kind),
          block_index_(block_index),
          http_status_(http_status) {}

    FetchErrorKind kind() const noexcept { return kind_; }
    int64_t blockIndex() const noexcept { return block_index_; }
    long httpStatus() const noexcept { return http_status_; }
    bool isTimeout() const noexcept { return kind_ == FetchErrorKind::Timeout; }

private:
    FetchErrorKind kind_;
    int64_t block_index_;
    long http_status_;
};

/// Trimmed byte accounting disagrees with the plan. Internal defect (HTTP 500).
class AssemblyMismatch : public std::runtime_error {
public:
    explicit AssemblyMismatch(const std::string& what)
        : std::runtime_error(what) {}
};
