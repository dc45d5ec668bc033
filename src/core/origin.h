#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include "proxy_errors.h"

/// Bytes returned by the origin for one range request, with the object's
/// authoritative total size.
struct OriginChunk {
    std::string bytes;
    int64_t first = 0;         // inclusive
    int64_t last = -1;         // inclusive
    int64_t total_size = -1;
};

/// Failure reported by an origin. kind() classifies it for the fetch layer.
class OriginError : public std::runtime_error {
public:
    explicit OriginError(const std::string& what,
                         FetchErrorKind kind,
                         long http_status = 0,
                         int64_t total_size = -1)
        : std::runtime_error(what),
          kind_(kind),
          http_status_(http_status),
          total_size_(total_size) {}

    FetchErrorKind kind() const noexcept { return kind_; }
    long httpStatus() const noexcept { return http_status_; }

    /// For Unsatisfiable: the object size the origin reported, if any.
    int64_t totalSize() const noexcept { return total_size_; }

private:
    FetchErrorKind kind_;
    long http_status_;
    int64_t total_size_;
};

/// Range-capable byte source the blocks are fetched from.
class Origin {
public:
    virtual ~Origin() = default;

    /// Fetch bytes [offset, offset + length) of an object. The origin may
    /// return fewer bytes when the range runs past the end of the object.
    /// @throws OriginError on any failure.
    virtual OriginChunk fetchRange(const std::string& object_identity,
                                   int64_t offset,
                                   int64_t length) = 0;
};

/// Parsed "Content-Range: bytes first-last/total" value.
struct ContentRange {
    int64_t first = 0;
    int64_t last = 0;
    int64_t total_size = 0;
};

/// Parse a Content-Range value of a 206 response.
/// Rejects unknown totals ("/*"), unsatisfied ranges ("*/n"), a zero total,
/// last < first and bounds outside the total.
/// @throws OriginError with kind Protocol.
ContentRange parseContentRange(const std::string& value);

/// Parse the "bytes */total" Content-Range value of a 416 response.
/// @return the total, or -1 when the value has another form.
int64_t parseUnsatisfiedContentRange(const std::string& value);
