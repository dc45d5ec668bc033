#pragma once

#include <string>

#include "http_engine.h"
#include "origin.h"

/// Origin reached over HTTP(S) through libcurl.
///
/// The object identity is appended to base_url to form the request URL.
/// Every call uses its own HttpEngine, so one HttpOrigin serves any number
/// of fetch threads.
class HttpOrigin : public Origin {
public:
    HttpOrigin(std::string base_url, HttpConfig config);

    OriginChunk fetchRange(const std::string& object_identity,
                           int64_t offset,
                           int64_t length) override;

    /// Validate a raw response to a request for [offset, offset + length).
    /// @throws OriginError when it cannot be used as that block.
    static OriginChunk interpretResponse(HttpResponse response,
                                         int64_t offset,
                                         int64_t length);

    std::string urlFor(const std::string& object_identity) const;

private:
    std::string base_url_;
    HttpConfig config_;
};
