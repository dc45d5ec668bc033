#include "http_origin.h"

#include <utility>

HttpOrigin::HttpOrigin(std::string base_url, HttpConfig config)
    : base_url_(std::move(base_url))
    , config_(std::move(config))
{
}

std::string HttpOrigin::urlFor(const std::string& object_identity) const {
    if (!base_url_.empty() && base_url_.back() == '/' &&
        !object_identity.empty() && object_identity.front() == '/') {
        return base_url_ + object_identity.substr(1);
    }
    return base_url_ + object_identity;
}

OriginChunk HttpOrigin::fetchRange(const std::string& object_identity,
                                   int64_t offset,
                                   int64_t length) {
    if (offset < 0 || length <= 0) {
        throw OriginError("invalid block request " + std::to_string(offset)
                          + "+" + std::to_string(length), FetchErrorKind::Protocol);
    }

    HttpConfig config = config_;
    // An origin ignoring the Range header must not stream a whole object at us.
    config.max_body_bytes = length;

    HttpEngine engine;
    HttpResponse response;
    try {
        response = engine.get(urlFor(object_identity), offset, offset + length - 1, config);
    } catch (const HttpError& e) {
        throw OriginError(e.what(),
                          e.isTimeout() ? FetchErrorKind::Timeout : FetchErrorKind::Connection,
                          e.httpStatus());
    }

    return interpretResponse(std::move(response), offset, length);
}

OriginChunk HttpOrigin::interpretResponse(HttpResponse response,
                                          int64_t offset,
                                          int64_t length) {
    const long status = response.status;

    if (status == 416) {
        int64_t total = -1;
        auto values = response.headerValues("Content-Range");
        if (values.size() == 1) {
            total = parseUnsatisfiedContentRange(values.front());
        }
        throw OriginError("origin reports range " + std::to_string(offset)
                          + "+" + std::to_string(length) + " not satisfiable",
                          FetchErrorKind::Unsatisfiable, status, total);
    }

    if (status >= 400) {
        throw OriginError("origin status " + std::to_string(status),
                          FetchErrorKind::HttpStatus, status);
    }

    OriginChunk chunk;

    // A 200 is acceptable only when it is the whole object and the whole
    // object fits in the requested block.
    if (status == 200) {
        const int64_t size = static_cast<int64_t>(response.body.size());
        if (offset != 0 || size > length) {
            throw OriginError("origin ignored range request (status 200)",
                              FetchErrorKind::Protocol, status);
        }
        chunk.first = 0;
        chunk.last = size - 1;
        chunk.total_size = size;
        chunk.bytes = std::move(response.body);
        return chunk;
    }

    if (status != 206) {
        throw OriginError("fragment status code " + std::to_string(status)
                          + " rather than 206", FetchErrorKind::Protocol, status);
    }

    auto values = response.headerValues("Content-Range");
    if (values.empty()) {
        throw OriginError("missing content-range", FetchErrorKind::Protocol, status);
    }
    if (values.size() > 1) {
        throw OriginError("multiple content-range fields", FetchErrorKind::Protocol, status);
    }

    ContentRange cr = parseContentRange(values.front());
    const int64_t requested_last = offset + length - 1;
    if (cr.first != offset || cr.last > requested_last) {
        throw OriginError("fragment content range " + std::to_string(cr.first) + "-"
                          + std::to_string(cr.last) + " unexpected for request range "
                          + std::to_string(offset) + "-" + std::to_string(requested_last),
                          FetchErrorKind::Protocol, status);
    }
    if (static_cast<int64_t>(response.body.size()) != cr.last - cr.first + 1) {
        throw OriginError("truncated fragment: " + std::to_string(response.body.size())
                          + " bytes for range " + std::to_string(cr.first) + "-"
                          + std::to_string(cr.last), FetchErrorKind::Protocol, status);
    }

    chunk.first = cr.first;
    chunk.last = cr.last;
    chunk.total_size = cr.total_size;
    chunk.bytes = std::move(response.body);
    return chunk;
}
