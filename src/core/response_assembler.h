#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "block_fetcher.h"
#include "block_geometry.h"

/// Status, header fields and body handed back to the client.
struct ProxyResponse {
    int status = 200;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    /// First value of a header field (case-insensitive), or "" when absent.
    std::string header(const std::string& name) const;
    bool hasHeader(const std::string& name) const;
    void setHeader(const std::string& name, const std::string& value);
};

/// Stitch the fetched blocks of a plan into the response.
///
/// The first block is sliced from trim_start, the last block up to and
/// including trim_end, interior blocks are used whole. Status is 206 with
/// Content-Range when the plan came from a Range request, 200 otherwise.
/// Bytes are copied unchanged.
///
/// @throws AssemblyMismatch when an outcome is missing, failed, belongs to
///         another block, has the wrong length, or the stitched body does not
///         have exactly plan.contentLength() bytes.
ProxyResponse assembleResponse(const BlockPlan& plan,
                               const std::vector<FetchOutcome>& outcomes);

/// Headers-only variant: same status and headers as assembleResponse()
/// would produce, without touching block data. Used for HEAD.
ProxyResponse assembleHeaders(const BlockPlan& plan);

/// Plain-text error response.
ProxyResponse errorResponse(int status, const std::string& message);

/// 416 response; carries "Content-Range: bytes */size" when size is known.
ProxyResponse rangeNotSatisfiableResponse(int64_t object_size);

/// Reason phrase for the status codes this service emits.
const char* reasonPhrase(int status);
