#include "response_assembler.h"
#include "http_engine.h"
#include "proxy_errors.h"

// ── ProxyResponse ──────────────────────────────────────────────

std::string ProxyResponse::header(const std::string& name) const {
    for (const auto& [field, value] : headers) {
        if (headerNameEquals(field, name)) {
            return value;
        }
    }
    return {};
}

bool ProxyResponse::hasHeader(const std::string& name) const {
    for (const auto& h : headers) {
        if (headerNameEquals(h.first, name)) {
            return true;
        }
    }
    return false;
}

void ProxyResponse::setHeader(const std::string& name, const std::string& value) {
    for (auto& h : headers) {
        if (headerNameEquals(h.first, name)) {
            h.second = value;
            return;
        }
    }
    headers.emplace_back(name, value);
}

// ── Assembly ───────────────────────────────────────────────────

ProxyResponse assembleHeaders(const BlockPlan& plan) {
    ProxyResponse resp;
    resp.status = plan.partial ? 206 : 200;
    resp.setHeader("Accept-Ranges", "bytes");
    resp.setHeader("Content-Type", "application/octet-stream");
    resp.setHeader("Content-Length", std::to_string(plan.contentLength()));
    if (plan.partial) {
        resp.setHeader("Content-Range", "bytes " + std::to_string(plan.first_byte) + "-"
                       + std::to_string(plan.last_byte) + "/"
                       + std::to_string(plan.object_size));
    }
    return resp;
}

ProxyResponse assembleResponse(const BlockPlan& plan,
                               const std::vector<FetchOutcome>& outcomes) {
    if (outcomes.size() != plan.blocks.size()) {
        throw AssemblyMismatch("plan has " + std::to_string(plan.blocks.size())
            + " blocks but " + std::to_string(outcomes.size()) + " outcomes");
    }

    ProxyResponse resp = assembleHeaders(plan);
    const int64_t expected = plan.contentLength();
    resp.body.reserve(static_cast<size_t>(expected));

    const size_t n = plan.blocks.size();
    for (size_t pos = 0; pos < n; ++pos) {
        const PlannedBlock& block = plan.blocks[pos];
        const FetchOutcome& outcome = outcomes[pos];

        if (!outcome.ok) {
            throw AssemblyMismatch("block " + std::to_string(block.index)
                + " was not fetched: " + outcome.error_message);
        }
        if (outcome.block_index != block.index) {
            throw AssemblyMismatch("slot " + std::to_string(pos) + " holds block "
                + std::to_string(outcome.block_index) + ", expected "
                + std::to_string(block.index));
        }
        if (static_cast<int64_t>(outcome.bytes.size()) != block.length) {
            throw AssemblyMismatch("block " + std::to_string(block.index) + " has "
                + std::to_string(outcome.bytes.size()) + " bytes, expected "
                + std::to_string(block.length));
        }

        int64_t from = (pos == 0) ? plan.trim_start : 0;
        int64_t to = (pos == n - 1) ? plan.trim_end + 1 : block.length;
        if (from < 0 || to > block.length || from >= to) {
            throw AssemblyMismatch("invalid slice [" + std::to_string(from) + ", "
                + std::to_string(to) + ") of block " + std::to_string(block.index));
        }
        resp.body.append(outcome.bytes, static_cast<size_t>(from),
                         static_cast<size_t>(to - from));
    }

    if (static_cast<int64_t>(resp.body.size()) != expected) {
        throw AssemblyMismatch("assembled " + std::to_string(resp.body.size())
            + " bytes, Content-Length is " + std::to_string(expected));
    }
    return resp;
}

// ── Error responses ────────────────────────────────────────────

ProxyResponse errorResponse(int status, const std::string& message) {
    ProxyResponse resp;
    resp.status = status;
    resp.body = message + "\n";
    resp.setHeader("Content-Type", "text/plain; charset=utf-8");
    resp.setHeader("Content-Length", std::to_string(resp.body.size()));
    return resp;
}

ProxyResponse rangeNotSatisfiableResponse(int64_t object_size) {
    ProxyResponse resp = errorResponse(416, "Range not satisfiable");
    if (object_size >= 0) {
        resp.setHeader("Content-Range", "bytes */" + std::to_string(object_size));
    }
    return resp;
}

const char* reasonPhrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 206: return "Partial Content";
        case 400: return "Bad Request";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 416: return "Range Not Satisfiable";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
    }
    return "Unknown";
}
