#include "block_geometry.h"
#include "proxy_errors.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return {};
    auto end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

/// Parse a decimal byte position. Only digits are accepted.
bool parsePosition(const std::string& s, int64_t& out) {
    if (s.empty() || s.size() > 18) return false;
    if (!std::all_of(s.begin(), s.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return false;
    }
    out = std::stoll(s);
    return true;
}

} // anonymous namespace

// ── Range header ───────────────────────────────────────────────

std::optional<RequestedRange> parseRangeHeader(const std::vector<std::string>& values) {
    if (values.empty()) {
        return std::nullopt;
    }
    if (values.size() > 1) {
        throw RangeNotSatisfiable("multiple range fields");
    }

    const std::string value = trim(values.front());
    auto eq = value.find('=');
    if (eq == std::string::npos || trim(value.substr(0, eq)) != "bytes") {
        throw RangeNotSatisfiable("range not bytes: " + value);
    }

    const std::string range_spec = trim(value.substr(eq + 1));
    if (range_spec.find(',') != std::string::npos) {
        throw RangeNotSatisfiable("multiple ranges not supported: " + value);
    }

    auto dash = range_spec.find('-');
    if (dash == std::string::npos) {
        throw RangeNotSatisfiable("cannot parse requested range: " + value);
    }
    const std::string first_str = trim(range_spec.substr(0, dash));
    const std::string last_str = trim(range_spec.substr(dash + 1));

    if (first_str.empty()) {
        throw RangeNotSatisfiable("suffix range not supported: " + value);
    }

    RequestedRange range;
    if (!parsePosition(first_str, range.first)) {
        throw RangeNotSatisfiable("range lower bound: " + value);
    }
    if (last_str.empty()) {
        range.last = -1;
        return range;
    }
    if (!parsePosition(last_str, range.last)) {
        throw RangeNotSatisfiable("range upper bound: " + value);
    }
    if (range.last < range.first) {
        throw RangeNotSatisfiable("range upper bound lower than lower bound: " + value);
    }
    return range;
}

// ── Block arithmetic ───────────────────────────────────────────

int64_t blockCount(int64_t object_size, int64_t block_size) {
    if (block_size <= 0) {
        throw std::invalid_argument("block_size must be > 0");
    }
    if (object_size <= 0) {
        return 0;
    }
    return (object_size + block_size - 1) / block_size;
}

int64_t blockLength(int64_t object_size, int64_t block_size, int64_t index) {
    const int64_t offset = index * block_size;
    if (index < 0 || offset >= object_size) {
        throw std::out_of_range("block " + std::to_string(index)
            + " outside object of " + std::to_string(object_size) + " bytes");
    }
    return std::min(block_size, object_size - offset);
}

int64_t firstBlockIndex(int64_t block_size, const std::optional<RequestedRange>& range) {
    if (block_size <= 0) {
        throw std::invalid_argument("block_size must be > 0");
    }
    return range ? range->first / block_size : 0;
}

BlockPlan planBlocks(int64_t object_size,
                     int64_t block_size,
                     const std::optional<RequestedRange>& range) {
    if (block_size <= 0) {
        throw std::invalid_argument("block_size must be > 0");
    }
    if (object_size < 0) {
        throw std::invalid_argument("object_size must be >= 0");
    }

    BlockPlan plan;
    plan.object_size = object_size;
    plan.block_size = block_size;
    plan.partial = range.has_value();

    if (!range) {
        // Whole object. An empty object yields an empty plan.
        if (object_size == 0) {
            return plan;
        }
        plan.first_byte = 0;
        plan.last_byte = object_size - 1;
    } else {
        if (range->first >= object_size) {
            throw RangeNotSatisfiable("range start " + std::to_string(range->first)
                + " not lower than object size " + std::to_string(object_size),
                object_size);
        }
        int64_t last = range->isOpen() ? object_size - 1 : range->last;
        if (last >= object_size) {
            throw RangeNotSatisfiable("range end " + std::to_string(last)
                + " not lower than object size " + std::to_string(object_size),
                object_size);
        }
        plan.first_byte = range->first;
        plan.last_byte = last;
    }

    const int64_t first_block = plan.first_byte / block_size;
    const int64_t last_block = plan.last_byte / block_size;
    plan.trim_start = plan.first_byte % block_size;
    plan.trim_end = plan.last_byte % block_size;

    plan.blocks.reserve(static_cast<size_t>(last_block - first_block + 1));
    for (int64_t i = first_block; i <= last_block; ++i) {
        PlannedBlock b;
        b.index = i;
        b.offset = i * block_size;
        b.length = std::min(block_size, object_size - b.offset);
        plan.blocks.push_back(b);
    }

    return plan;
}
