#include "origin.h"

#include <algorithm>
#include <cctype>

namespace {

bool parseNumber(const std::string& s, int64_t& out) {
    if (s.empty() || s.size() > 18) return false;
    if (!std::all_of(s.begin(), s.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return false;
    }
    out = std::stoll(s);
    return true;
}

OriginError protocolError(const std::string& what) {
    return OriginError(what, FetchErrorKind::Protocol);
}

} // anonymous namespace

ContentRange parseContentRange(const std::string& value) {
    auto space = value.find(' ');
    if (space == std::string::npos || value.substr(0, space) != "bytes") {
        throw protocolError("content-range not bytes: " + value);
    }
    const std::string field = value.substr(space + 1);

    auto slash = field.find('/');
    if (slash == std::string::npos) {
        throw protocolError("cannot parse content-range: " + value);
    }
    const std::string range = field.substr(0, slash);
    const std::string total = field.substr(slash + 1);

    if (total == "*") {
        throw protocolError("unknown complete length in content-range not supported");
    }
    if (range == "*") {
        throw protocolError("unsatisfied range in content-range not supported");
    }

    ContentRange cr;
    if (!parseNumber(total, cr.total_size)) {
        throw protocolError("content-range complete length: " + value);
    }
    if (cr.total_size == 0) {
        throw protocolError("zero complete length in content-range");
    }

    auto dash = range.find('-');
    if (dash == std::string::npos ||
        !parseNumber(range.substr(0, dash), cr.first) ||
        !parseNumber(range.substr(dash + 1), cr.last)) {
        throw protocolError("cannot parse range in content-range: " + value);
    }
    if (cr.last < cr.first) {
        throw protocolError("content-range upper bound lower than lower bound");
    }
    if (cr.first >= cr.total_size) {
        throw protocolError("content-range lower bound not lower than complete length");
    }
    if (cr.last >= cr.total_size) {
        throw protocolError("content-range upper bound not lower than complete length");
    }
    return cr;
}

int64_t parseUnsatisfiedContentRange(const std::string& value) {
    const std::string prefix = "bytes */";
    if (value.compare(0, prefix.size(), prefix) != 0) {
        return -1;
    }
    int64_t total = -1;
    if (!parseNumber(value.substr(prefix.size()), total)) {
        return -1;
    }
    return total;
}
