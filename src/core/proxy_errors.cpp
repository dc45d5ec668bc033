#include "proxy_errors.h"

const char* fetchErrorKindName(FetchErrorKind kind) {
    switch (kind) {
        case FetchErrorKind::None:          return "none";
        case FetchErrorKind::Timeout:       return "timeout";
        case FetchErrorKind::Connection:    return "connection";
        case FetchErrorKind::HttpStatus:    return "http-status";
        case FetchErrorKind::Protocol:      return "protocol";
        case FetchErrorKind::SizeMismatch:  return "size-mismatch";
        case FetchErrorKind::Unsatisfiable: return "unsatisfiable";
    }
    return "unknown";
}
