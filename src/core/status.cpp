#include <linkguard/core/status.h>

namespace linkguard {

std::string_view StatusCodeName(StatusCode code) {
    switch (code) {
        case StatusCode::ok: return "ok";
        case StatusCode::invalid_argument: return "invalid_argument";
        case StatusCode::failed_precondition: return "failed_precondition";
        case StatusCode::not_found: return "not_found";
        case StatusCode::timeout: return "timeout";
        case StatusCode::unavailable: return "unavailable";
        case StatusCode::circuit_open: return "circuit_open";
        case StatusCode::cancelled: return "cancelled";
        case StatusCode::deadline_exceeded: return "deadline_exceeded";
        case StatusCode::internal_error: return "internal_error";
    }
    return "unknown";
}

std::string Status::ToString() const {
    if (ok()) {
        return "ok";
    }
    std::string out(StatusCodeName(code_));
    if (!message_.empty()) {
        out.append(": ");
        out.append(message_);
    }
    return out;
}

} // namespace linkguard
