#include <linkguard/connectivity/probe_result.h>

#include <sstream>

namespace linkguard::connectivity {

std::string_view ProbeKindName(ProbeKind kind) {
    switch (kind) {
        case ProbeKind::tcp_handshake: return "tcp_handshake";
        case ProbeKind::dns_resolution: return "dns_resolution";
        case ProbeKind::http_connectivity: return "http_connectivity";
    }
    return "unknown";
}

std::string DetailToString(const DetailValue& v) {
    if (const auto* s = std::get_if<std::string>(&v)) {
        return *s;
    }
    if (const auto* i = std::get_if<std::int64_t>(&v)) {
        return std::to_string(*i);
    }
    if (const auto* b = std::get_if<bool>(&v)) {
        return *b ? "true" : "false";
    }
    std::ostringstream oss;
    oss << std::get<double>(v);
    return oss.str();
}

bool MeetsLightweightQuorum(int successes, int total) {
    if (total <= 0 || successes <= 0) {
        return false;
    }
    // successes / total >= 0.5 without floating point
    return successes * 2 >= total;
}

bool MeetsComprehensiveQuorum(int successes, int total) {
    if (total <= 0) {
        return false;
    }
    // successes / total >= 0.6
    return successes * 5 >= total * 3;
}

} // namespace linkguard::connectivity
