#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <linkguard/core/status.h>

namespace linkguard::connectivity {

enum class ProbeKind {
    tcp_handshake = 0,
    dns_resolution,
    http_connectivity,
};

std::string_view ProbeKindName(ProbeKind kind);

using DetailValue = std::variant<std::string, std::int64_t, bool, double>;

// Diagnostic payload keyed by name. `server`, `timeout_ms`, `error`, `status_code` and
// `error_type` are parsed by other components; keep them stable.
using Details = std::map<std::string, DetailValue>;

std::string DetailToString(const DetailValue& v);

struct ProbeResult {
    ProbeKind kind = ProbeKind::tcp_handshake;
    std::string target;
    bool success = false;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{};
    // attempts - 1 on success; all attempts when they ran out or were cancelled
    int retry_count = 0;
    // the breaker rejected the probe; the network was not touched
    bool circuit_open = false;
    // ok() when the probe succeeded
    Status error;
    Details details;
};

struct LightweightSuiteResult {
    std::vector<ProbeResult> results; // one per target, in target order
    int success_count = 0;
    int failure_count = 0;
    bool overall_success = false;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{};
};

struct ComprehensiveSuiteResult {
    std::vector<ProbeResult> dns_results;  // one per resolver, in configured order
    std::vector<ProbeResult> http_results; // one per URL, in configured order
    int success_count = 0;
    int failure_count = 0;
    bool overall_success = false;
    std::string escalated_from; // empty for a standalone run
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{};
};

// successes > 0 and successes / total >= 0.5
bool MeetsLightweightQuorum(int successes, int total);

// total > 0 and successes / total >= 0.6
bool MeetsComprehensiveQuorum(int successes, int total);

} // namespace linkguard::connectivity
