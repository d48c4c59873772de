#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <chjson/chjson.hpp>

namespace linkguard::connectivity {

struct LightweightSummary {
    bool success = false;
    int success_count = 0;
    int failure_count = 0;
    std::int64_t duration_ms = 0;
};

struct ComprehensiveSummary {
    bool success = false;
    int success_count = 0;
    int failure_count = 0;
    int dns_tests = 0;
    int http_tests = 0;
    std::int64_t duration_ms = 0;
    std::string escalated_from;
};

// Flat projection of a TieredResult for logs and telemetry collaborators.
struct TieredSummary {
    std::string strategy;
    bool overall_success = false;
    bool short_circuited = false;
    std::int64_t total_duration_ms = 0;
    LightweightSummary lightweight;
    std::optional<ComprehensiveSummary> comprehensive;

    // "comprehensive" is omitted when absent.
    chjson::value ToJson() const;
    std::string ToJsonString() const;
};

} // namespace linkguard::connectivity
