#pragma once

#include <chrono>
#include <optional>
#include <string_view>

#include <linkguard/connectivity/probe_result.h>
#include <linkguard/connectivity/summary.h>

namespace linkguard::connectivity {

enum class Strategy {
    lightweight_only = 0,
    escalated_to_comprehensive,
    lightweight_fallback,
};

std::string_view StrategyName(Strategy strategy);

struct TieredResult {
    Strategy strategy = Strategy::lightweight_only;
    LightweightSuiteResult lightweight;
    // present iff strategy == escalated_to_comprehensive
    std::optional<ComprehensiveSuiteResult> comprehensive;
    // success of the tier that decided the outcome
    bool overall_success = false;
    // strategy == lightweight_only
    bool short_circuited = false;
    std::chrono::milliseconds total_duration{0};
    std::chrono::system_clock::time_point timestamp{};

    TieredSummary Summary() const;
};

} // namespace linkguard::connectivity
