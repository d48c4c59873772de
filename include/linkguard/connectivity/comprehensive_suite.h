#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include <linkguard/connectivity/probe_result.h>
#include <linkguard/connectivity/probe_runner.h>
#include <linkguard/core/context.h>
#include <linkguard/core/status.h>

namespace linkguard::connectivity {

// DNS probes (one per resolver) and HTTP probes (one per URL) as two parallel groups, bounded by
// 2x (connection timeout + HTTP timeout). Passes when at least 60% of all probes succeed.
class ComprehensiveTestSuite {
public:
    ComprehensiveTestSuite(
        const ProbeRunner& runner,
        std::vector<std::string> dns_servers,
        std::vector<std::string> http_urls,
        std::chrono::milliseconds connection_timeout,
        std::chrono::milliseconds http_timeout);

    // Thread-safe. `escalated_from` is empty for a standalone run.
    // Errors: invalid_argument (null ctx), failed_precondition (nothing to probe),
    // or the caller's cancellation.
    linkguard::Result<ComprehensiveSuiteResult> Run(const ContextPtr& ctx, std::string_view escalated_from = {}) const;

private:
    const ProbeRunner& runner_;
    std::vector<std::string> dns_servers_;
    std::vector<std::string> http_urls_;
    std::chrono::milliseconds deadline_;
};

} // namespace linkguard::connectivity
