#pragma once

#include <chrono>
#include <string>
#include <vector>

#include <linkguard/connectivity/probe_result.h>
#include <linkguard/connectivity/probe_runner.h>
#include <linkguard/core/context.h>
#include <linkguard/core/status.h>

namespace linkguard::connectivity {

// One TCP handshake per target, all in parallel, bounded by 4x the connection timeout.
// Passes when at least half of the targets answer.
class LightweightTestSuite {
public:
    LightweightTestSuite(const ProbeRunner& runner, std::vector<std::string> targets, std::chrono::milliseconds connection_timeout);

    // Thread-safe. Errors: invalid_argument (null ctx), failed_precondition (no targets),
    // or the caller's cancellation. Failing probes are data, not errors.
    linkguard::Result<LightweightSuiteResult> Run(const ContextPtr& ctx) const;

    const std::vector<std::string>& targets() const { return targets_; }

private:
    const ProbeRunner& runner_;
    std::vector<std::string> targets_;
    std::chrono::milliseconds deadline_;
};

} // namespace linkguard::connectivity
