#pragma once

#include <memory>
#include <string>

#include <linkguard/connectivity/probe_result.h>
#include <linkguard/connectivity/tester_options.h>
#include <linkguard/core/context.h>
#include <linkguard/net/transport.h>
#include <linkguard/resilience/circuit_breaker.h>
#include <linkguard/resilience/retry.h>

namespace linkguard::connectivity {

// "timeout", "connection", "circuit_open" or "other"
std::string ClassifyError(const Status& status);

// A failed result for a probe that never reached the breaker.
ProbeResult MakeRejectedResult(ProbeKind kind, std::string target, Status error);

// Runs single probes: the raw transport call wrapped in the retry executor, wrapped in the
// breaker of the probe class. TCP handshakes and DNS lookups share `dns_breaker`.
//
// A probe never fails as a call. Cancellation of `ctx` shows up as a failed result whose error
// IsCancellation(); the suites turn that into their call error.
class ProbeRunner {
public:
    ProbeRunner(
        const TesterOptions& opts,
        std::shared_ptr<net::IProbeTransport> transport,
        resilience::CircuitBreaker& dns_breaker,
        resilience::CircuitBreaker& http_breaker);

    // Thread-safe
    ProbeResult ProbeTcp(const ContextPtr& ctx, const std::string& target) const;

    // Thread-safe. Succeeds when at least half of the test domains resolve through `server`.
    ProbeResult ProbeDns(const ContextPtr& ctx, const std::string& server) const;

    // Thread-safe. Succeeds on a status below 400.
    ProbeResult ProbeHttp(const ContextPtr& ctx, const std::string& url) const;

private:
    const TesterOptions& opts_;
    std::shared_ptr<net::IProbeTransport> transport_;
    resilience::CircuitBreaker& dns_breaker_;
    resilience::CircuitBreaker& http_breaker_;
    resilience::RetryExecutor retry_;
};

} // namespace linkguard::connectivity
