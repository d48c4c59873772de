#pragma once

#include <memory>

#include <linkguard/connectivity/comprehensive_suite.h>
#include <linkguard/connectivity/lightweight_suite.h>
#include <linkguard/connectivity/probe_result.h>
#include <linkguard/connectivity/probe_runner.h>
#include <linkguard/connectivity/tester_options.h>
#include <linkguard/connectivity/tiered_result.h>
#include <linkguard/core/context.h>
#include <linkguard/core/status.h>
#include <linkguard/net/transport.h>
#include <linkguard/resilience/circuit_breaker.h>

namespace linkguard::connectivity {

inline constexpr const char* kEscalatedFromLightweight = "lightweight";

// Lightweight TCP handshakes first; DNS and HTTP probes only when the cheap tier fails or the
// caller forces them.
//
// Owns the two breakers (TCP/DNS and HTTP) for its whole lifetime, so consecutive runs share
// breaker state. All Run* calls are thread-safe.
class TieredTester {
public:
    // Throws std::invalid_argument on non-positive timeouts or an empty DNS test domain list.
    // DNS servers without a port get ":53"; empty tcp_targets means the DNS servers.
    // A null transport selects the Boost.Asio one.
    explicit TieredTester(TesterOptions opts, std::shared_ptr<net::IProbeTransport> transport = nullptr);

    TieredTester(const TieredTester&) = delete;
    TieredTester& operator=(const TieredTester&) = delete;

    // Errors: the lightweight tier's structural errors and the caller's cancellation.
    // A comprehensive tier that cannot run degrades to lightweight_fallback.
    linkguard::Result<TieredResult> RunTiered(const ContextPtr& ctx, bool force_comprehensive = false);

    linkguard::Result<LightweightSuiteResult> RunLightweight(const ContextPtr& ctx);

    // Standalone run, untagged.
    linkguard::Result<ComprehensiveSuiteResult> RunComprehensive(const ContextPtr& ctx);

    // Tagged as escalated from the lightweight tier.
    linkguard::Result<ComprehensiveSuiteResult> RunComprehensiveEscalated(const ContextPtr& ctx);

    const TesterOptions& options() const { return opts_; }

    resilience::CircuitBreaker& dns_breaker() { return dns_breaker_; }
    resilience::CircuitBreaker& http_breaker() { return http_breaker_; }

private:
    TesterOptions opts_;
    std::shared_ptr<net::IProbeTransport> transport_;
    resilience::CircuitBreaker dns_breaker_;
    resilience::CircuitBreaker http_breaker_;
    ProbeRunner runner_;
    LightweightTestSuite lightweight_;
    ComprehensiveTestSuite comprehensive_;
};

} // namespace linkguard::connectivity
