#include <linkguard/connectivity/tiered_tester.h>

#include <linkguard/core/log.h>
#include <linkguard/net/address.h>

#include <stdexcept>
#include <utility>

namespace linkguard::connectivity {
namespace {

TesterOptions Normalize(TesterOptions opts) {
    if (opts.connection_timeout.count() <= 0) {
        throw std::invalid_argument("connection timeout must be positive");
    }
    if (opts.http_timeout.count() <= 0) {
        throw std::invalid_argument("HTTP timeout must be positive");
    }
    if (opts.dns_test_domains.empty()) {
        throw std::invalid_argument("at least one DNS test domain is required");
    }

    for (auto& server : opts.dns_servers) {
        if (!server.empty()) {
            server = net::WithDefaultPort(server, "53");
        }
    }
    if (opts.tcp_targets.empty()) {
        opts.tcp_targets = opts.dns_servers;
    }
    if (opts.user_agent.empty()) {
        opts.user_agent = kDefaultUserAgent;
    }
    return opts;
}

std::shared_ptr<net::IProbeTransport> OrDefault(std::shared_ptr<net::IProbeTransport> transport) {
    if (transport) {
        return transport;
    }
    return std::make_shared<net::AsioProbeTransport>();
}

} // namespace

TieredTester::TieredTester(TesterOptions opts, std::shared_ptr<net::IProbeTransport> transport)
    : opts_(Normalize(std::move(opts))),
      transport_(OrDefault(std::move(transport))),
      dns_breaker_(opts_.dns_breaker, "dns"),
      http_breaker_(opts_.http_breaker, "http"),
      runner_(opts_, transport_, dns_breaker_, http_breaker_),
      lightweight_(runner_, opts_.tcp_targets, opts_.connection_timeout),
      comprehensive_(runner_, opts_.dns_servers, opts_.http_urls, opts_.connection_timeout, opts_.http_timeout) {}

linkguard::Result<LightweightSuiteResult> TieredTester::RunLightweight(const ContextPtr& ctx) {
    return lightweight_.Run(ctx);
}

linkguard::Result<ComprehensiveSuiteResult> TieredTester::RunComprehensive(const ContextPtr& ctx) {
    return comprehensive_.Run(ctx);
}

linkguard::Result<ComprehensiveSuiteResult> TieredTester::RunComprehensiveEscalated(const ContextPtr& ctx) {
    return comprehensive_.Run(ctx, kEscalatedFromLightweight);
}

linkguard::Result<TieredResult> TieredTester::RunTiered(const ContextPtr& ctx, bool force_comprehensive) {
    const auto start = std::chrono::steady_clock::now();

    TieredResult out;
    out.timestamp = std::chrono::system_clock::now();

    auto light = RunLightweight(ctx);
    if (!light.ok()) {
        if (light.status().IsCancellation()) {
            return light.status();
        }
        return Status(light.status().code(), "lightweight tests failed: " + light.status().message());
    }
    out.lightweight = std::move(light).value();

    const bool need_comprehensive = force_comprehensive || !out.lightweight.overall_success;
    if (!need_comprehensive) {
        out.strategy = Strategy::lightweight_only;
        out.overall_success = out.lightweight.overall_success;
        out.short_circuited = true;
    } else {
        linkguard::log::debug("escalating to comprehensive tests (lightweight_success={}, forced={})",
            out.lightweight.overall_success, force_comprehensive);

        auto deep = RunComprehensiveEscalated(ctx);
        if (!deep.ok()) {
            if (ctx->Done()) {
                return ctx->Err();
            }
            linkguard::log::warn("comprehensive tests could not run, using lightweight results: {}", deep.status().ToString());
            out.strategy = Strategy::lightweight_fallback;
            out.overall_success = out.lightweight.overall_success;
        } else {
            out.strategy = Strategy::escalated_to_comprehensive;
            out.comprehensive = std::move(deep).value();
            out.overall_success = out.comprehensive->overall_success;
        }
        out.short_circuited = false;
    }

    out.total_duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    linkguard::log::info("tiered tests: strategy={} overall_success={} short_circuited={} total_duration={}ms",
        StrategyName(out.strategy), out.overall_success, out.short_circuited, out.total_duration.count());
    return out;
}

} // namespace linkguard::connectivity
