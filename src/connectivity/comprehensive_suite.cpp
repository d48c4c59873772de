#include <linkguard/connectivity/comprehensive_suite.h>

#include <linkguard/core/fan_out.h>
#include <linkguard/core/log.h>

#include <utility>

namespace linkguard::connectivity {

ComprehensiveTestSuite::ComprehensiveTestSuite(
    const ProbeRunner& runner,
    std::vector<std::string> dns_servers,
    std::vector<std::string> http_urls,
    std::chrono::milliseconds connection_timeout,
    std::chrono::milliseconds http_timeout)
    : runner_(runner),
      dns_servers_(std::move(dns_servers)),
      http_urls_(std::move(http_urls)),
      deadline_((connection_timeout + http_timeout) * 2) {}

linkguard::Result<ComprehensiveSuiteResult> ComprehensiveTestSuite::Run(const ContextPtr& ctx, std::string_view escalated_from) const {
    if (!ctx) {
        return Status(StatusCode::invalid_argument, "context is null");
    }
    if (dns_servers_.empty() && http_urls_.empty()) {
        return Status(StatusCode::failed_precondition, "no DNS servers or HTTP URLs configured");
    }
    if (ctx->Done()) {
        return ctx->Err();
    }

    const auto start = std::chrono::steady_clock::now();
    ComprehensiveSuiteResult out;
    out.timestamp = std::chrono::system_clock::now();
    out.escalated_from = std::string(escalated_from);
    out.dns_results.resize(dns_servers_.size());
    out.http_results.resize(http_urls_.size());

    linkguard::log::debug("comprehensive tests: {} dns, {} http, deadline {}ms, escalated_from='{}'",
        dns_servers_.size(), http_urls_.size(), deadline_.count(), out.escalated_from);

    auto suite_ctx = Context::WithTimeout(ctx, deadline_);
    FanOut(2, [&](std::size_t group) {
        if (group == 0) {
            FanOut(dns_servers_.size(), [&](std::size_t i) {
                out.dns_results[i] = runner_.ProbeDns(suite_ctx, dns_servers_[i]);
            });
        } else {
            FanOut(http_urls_.size(), [&](std::size_t i) {
                out.http_results[i] = runner_.ProbeHttp(suite_ctx, http_urls_[i]);
            });
        }
    });

    if (ctx->Done()) {
        return ctx->Err();
    }

    for (const auto* group : {&out.dns_results, &out.http_results}) {
        for (const auto& r : *group) {
            if (r.success) {
                ++out.success_count;
            } else {
                ++out.failure_count;
            }
        }
    }
    out.overall_success = MeetsComprehensiveQuorum(out.success_count, out.success_count + out.failure_count);
    out.duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    linkguard::log::debug("comprehensive tests: {}/{} succeeded in {}ms, overall_success={}",
        out.success_count, out.success_count + out.failure_count, out.duration.count(), out.overall_success);
    return out;
}

} // namespace linkguard::connectivity
