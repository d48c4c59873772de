#include <linkguard/connectivity/lightweight_suite.h>

#include <linkguard/core/fan_out.h>
#include <linkguard/core/log.h>

#include <utility>

namespace linkguard::connectivity {

LightweightTestSuite::LightweightTestSuite(
    const ProbeRunner& runner,
    std::vector<std::string> targets,
    std::chrono::milliseconds connection_timeout)
    : runner_(runner), targets_(std::move(targets)), deadline_(connection_timeout * 4) {}

linkguard::Result<LightweightSuiteResult> LightweightTestSuite::Run(const ContextPtr& ctx) const {
    if (!ctx) {
        return Status(StatusCode::invalid_argument, "context is null");
    }
    if (targets_.empty()) {
        return Status(StatusCode::failed_precondition, "no TCP targets configured");
    }
    if (ctx->Done()) {
        return ctx->Err();
    }

    const auto start = std::chrono::steady_clock::now();
    LightweightSuiteResult out;
    out.timestamp = std::chrono::system_clock::now();
    out.results.resize(targets_.size());

    linkguard::log::debug("lightweight tests: {} targets, deadline {}ms", targets_.size(), deadline_.count());

    auto suite_ctx = Context::WithTimeout(ctx, deadline_);
    FanOut(targets_.size(), [&](std::size_t i) {
        const auto& target = targets_[i];
        if (target.empty()) {
            auto r = MakeRejectedResult(ProbeKind::tcp_handshake, target,
                Status(StatusCode::invalid_argument, "empty target at index " + std::to_string(i)));
            r.details["server"] = target;
            out.results[i] = std::move(r);
            return;
        }
        out.results[i] = runner_.ProbeTcp(suite_ctx, target);
    });

    // no partial aggregate once the caller gave up
    if (ctx->Done()) {
        return ctx->Err();
    }

    for (const auto& r : out.results) {
        if (r.success) {
            ++out.success_count;
        } else {
            ++out.failure_count;
        }
    }
    out.overall_success = MeetsLightweightQuorum(out.success_count, static_cast<int>(out.results.size()));
    out.duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    linkguard::log::debug("lightweight tests: {}/{} succeeded in {}ms, overall_success={}",
        out.success_count, out.results.size(), out.duration.count(), out.overall_success);
    return out;
}

} // namespace linkguard::connectivity
