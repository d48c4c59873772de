#include <linkguard/connectivity/probe_runner.h>

#include <linkguard/core/log.h>
#include <linkguard/net/address.h>

#include <chrono>
#include <functional>
#include <optional>
#include <utility>

namespace linkguard::connectivity {
namespace {

using Clock = std::chrono::steady_clock;

struct GuardedOutcome {
    int attempts = 0;
    bool exhausted = false;
    Status status;
    bool circuit_open = false;
};

GuardedOutcome RunGuarded(
    const ContextPtr& ctx,
    resilience::CircuitBreaker& breaker,
    const resilience::RetryExecutor& retry,
    const std::function<Status()>& op,
    std::string_view what) {
    GuardedOutcome out;
    out.status = breaker.Execute([&] {
        auto r = retry.Execute(ctx, op, what);
        out.attempts = r.attempts;
        out.exhausted = r.exhausted;
        return r.status;
    });
    out.circuit_open = out.status.code() == StatusCode::circuit_open;
    return out;
}

std::chrono::milliseconds Since(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

// Retries before the verdict. A probe that used up every attempt, or was cut short by
// cancellation, reports all of its attempts.
int RetryCount(const GuardedOutcome& out) {
    if (!out.status.ok() && (out.exhausted || out.status.IsCancellation())) {
        return out.attempts;
    }
    return out.attempts > 1 ? out.attempts - 1 : 0;
}

void Finalize(ProbeResult& r, const GuardedOutcome& out, const resilience::CircuitBreaker& breaker, Clock::time_point start) {
    r.success = out.status.ok();
    r.error = out.status;
    r.circuit_open = out.circuit_open;
    r.retry_count = RetryCount(out);
    r.duration = Since(start);

    r.details["circuit_open"] = out.circuit_open;
    r.details["circuit_state"] = std::string(resilience::CircuitStateName(breaker.state()));
    r.details["retry_count"] = std::int64_t{r.retry_count};
    r.details["attempts"] = std::int64_t{out.attempts};
    if (!r.success) {
        r.details["error"] = out.status.message();
        r.details["error_type"] = ClassifyError(out.status);
    }
}

void LogCompletion(const ProbeResult& r) {
    if (r.success) {
        linkguard::log::debug("{} {} ok in {}ms (retries={})", ProbeKindName(r.kind), r.target, r.duration.count(), r.retry_count);
        return;
    }
    linkguard::log::debug("{} {} failed in {}ms (retries={} circuit_open={}): {}",
        ProbeKindName(r.kind), r.target, r.duration.count(), r.retry_count, r.circuit_open, r.error.ToString());
}

std::string TimeoutMessage(std::string_view what, std::chrono::milliseconds timeout) {
    return std::string(what) + " timed out after " + std::to_string(timeout.count()) + "ms";
}

} // namespace

std::string ClassifyError(const Status& status) {
    switch (status.code()) {
        case StatusCode::timeout:
        case StatusCode::deadline_exceeded:
            return "timeout";
        case StatusCode::unavailable:
            return "connection";
        case StatusCode::circuit_open:
            return "circuit_open";
        default:
            return "other";
    }
}

ProbeResult MakeRejectedResult(ProbeKind kind, std::string target, Status error) {
    ProbeResult r;
    r.kind = kind;
    r.target = std::move(target);
    r.timestamp = std::chrono::system_clock::now();
    r.details["error"] = error.message();
    r.details["error_type"] = ClassifyError(error);
    r.details["circuit_open"] = false;
    r.details["retry_count"] = std::int64_t{0};
    r.details["attempts"] = std::int64_t{0};
    r.error = std::move(error);
    return r;
}

ProbeRunner::ProbeRunner(
    const TesterOptions& opts,
    std::shared_ptr<net::IProbeTransport> transport,
    resilience::CircuitBreaker& dns_breaker,
    resilience::CircuitBreaker& http_breaker)
    : opts_(opts),
      transport_(std::move(transport)),
      dns_breaker_(dns_breaker),
      http_breaker_(http_breaker),
      retry_(opts.retry) {}

ProbeResult ProbeRunner::ProbeTcp(const ContextPtr& ctx, const std::string& target) const {
    auto start = Clock::now();

    auto hp = net::SplitHostPort(target);
    if (!hp.ok()) {
        auto r = MakeRejectedResult(ProbeKind::tcp_handshake, target,
            Status(StatusCode::invalid_argument, "TCP handshake target " + target + ": " + hp.status().message()));
        r.details["server"] = target;
        r.details["timeout_ms"] = std::int64_t{opts_.connection_timeout.count()};
        return r;
    }

    ProbeResult r;
    r.kind = ProbeKind::tcp_handshake;
    r.target = target;
    r.timestamp = std::chrono::system_clock::now();
    r.details["server"] = target;
    r.details["timeout_ms"] = std::int64_t{opts_.connection_timeout.count()};

    auto out = RunGuarded(ctx, dns_breaker_, retry_,
        [&] { return transport_->Dial(ctx, target, opts_.connection_timeout); },
        "TCP handshake to " + target);

    Finalize(r, out, dns_breaker_, start);
    LogCompletion(r);
    return r;
}

ProbeResult ProbeRunner::ProbeDns(const ContextPtr& ctx, const std::string& server) const {
    auto start = Clock::now();
    const auto& domains = opts_.dns_test_domains;
    const auto total = static_cast<std::int64_t>(domains.size());

    auto hp = net::SplitHostPort(server);
    if (!hp.ok() || domains.empty()) {
        auto err = !hp.ok()
            ? Status(StatusCode::invalid_argument, "dns server " + server + ": " + hp.status().message())
            : Status(StatusCode::invalid_argument, "no DNS test domains configured");
        auto r = MakeRejectedResult(ProbeKind::dns_resolution, server, std::move(err));
        r.details["server"] = server;
        r.details["timeout_ms"] = std::int64_t{opts_.connection_timeout.count()};
        r.details["total_domains"] = total;
        r.details["successful_resolutions"] = std::int64_t{0};
        return r;
    }

    ProbeResult r;
    r.kind = ProbeKind::dns_resolution;
    r.target = server;
    r.timestamp = std::chrono::system_clock::now();
    r.details["server"] = server;
    r.details["timeout_ms"] = std::int64_t{opts_.connection_timeout.count()};
    r.details["total_domains"] = total;

    // per-domain outcome of the latest attempt
    std::int64_t resolved = 0;
    Details resolutions;

    auto attempt = [&]() -> Status {
        resolved = 0;
        resolutions.clear();

        // one connection timeout for the whole domain list
        auto attempt_ctx = Context::WithTimeout(ctx, opts_.connection_timeout);
        for (const auto& domain : domains) {
            const auto key = "resolution." + domain;
            auto res = transport_->Resolve(attempt_ctx, server, domain, opts_.connection_timeout);
            if (res.ok() && res.value() > 0) {
                ++resolved;
                resolutions[key] = "resolved to " + std::to_string(res.value()) + " IPs";
                continue;
            }
            if (res.ok()) {
                resolutions[key] = std::string("no IPs returned");
                continue;
            }
            if (ctx->Done()) {
                return ctx->Err();
            }

            auto st = res.status();
            if (st.code() == StatusCode::invalid_argument) {
                // misconfiguration: every domain would fail the same way
                resolutions[key] = "failed: " + st.message();
                return st;
            }
            if (st.IsCancellation()) {
                st = Status(StatusCode::timeout, TimeoutMessage("dns lookup of " + domain + " via " + server, opts_.connection_timeout));
            }
            resolutions[key] = st.code() == StatusCode::not_found ? std::string("no IPs returned") : "failed: " + st.message();
        }

        if (MeetsLightweightQuorum(static_cast<int>(resolved), static_cast<int>(total))) {
            return Status::Ok();
        }
        return Status(StatusCode::unavailable,
            "insufficient successful resolutions: " + std::to_string(resolved) + "/" + std::to_string(total));
    };

    auto out = RunGuarded(ctx, dns_breaker_, retry_, attempt, "dns resolution via " + server);

    r.details["successful_resolutions"] = resolved;
    for (auto& [k, v] : resolutions) {
        r.details[k] = std::move(v);
    }
    Finalize(r, out, dns_breaker_, start);
    LogCompletion(r);
    return r;
}

ProbeResult ProbeRunner::ProbeHttp(const ContextPtr& ctx, const std::string& url) const {
    auto start = Clock::now();

    auto parsed = net::ParseUrl(url);
    if (!parsed.ok()) {
        auto r = MakeRejectedResult(ProbeKind::http_connectivity, url, parsed.status());
        r.details["http_host"] = url;
        r.details["timeout_ms"] = std::int64_t{opts_.http_timeout.count()};
        return r;
    }
    const auto& target = parsed.value();

    ProbeResult r;
    r.kind = ProbeKind::http_connectivity;
    r.target = url;
    r.timestamp = std::chrono::system_clock::now();
    r.details["http_host"] = url;
    r.details["timeout_ms"] = std::int64_t{opts_.http_timeout.count()};

    std::optional<net::HttpClientResponse> last;
    auto attempt = [&]() -> Status {
        last.reset();
        auto res = transport_->Head(ctx, target, opts_.user_agent, opts_.http_timeout);
        if (!res.ok()) {
            return res.status();
        }
        last = res.value();
        if (last->status >= 400) {
            return Status(StatusCode::unavailable, "HTTP request returned status " + std::to_string(last->status));
        }
        return Status::Ok();
    };

    auto out = RunGuarded(ctx, http_breaker_, retry_, attempt, "HEAD " + url);

    if (last) {
        r.details["status_code"] = std::int64_t{last->status};
        r.details["status"] = last->reason.empty() ? std::to_string(last->status) : std::to_string(last->status) + " " + last->reason;
        r.details["host"] = target.HostHeader();
    }
    Finalize(r, out, http_breaker_, start);
    if (!r.success && last && last->status >= 400) {
        // the server answered; the path is fine
        r.details["error_type"] = std::string("other");
    }
    LogCompletion(r);
    return r;
}

} // namespace linkguard::connectivity
