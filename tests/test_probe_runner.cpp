#include <chtest.hpp>

#include <linkguard/connectivity/probe_runner.h>

#include "fake_transport.h"

#include <memory>
#include <string>
#include <utility>

using linkguard::Context;
using linkguard::StatusCode;
using linkguard::connectivity::ClassifyError;
using linkguard::connectivity::DetailToString;
using linkguard::connectivity::ProbeKind;
using linkguard::connectivity::ProbeRunner;
using linkguard::connectivity::TesterOptions;
using linkguard::resilience::CircuitBreaker;
using linkguard::resilience::CircuitState;
using linkguard::testing::FakeTransport;

using namespace std::chrono_literals;

namespace {

TesterOptions FastOptions() {
    TesterOptions opt;
    opt.connection_timeout = 200ms;
    opt.http_timeout = 300ms;
    opt.retry.max_attempts = 3;
    opt.retry.base_delay = 1ms;
    opt.retry.max_delay = 2ms;
    opt.dns_breaker.failure_threshold = 3;
    opt.dns_breaker.reset_timeout = 60000ms;
    opt.http_breaker = opt.dns_breaker;
    return opt;
}

struct Harness {
    explicit Harness(TesterOptions o = FastOptions()) : opt(std::move(o)) {}

    TesterOptions opt;
    std::shared_ptr<FakeTransport> transport = std::make_shared<FakeTransport>();
    CircuitBreaker dns{opt.dns_breaker, "dns"};
    CircuitBreaker http{opt.http_breaker, "http"};
    ProbeRunner runner{opt, transport, dns, http};
};

std::string Detail(const linkguard::connectivity::ProbeResult& r, const std::string& key) {
    auto it = r.details.find(key);
    return it == r.details.end() ? std::string("<missing>") : DetailToString(it->second);
}

} // namespace

TEST_CASE("ProbeTcp success records target and no retries") {
    Harness h;
    h.transport->reachable.insert("10.0.0.1:53");

    auto r = h.runner.ProbeTcp(Context::Background(), "10.0.0.1:53");
    REQUIRE(r.kind == ProbeKind::tcp_handshake);
    REQUIRE(r.success);
    REQUIRE(r.error.ok());
    REQUIRE(r.retry_count == 0);
    REQUIRE(!r.circuit_open);
    REQUIRE(Detail(r, "server") == "10.0.0.1:53");
    REQUIRE(Detail(r, "timeout_ms") == "200");
    REQUIRE(Detail(r, "circuit_state") == "closed");
    REQUIRE(Detail(r, "error") == "<missing>");
}

TEST_CASE("ProbeTcp failure is retried and classified") {
    Harness h;

    auto r = h.runner.ProbeTcp(Context::Background(), "10.0.0.9:53");
    REQUIRE(!r.success);
    REQUIRE(r.error.code() == StatusCode::unavailable);
    REQUIRE(h.transport->DialsTo("10.0.0.9:53") == 3);
    // every attempt used up
    REQUIRE(r.retry_count == 3);
    REQUIRE(Detail(r, "retry_count") == "3");
    REQUIRE(Detail(r, "attempts") == "3");
    REQUIRE(Detail(r, "error_type") == "connection");
    REQUIRE(Detail(r, "error").find("10.0.0.9:53") != std::string::npos);

    // one failed probe is one breaker failure, whatever the retries
    REQUIRE(h.dns.consecutive_failures() == 1);
}

TEST_CASE("ProbeTcp rejects malformed targets without touching the breaker") {
    Harness h;

    auto r = h.runner.ProbeTcp(Context::Background(), "no-port");
    REQUIRE(!r.success);
    REQUIRE(r.error.code() == StatusCode::invalid_argument);
    REQUIRE(h.transport->dials.load() == 0);
    REQUIRE(h.dns.consecutive_failures() == 0);
    REQUIRE(Detail(r, "error_type") == "other");
}

TEST_CASE("Open breaker short-circuits probes") {
    Harness h;
    for (int i = 0; i < 3; ++i) {
        REQUIRE(!h.runner.ProbeTcp(Context::Background(), "10.0.0.9:53").success);
    }
    REQUIRE(h.dns.state() == CircuitState::open);
    auto dials = h.transport->dials.load();

    h.transport->reachable.insert("10.0.0.1:53");
    auto r = h.runner.ProbeTcp(Context::Background(), "10.0.0.1:53");
    REQUIRE(!r.success);
    REQUIRE(r.circuit_open);
    REQUIRE(r.error.code() == StatusCode::circuit_open);
    REQUIRE(r.retry_count == 0);
    REQUIRE(Detail(r, "circuit_open") == "true");
    REQUIRE(Detail(r, "circuit_state") == "open");
    REQUIRE(Detail(r, "error_type") == "circuit_open");
    REQUIRE(h.transport->dials.load() == dials);

    // DNS shares the TCP breaker, HTTP does not
    h.transport->resolvers.insert("10.0.0.1:53");
    REQUIRE(h.runner.ProbeDns(Context::Background(), "10.0.0.1:53").circuit_open);
    h.transport->http_status["example.com"] = 200;
    REQUIRE(h.runner.ProbeHttp(Context::Background(), "https://example.com").success);
}

TEST_CASE("ProbeDns applies the half-of-domains rule") {
    auto opt = FastOptions();
    opt.dns_test_domains = {"a.test", "b.test", "c.test", "d.test"};
    Harness h(opt);
    h.transport->resolvers.insert("10.0.0.53:53");
    h.transport->unknown_domains = {"c.test", "d.test"};

    auto r = h.runner.ProbeDns(Context::Background(), "10.0.0.53:53");
    REQUIRE(r.kind == ProbeKind::dns_resolution);
    REQUIRE(r.success);
    REQUIRE(Detail(r, "successful_resolutions") == "2");
    REQUIRE(Detail(r, "total_domains") == "4");
    REQUIRE(Detail(r, "resolution.a.test") == "resolved to 2 IPs");
    REQUIRE(Detail(r, "resolution.c.test").find("failed: ") == 0);

    h.transport->unknown_domains.insert("b.test");
    auto f = h.runner.ProbeDns(Context::Background(), "10.0.0.53:53");
    REQUIRE(!f.success);
    REQUIRE(f.error.message() == "insufficient successful resolutions: 1/4");
    REQUIRE(Detail(f, "successful_resolutions") == "1");
}

TEST_CASE("ProbeDns unreachable resolver fails every domain") {
    auto opt = FastOptions();
    opt.dns_test_domains = {"a.test"};
    Harness h(opt);

    auto r = h.runner.ProbeDns(Context::Background(), "10.0.0.99:53");
    REQUIRE(!r.success);
    REQUIRE(Detail(r, "server") == "10.0.0.99:53");
    REQUIRE(Detail(r, "successful_resolutions") == "0");
    REQUIRE(Detail(r, "resolution.a.test").find("connection refused") != std::string::npos);
    REQUIRE(h.transport->resolves.load() == 3);
}

TEST_CASE("ProbeDns lookups cut off by the attempt deadline read as timed out") {
    auto opt = FastOptions();
    opt.connection_timeout = 30ms;
    opt.retry.max_attempts = 1;
    opt.dns_test_domains = {"a.test", "b.test"};
    Harness h(opt);
    h.transport->hang = true;

    auto r = h.runner.ProbeDns(Context::Background(), "10.0.0.99:53");
    REQUIRE(!r.success);
    REQUIRE(Detail(r, "error_type") == "connection");
    REQUIRE(Detail(r, "resolution.a.test").find("timed out") != std::string::npos);
    REQUIRE(Detail(r, "resolution.b.test").find("timed out") != std::string::npos);
}

TEST_CASE("ProbeHttp records status and passes below 400") {
    Harness h;
    h.transport->http_status["example.com"] = 204;
    h.transport->http_status["example.org:8080"] = 503;

    auto ok = h.runner.ProbeHttp(Context::Background(), "https://example.com");
    REQUIRE(ok.kind == ProbeKind::http_connectivity);
    REQUIRE(ok.success);
    REQUIRE(Detail(ok, "status_code") == "204");
    REQUIRE(Detail(ok, "status") == "204 OK");
    REQUIRE(Detail(ok, "host") == "example.com");
    REQUIRE(Detail(ok, "http_host") == "https://example.com");
    REQUIRE(Detail(ok, "timeout_ms") == "300");
    REQUIRE(h.transport->last_user_agent == "linkguard/1.0");

    auto bad = h.runner.ProbeHttp(Context::Background(), "http://example.org:8080/");
    REQUIRE(!bad.success);
    REQUIRE(bad.error.message() == "HTTP request returned status 503");
    REQUIRE(Detail(bad, "status_code") == "503");
    REQUIRE(Detail(bad, "host") == "example.org:8080");
    REQUIRE(Detail(bad, "error_type") == "other");
}

TEST_CASE("ProbeHttp rejects unsupported URLs without a request") {
    Harness h;

    auto r = h.runner.ProbeHttp(Context::Background(), "ftp://example.com");
    REQUIRE(!r.success);
    REQUIRE(r.error.code() == StatusCode::invalid_argument);
    REQUIRE(h.transport->heads.load() == 0);
    REQUIRE(h.http.consecutive_failures() == 0);
}

TEST_CASE("Cancelled probes carry the cancellation and leave the breaker alone") {
    Harness h;
    auto ctx = Context::WithCancel(Context::Background());
    ctx->Cancel();

    auto r = h.runner.ProbeTcp(ctx, "10.0.0.9:53");
    REQUIRE(!r.success);
    REQUIRE(r.error.IsCancellation());
    REQUIRE(h.dns.consecutive_failures() == 0);
}

TEST_CASE("ClassifyError buckets status codes") {
    REQUIRE(ClassifyError(linkguard::Status(StatusCode::timeout, "")) == "timeout");
    REQUIRE(ClassifyError(linkguard::Status(StatusCode::deadline_exceeded, "")) == "timeout");
    REQUIRE(ClassifyError(linkguard::Status(StatusCode::unavailable, "")) == "connection");
    REQUIRE(ClassifyError(linkguard::Status(StatusCode::circuit_open, "")) == "circuit_open");
    REQUIRE(ClassifyError(linkguard::Status(StatusCode::not_found, "")) == "other");
}

TEST_CASE("ProbeTcp recovered on a later attempt counts the retries before it") {
    Harness h;
    h.transport->reachable.insert("10.0.0.1:53");
    h.transport->refuse_first = 1;

    auto r = h.runner.ProbeTcp(Context::Background(), "10.0.0.1:53");
    REQUIRE(r.success);
    REQUIRE(r.retry_count == 1);
    REQUIRE(Detail(r, "attempts") == "2");
}

TEST_CASE("ProbeDns with a misconfigured resolver is neither retried nor held against the breaker") {
    auto opt = FastOptions();
    opt.dns_test_domains = {"a.test", "b.test"};
    Harness h(opt);
    h.transport->malformed_servers.insert("dns.bad:53");

    for (int i = 0; i < 5; ++i) {
        auto r = h.runner.ProbeDns(Context::Background(), "dns.bad:53");
        REQUIRE(!r.success);
        REQUIRE(r.error.code() == StatusCode::invalid_argument);
        REQUIRE(!r.circuit_open);
        REQUIRE(r.retry_count == 0);
        REQUIRE(Detail(r, "error_type") == "other");
        REQUIRE(Detail(r, "resolution.a.test").find("failed: ") == 0);
    }
    // one lookup per probe: the first domain stops the attempt
    REQUIRE(h.transport->resolves.load() == 5);
    REQUIRE(h.dns.consecutive_failures() == 0);
    REQUIRE(h.dns.state() == CircuitState::closed);

    // TCP handshakes sharing the breaker are unaffected
    h.transport->reachable.insert("10.0.0.1:53");
    REQUIRE(h.runner.ProbeTcp(Context::Background(), "10.0.0.1:53").success);
}
