#include <chtest.hpp>

#include <linkguard/connectivity/comprehensive_suite.h>
#include <linkguard/connectivity/lightweight_suite.h>
#include <linkguard/connectivity/tiered_tester.h>

#include "fake_transport.h"

#include <chrono>
#include <memory>
#include <string>
#include <thread>

using linkguard::Context;
using linkguard::ContextPtr;
using linkguard::StatusCode;
using linkguard::connectivity::ComprehensiveTestSuite;
using linkguard::connectivity::DetailToString;
using linkguard::connectivity::LightweightTestSuite;
using linkguard::connectivity::MeetsComprehensiveQuorum;
using linkguard::connectivity::MeetsLightweightQuorum;
using linkguard::connectivity::ProbeRunner;
using linkguard::connectivity::TesterOptions;
using linkguard::connectivity::TieredTester;
using linkguard::resilience::CircuitBreaker;
using linkguard::testing::FakeTransport;

using namespace std::chrono_literals;

namespace {

TesterOptions FastOptions() {
    TesterOptions opt;
    opt.connection_timeout = 200ms;
    opt.http_timeout = 300ms;
    opt.retry.max_attempts = 2;
    opt.retry.base_delay = 1ms;
    opt.retry.max_delay = 2ms;
    // keep breakers out of the way of the aggregation rules
    opt.dns_breaker.failure_threshold = 100;
    opt.http_breaker.failure_threshold = 100;
    opt.dns_servers = {"10.0.0.1", "10.0.0.2", "10.0.0.3", "10.0.0.4"};
    opt.http_urls = {"https://a.example", "https://b.example"};
    opt.dns_test_domains = {"example.com"};
    return opt;
}

void CancelAfter(const ContextPtr& ctx, std::chrono::milliseconds d) {
    std::thread([ctx, d] {
        std::this_thread::sleep_for(d);
        ctx->Cancel();
    }).detach();
}

} // namespace

TEST_CASE("quorum rules") {
    REQUIRE(MeetsLightweightQuorum(2, 4));
    REQUIRE(!MeetsLightweightQuorum(1, 4));
    REQUIRE(MeetsLightweightQuorum(1, 1));
    REQUIRE(!MeetsLightweightQuorum(0, 0));

    REQUIRE(MeetsComprehensiveQuorum(3, 5));
    REQUIRE(!MeetsComprehensiveQuorum(2, 5));
    REQUIRE(MeetsComprehensiveQuorum(6, 10));
    REQUIRE(!MeetsComprehensiveQuorum(0, 0));
}

TEST_CASE("Lightweight suite: half of the targets reachable passes") {
    auto transport = std::make_shared<FakeTransport>();
    transport->reachable = {"10.0.0.1:53", "10.0.0.3:53"};
    TieredTester tester(FastOptions(), transport);

    auto r = tester.RunLightweight(Context::Background());
    REQUIRE(r.ok());
    const auto& s = r.value();
    REQUIRE(s.results.size() == 4);
    REQUIRE(s.success_count == 2);
    REQUIRE(s.failure_count == 2);
    REQUIRE(s.overall_success);

    // slots follow target order
    for (std::size_t i = 0; i < s.results.size(); ++i) {
        auto expected = "10.0.0." + std::to_string(i + 1) + ":53";
        REQUIRE(s.results[i].target == expected);
        REQUIRE(DetailToString(s.results[i].details.at("server")) == expected);
    }
    REQUIRE(s.results[0].success);
    REQUIRE(!s.results[1].success);
}

TEST_CASE("Lightweight suite: one of four reachable fails") {
    auto transport = std::make_shared<FakeTransport>();
    transport->reachable = {"10.0.0.4:53"};
    TieredTester tester(FastOptions(), transport);

    auto r = tester.RunLightweight(Context::Background());
    REQUIRE(r.ok());
    REQUIRE(r.value().success_count == 1);
    REQUIRE(r.value().failure_count == 3);
    REQUIRE(!r.value().overall_success);
}

TEST_CASE("Lightweight suite: explicit tcp targets replace the DNS servers") {
    auto opt = FastOptions();
    opt.tcp_targets = {"10.9.9.9:443"};
    auto transport = std::make_shared<FakeTransport>();
    transport->reachable = {"10.9.9.9:443"};
    TieredTester tester(opt, transport);

    auto r = tester.RunLightweight(Context::Background());
    REQUIRE(r.ok());
    REQUIRE(r.value().results.size() == 1);
    REQUIRE(r.value().overall_success);
    REQUIRE(transport->DialsTo("10.0.0.1:53") == 0);
}

TEST_CASE("Lightweight suite: empty target becomes a failed probe") {
    auto opt = FastOptions();
    opt.tcp_targets = {"10.0.0.1:53", "", "10.0.0.2:53"};
    auto transport = std::make_shared<FakeTransport>();
    transport->reachable = {"10.0.0.1:53", "10.0.0.2:53"};
    TieredTester tester(opt, transport);

    auto r = tester.RunLightweight(Context::Background());
    REQUIRE(r.ok());
    const auto& bad = r.value().results[1];
    REQUIRE(!bad.success);
    REQUIRE(bad.error.code() == StatusCode::invalid_argument);
    REQUIRE(bad.error.message() == "empty target at index 1");
    REQUIRE(r.value().success_count == 2);
    REQUIRE(r.value().overall_success);
}

TEST_CASE("Lightweight suite: structural errors fail the call") {
    auto opt = FastOptions();
    auto transport = std::make_shared<FakeTransport>();
    CircuitBreaker dns(opt.dns_breaker);
    CircuitBreaker http(opt.http_breaker);
    ProbeRunner runner(opt, transport, dns, http);

    LightweightTestSuite none(runner, {}, opt.connection_timeout);
    REQUIRE(none.Run(Context::Background()).status().code() == StatusCode::failed_precondition);

    LightweightTestSuite some(runner, {"10.0.0.1:53"}, opt.connection_timeout);
    REQUIRE(some.Run(nullptr).status().code() == StatusCode::invalid_argument);
    REQUIRE(transport->dials.load() == 0);
}

TEST_CASE("Lightweight suite: the suite deadline bounds slow probes") {
    auto opt = FastOptions();
    opt.connection_timeout = 20ms;
    opt.retry.max_attempts = 50;
    opt.retry.base_delay = 5ms;
    opt.retry.max_delay = 5ms;
    auto transport = std::make_shared<FakeTransport>();
    transport->hang = true;
    TieredTester tester(opt, transport);

    auto start = std::chrono::steady_clock::now();
    auto r = tester.RunLightweight(Context::Background());
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(r.ok());
    REQUIRE(r.value().failure_count == 4);
    REQUIRE(!r.value().overall_success);
    REQUIRE(elapsed < 1000ms);
    REQUIRE(r.value().results[0].error.code() == StatusCode::deadline_exceeded);
}

TEST_CASE("Lightweight suite: caller cancellation is the call error") {
    auto opt = FastOptions();
    opt.connection_timeout = 5000ms;
    auto transport = std::make_shared<FakeTransport>();
    transport->hang = true;
    TieredTester tester(opt, transport);

    auto ctx = Context::WithCancel(Context::Background());
    CancelAfter(ctx, 30ms);

    auto start = std::chrono::steady_clock::now();
    auto r = tester.RunLightweight(ctx);
    REQUIRE(!r.ok());
    REQUIRE(r.status().code() == StatusCode::cancelled);
    REQUIRE(std::chrono::steady_clock::now() - start < 2000ms);
}

TEST_CASE("Comprehensive suite: sixty percent rule across both groups") {
    auto opt = FastOptions();
    opt.dns_servers = {"10.0.0.1", "10.0.0.2", "10.0.0.3"};
    auto transport = std::make_shared<FakeTransport>();
    transport->resolvers = {"10.0.0.1:53", "10.0.0.2:53"};
    transport->http_status = {{"a.example", 200}, {"b.example", 500}};
    TieredTester tester(opt, transport);

    auto r = tester.RunComprehensive(Context::Background());
    REQUIRE(r.ok());
    REQUIRE(r.value().dns_results.size() == 3);
    REQUIRE(r.value().http_results.size() == 2);
    REQUIRE(r.value().success_count == 3);
    REQUIRE(r.value().failure_count == 2);
    REQUIRE(r.value().overall_success);
    REQUIRE(r.value().escalated_from.empty());
    REQUIRE(r.value().dns_results[2].target == "10.0.0.3:53");
    REQUIRE(r.value().http_results[1].target == "https://b.example");

    transport->http_status["a.example"] = 404;
    auto f = tester.RunComprehensive(Context::Background());
    REQUIRE(f.ok());
    REQUIRE(f.value().success_count == 2);
    REQUIRE(!f.value().overall_success);
}

TEST_CASE("Comprehensive suite: escalated runs are tagged") {
    auto transport = std::make_shared<FakeTransport>();
    TieredTester tester(FastOptions(), transport);

    auto r = tester.RunComprehensiveEscalated(Context::Background());
    REQUIRE(r.ok());
    REQUIRE(r.value().escalated_from == "lightweight");
    REQUIRE(!r.value().overall_success);
}

TEST_CASE("Comprehensive suite: nothing to probe is a precondition error") {
    auto opt = FastOptions();
    auto transport = std::make_shared<FakeTransport>();
    CircuitBreaker dns(opt.dns_breaker);
    CircuitBreaker http(opt.http_breaker);
    ProbeRunner runner(opt, transport, dns, http);

    ComprehensiveTestSuite empty(runner, {}, {}, opt.connection_timeout, opt.http_timeout);
    REQUIRE(empty.Run(Context::Background()).status().code() == StatusCode::failed_precondition);
    REQUIRE(empty.Run(nullptr).status().code() == StatusCode::invalid_argument);

    // one group alone is enough
    transport->http_status["a.example"] = 200;
    ComprehensiveTestSuite http_only(runner, {}, {"https://a.example"}, opt.connection_timeout, opt.http_timeout);
    auto r = http_only.Run(Context::Background());
    REQUIRE(r.ok());
    REQUIRE(r.value().overall_success);
}

TEST_CASE("Comprehensive suite: caller cancellation is the call error") {
    auto opt = FastOptions();
    opt.connection_timeout = 5000ms;
    opt.http_timeout = 5000ms;
    auto transport = std::make_shared<FakeTransport>();
    transport->hang = true;
    TieredTester tester(opt, transport);

    auto ctx = Context::WithCancel(Context::Background());
    CancelAfter(ctx, 30ms);

    auto r = tester.RunComprehensive(ctx);
    REQUIRE(r.status().code() == StatusCode::cancelled);
}
