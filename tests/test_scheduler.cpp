#include <chtest.hpp>

#include <linkguard/connectivity/scheduler.h>

#include "fake_transport.h"

#include <memory>

using linkguard::Context;
using linkguard::connectivity::SchedulePolicy;
using linkguard::connectivity::Scheduler;
using linkguard::connectivity::Strategy;
using linkguard::connectivity::TesterOptions;
using linkguard::connectivity::TieredResult;
using linkguard::connectivity::TieredTester;
using linkguard::testing::FakeTransport;

using namespace std::chrono_literals;

namespace {

TesterOptions FastOptions() {
    TesterOptions opt;
    opt.connection_timeout = 200ms;
    opt.http_timeout = 300ms;
    opt.retry.max_attempts = 1;
    opt.dns_breaker.failure_threshold = 100;
    opt.http_breaker.failure_threshold = 100;
    opt.dns_servers = {"10.0.0.1", "10.0.0.2"};
    opt.http_urls = {"https://a.example"};
    opt.dns_test_domains = {"example.com"};
    return opt;
}

std::shared_ptr<FakeTransport> HealthyNetwork() {
    auto t = std::make_shared<FakeTransport>();
    t->reachable = {"10.0.0.1:53", "10.0.0.2:53"};
    return t;
}

TieredResult Previous(Strategy strategy, bool success) {
    TieredResult r;
    r.strategy = strategy;
    r.overall_success = success;
    r.short_circuited = strategy == Strategy::lightweight_only;
    return r;
}

} // namespace

TEST_CASE("Scheduler first cycle with no history does not force") {
    TieredTester tester(FastOptions(), HealthyNetwork());
    Scheduler s(tester);

    REQUIRE(!s.ShouldForceComprehensive(nullptr, 0));
    REQUIRE(!s.ShouldForceComprehensive(nullptr, 2));

    auto r = s.ScheduleTests(Context::Background(), nullptr, 0);
    REQUIRE(r.ok());
    REQUIRE(r.value().strategy == Strategy::lightweight_only);
    REQUIRE(r.value().short_circuited);
}

TEST_CASE("Scheduler forces comprehensive after repeated failures") {
    TieredTester tester(FastOptions(), HealthyNetwork());
    Scheduler s(tester);

    REQUIRE(s.ShouldForceComprehensive(nullptr, 3));
    REQUIRE(s.ShouldForceComprehensive(nullptr, 7));

    // healthy lightweight tier, still not short-circuited
    auto r = s.ScheduleTests(Context::Background(), nullptr, 3);
    REQUIRE(r.ok());
    REQUIRE(r.value().lightweight.overall_success);
    REQUIRE(!r.value().short_circuited);
    REQUIRE(r.value().strategy == Strategy::escalated_to_comprehensive);
}

TEST_CASE("Scheduler forces comprehensive after a failed escalation") {
    TieredTester tester(FastOptions(), HealthyNetwork());
    Scheduler s(tester);

    auto failed = Previous(Strategy::escalated_to_comprehensive, false);
    auto passed = Previous(Strategy::escalated_to_comprehensive, true);
    auto fallback = Previous(Strategy::lightweight_fallback, false);

    REQUIRE(s.ShouldForceComprehensive(&failed, 1));
    REQUIRE(!s.ShouldForceComprehensive(&passed, 1));
    REQUIRE(!s.ShouldForceComprehensive(&fallback, 1));

    auto r = s.ScheduleTests(Context::Background(), &failed, 1);
    REQUIRE(r.ok());
    REQUIRE(!r.value().short_circuited);
}

TEST_CASE("Scheduler periodic audit fires on multiples of the interval") {
    TieredTester tester(FastOptions(), HealthyNetwork());
    Scheduler s(tester);
    auto last = Previous(Strategy::lightweight_only, true);

    REQUIRE(s.ShouldForceComprehensive(&last, 0));
    REQUIRE(s.ShouldForceComprehensive(&last, 10));
    REQUIRE(s.ShouldForceComprehensive(&last, 20));
    REQUIRE(!s.ShouldForceComprehensive(&last, 1));
    REQUIRE(!s.ShouldForceComprehensive(&last, 2));
}

TEST_CASE("Scheduler policy is configurable") {
    TieredTester tester(FastOptions(), HealthyNetwork());
    SchedulePolicy policy;
    policy.failure_threshold = 5;
    policy.periodic_interval = 0;
    Scheduler s(tester, policy);
    auto last = Previous(Strategy::lightweight_only, true);

    REQUIRE(!s.ShouldForceComprehensive(&last, 0));
    REQUIRE(!s.ShouldForceComprehensive(&last, 4));
    REQUIRE(s.ShouldForceComprehensive(&last, 5));
    REQUIRE(s.policy().periodic_interval == 0);
}
