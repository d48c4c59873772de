#pragma once

#include <chrono>
#include <string>
#include <vector>

#include <linkguard/resilience/circuit_breaker.h>
#include <linkguard/resilience/retry.h>

namespace linkguard::connectivity {

std::vector<std::string> DefaultDnsServers();
std::vector<std::string> DefaultHttpUrls();
std::vector<std::string> DefaultDnsTestDomains();

inline constexpr const char* kDefaultUserAgent = "linkguard/1.0";

struct TesterOptions {
    std::chrono::milliseconds connection_timeout{5000};
    std::chrono::milliseconds http_timeout{10000};

    // resolvers for the DNS probes; ":53" is appended when no port is given
    std::vector<std::string> dns_servers = DefaultDnsServers();
    std::vector<std::string> http_urls = DefaultHttpUrls();
    // lightweight TCP targets; the DNS servers when empty
    std::vector<std::string> tcp_targets;
    std::vector<std::string> dns_test_domains = DefaultDnsTestDomains();
    std::string user_agent = kDefaultUserAgent;

    resilience::RetryOptions retry;
    // shared by the TCP handshake and DNS probes
    resilience::CircuitBreakerOptions dns_breaker;
    resilience::CircuitBreakerOptions http_breaker;
};

} // namespace linkguard::connectivity
