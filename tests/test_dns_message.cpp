#include <chtest.hpp>

#include <linkguard/net/dns_message.h>

#include "dns_reply.h"

namespace dns = linkguard::net::dns;
using linkguard::StatusCode;

TEST_CASE("dns BuildQuery encodes header and question") {
    auto q = dns::BuildQuery(0xBEEF, "www.example.com.");
    REQUIRE(q.ok());
    const auto& b = q.value();

    REQUIRE(b.size() == dns::kHeaderSize + 17 + 4);
    REQUIRE(b[0] == 0xBE);
    REQUIRE(b[1] == 0xEF);
    REQUIRE(b[2] == 0x01); // RD
    REQUIRE(b[5] == 1);    // QDCOUNT
    REQUIRE(b[12] == 3);
    REQUIRE(b[13] == 'w');
    REQUIRE(b[16] == 7);
    REQUIRE(b[28] == 0);
    REQUIRE(b[b.size() - 3] == dns::kTypeA);
    REQUIRE(b[b.size() - 1] == dns::kClassIn);
}

TEST_CASE("dns BuildQuery rejects malformed names") {
    REQUIRE(dns::BuildQuery(1, "").status().code() == StatusCode::invalid_argument);
    REQUIRE(dns::BuildQuery(1, "a..b").status().code() == StatusCode::invalid_argument);
    REQUIRE(dns::BuildQuery(1, std::string(64, 'x') + ".com").status().code() == StatusCode::invalid_argument);
}

TEST_CASE("dns ParseResponse collects A answers behind compression pointers") {
    auto q = dns::BuildQuery(42, "google.com").value();
    auto reply = linkguard::testing::MakeDnsReply(q, {{127, 0, 0, 1}, {10, 1, 2, 3}});

    std::uint16_t id = 0;
    REQUIRE(dns::PeekId(reply.data(), reply.size(), id));
    REQUIRE(id == 42);

    auto r = dns::ParseResponse(reply.data(), reply.size());
    REQUIRE(r.ok());
    REQUIRE(r.value().rcode == 0);
    REQUIRE(!r.value().truncated);
    REQUIRE(r.value().addresses.size() == 2);
    REQUIRE(r.value().addresses[0].to_string() == "127.0.0.1");
    REQUIRE(r.value().addresses[1].to_string() == "10.1.2.3");
}

TEST_CASE("dns ParseResponse reports rcode") {
    auto q = dns::BuildQuery(7, "nope.invalid").value();
    auto reply = linkguard::testing::MakeDnsReply(q, {}, 3);

    auto r = dns::ParseResponse(reply.data(), reply.size());
    REQUIRE(r.ok());
    REQUIRE(r.value().rcode == 3);
    REQUIRE(r.value().addresses.empty());
    REQUIRE(dns::RcodeName(3) == "NXDOMAIN");
}

TEST_CASE("dns ParseResponse rejects truncated and non-response messages") {
    auto q = dns::BuildQuery(9, "example.com").value();

    // a query is not a response
    REQUIRE(dns::ParseResponse(q.data(), q.size()).status().code() == StatusCode::unavailable);

    auto reply = linkguard::testing::MakeDnsReply(q, {{1, 2, 3, 4}});
    REQUIRE(dns::ParseResponse(reply.data(), 5).status().code() == StatusCode::unavailable);
    REQUIRE(dns::ParseResponse(reply.data(), reply.size() - 2).status().code() == StatusCode::unavailable);
}
