#pragma once

#include <chrono>
#include <string_view>
#include <vector>

#include <boost/asio/ip/address_v4.hpp>

#include <linkguard/core/context.h>
#include <linkguard/core/status.h>

namespace linkguard::net {

class DnsClient {
public:
    // Thread-safe: each call uses a local io_context.
    // Sends one A query over UDP to `server` ("ip:port" or "name:port"), bypassing the system
    // resolver for the lookup itself. A named server is located first, IPv4 preferred.
    // A response without addresses is not_found; a non-zero rcode is unavailable.
    static linkguard::Result<std::vector<boost::asio::ip::address_v4>> LookupA(
        const ContextPtr& ctx,
        std::string_view server,
        std::string_view domain,
        std::chrono::milliseconds timeout);
};

} // namespace linkguard::net
