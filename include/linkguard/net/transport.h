#pragma once

#include <chrono>
#include <cstddef>
#include <string_view>

#include <linkguard/core/context.h>
#include <linkguard/core/status.h>
#include <linkguard/net/address.h>
#include <linkguard/net/http_client.h>

namespace linkguard::net {

// The raw network operations behind every probe. Implementations must honour ctx cancellation
// and its deadline at every blocking point.
class IProbeTransport {
public:
    virtual ~IProbeTransport() = default;

    // Thread-safe
    virtual linkguard::Status Dial(const ContextPtr& ctx, std::string_view address, std::chrono::milliseconds timeout) = 0;

    // Thread-safe. Number of addresses `server` returned for `domain`.
    virtual linkguard::Result<std::size_t> Resolve(
        const ContextPtr& ctx,
        std::string_view server,
        std::string_view domain,
        std::chrono::milliseconds timeout) = 0;

    // Thread-safe
    virtual linkguard::Result<HttpClientResponse> Head(
        const ContextPtr& ctx,
        const Url& url,
        std::string_view user_agent,
        std::chrono::milliseconds timeout) = 0;
};

// TcpDialer, DnsClient and HttpClient on Boost.Asio.
class AsioProbeTransport final : public IProbeTransport {
public:
    linkguard::Status Dial(const ContextPtr& ctx, std::string_view address, std::chrono::milliseconds timeout) override;

    linkguard::Result<std::size_t> Resolve(
        const ContextPtr& ctx,
        std::string_view server,
        std::string_view domain,
        std::chrono::milliseconds timeout) override;

    linkguard::Result<HttpClientResponse> Head(
        const ContextPtr& ctx,
        const Url& url,
        std::string_view user_agent,
        std::chrono::milliseconds timeout) override;
};

} // namespace linkguard::net
