#include <linkguard/net/transport.h>

#include <linkguard/net/dns_client.h>
#include <linkguard/net/tcp_dialer.h>

namespace linkguard::net {

linkguard::Status AsioProbeTransport::Dial(const ContextPtr& ctx, std::string_view address, std::chrono::milliseconds timeout) {
    return TcpDialer::Dial(ctx, address, timeout);
}

linkguard::Result<std::size_t> AsioProbeTransport::Resolve(
    const ContextPtr& ctx,
    std::string_view server,
    std::string_view domain,
    std::chrono::milliseconds timeout) {
    auto r = DnsClient::LookupA(ctx, server, domain, timeout);
    if (!r.ok()) {
        return r.status();
    }
    return r.value().size();
}

linkguard::Result<HttpClientResponse> AsioProbeTransport::Head(
    const ContextPtr& ctx,
    const Url& url,
    std::string_view user_agent,
    std::chrono::milliseconds timeout) {
    return HttpClient::Head(ctx, url, user_agent, timeout);
}

} // namespace linkguard::net
