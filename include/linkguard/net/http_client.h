#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include <linkguard/core/context.h>
#include <linkguard/core/status.h>
#include <linkguard/net/address.h>

namespace linkguard::net {

struct HttpClientResponse {
    int status = 0;
    std::string reason;
};

class HttpClient {
public:
    // Thread-safe: each call uses a local io_context.
    // HEAD request over HTTP or HTTPS (peer and host name verified). Redirects are not followed.
    static linkguard::Result<HttpClientResponse> Head(
        const ContextPtr& ctx,
        const Url& url,
        std::string_view user_agent,
        std::chrono::milliseconds timeout);
};

} // namespace linkguard::net
