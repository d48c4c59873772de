#pragma once

#include <chrono>
#include <string_view>

#include <linkguard/core/context.h>
#include <linkguard/core/status.h>

namespace linkguard::net {

class TcpDialer {
public:
    // Thread-safe: each call uses a local io_context.
    // Resolves `address` ("host:port"), completes a TCP handshake and closes the connection.
    static linkguard::Status Dial(const ContextPtr& ctx, std::string_view address, std::chrono::milliseconds timeout);
};

} // namespace linkguard::net
