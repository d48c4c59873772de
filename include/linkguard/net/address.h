#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <linkguard/core/status.h>

namespace linkguard::net {

struct HostPort {
    std::string host; // without brackets
    std::string port;
};

// Accepts "host:port" and "[v6]:port". Bare hosts and bare IPv6 literals are rejected.
linkguard::Result<HostPort> SplitHostPort(std::string_view address);

// Brackets the host when it contains ':'.
std::string JoinHostPort(std::string_view host, std::string_view port);

// `address` unchanged when it already carries a port, otherwise joined with `default_port`.
std::string WithDefaultPort(std::string_view address, std::string_view default_port);

struct Url {
    std::string scheme; // "http" or "https"
    std::string host;   // without brackets
    std::string port;   // explicit or the scheme default
    std::string target; // path + query, at least "/"
    bool explicit_port = false;

    bool tls() const { return scheme == "https"; }

    // Value for the Host header: the port is omitted when it is the scheme default.
    std::string HostHeader() const;
};

// Only absolute http/https URLs are accepted; fragments are dropped.
linkguard::Result<Url> ParseUrl(std::string_view url);

} // namespace linkguard::net
