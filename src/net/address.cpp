#include <linkguard/net/address.h>

#include <algorithm>
#include <cctype>

namespace linkguard::net {
namespace {

bool IsValidPort(std::string_view port) {
    if (port.empty() || port.size() > 5) {
        return false;
    }
    if (!std::all_of(port.begin(), port.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return false;
    }
    auto v = std::stoi(std::string(port));
    return v > 0 && v <= 65535;
}

std::string ToLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

linkguard::Result<HostPort> SplitHostPort(std::string_view address) {
    HostPort out;

    if (!address.empty() && address.front() == '[') {
        auto close = address.find(']');
        if (close == std::string_view::npos) {
            return Status(StatusCode::invalid_argument, "missing ']' in address");
        }
        if (close + 1 >= address.size() || address[close + 1] != ':') {
            return Status(StatusCode::invalid_argument, "missing port in address");
        }
        out.host = std::string(address.substr(1, close - 1));
        out.port = std::string(address.substr(close + 2));
    } else {
        auto colon = address.rfind(':');
        if (colon == std::string_view::npos) {
            return Status(StatusCode::invalid_argument, "missing port in address");
        }
        if (address.find(':') != colon) {
            return Status(StatusCode::invalid_argument, "too many colons in address");
        }
        out.host = std::string(address.substr(0, colon));
        out.port = std::string(address.substr(colon + 1));
    }

    if (out.host.empty()) {
        return Status(StatusCode::invalid_argument, "missing host in address");
    }
    if (!IsValidPort(out.port)) {
        return Status(StatusCode::invalid_argument, "invalid port in address");
    }
    return out;
}

std::string JoinHostPort(std::string_view host, std::string_view port) {
    std::string out;
    if (host.find(':') != std::string_view::npos) {
        out.push_back('[');
        out.append(host);
        out.push_back(']');
    } else {
        out.append(host);
    }
    out.push_back(':');
    out.append(port);
    return out;
}

std::string WithDefaultPort(std::string_view address, std::string_view default_port) {
    if (SplitHostPort(address).ok()) {
        return std::string(address);
    }
    return JoinHostPort(address, default_port);
}

std::string Url::HostHeader() const {
    if (!explicit_port) {
        return host.find(':') != std::string::npos ? "[" + host + "]" : host;
    }
    return JoinHostPort(host, port);
}

linkguard::Result<Url> ParseUrl(std::string_view url) {
    auto sep = url.find("://");
    if (sep == std::string_view::npos) {
        return Status(StatusCode::invalid_argument, "invalid URL format: missing scheme");
    }

    Url out;
    out.scheme = ToLower(url.substr(0, sep));
    if (out.scheme != "http" && out.scheme != "https") {
        return Status(StatusCode::invalid_argument, "unsupported protocol scheme \"" + out.scheme + "\"");
    }

    auto rest = url.substr(sep + 3);
    if (auto hash = rest.find('#'); hash != std::string_view::npos) {
        rest = rest.substr(0, hash);
    }

    auto path_pos = rest.find_first_of("/?");
    auto authority = rest.substr(0, path_pos);
    if (path_pos == std::string_view::npos) {
        out.target = "/";
    } else if (rest[path_pos] == '?') {
        out.target = "/" + std::string(rest.substr(path_pos));
    } else {
        out.target = std::string(rest.substr(path_pos));
    }

    if (authority.find('@') != std::string_view::npos) {
        return Status(StatusCode::invalid_argument, "invalid URL format: userinfo is not supported");
    }
    if (authority.empty()) {
        return Status(StatusCode::invalid_argument, "invalid URL format: missing host");
    }

    auto default_port = out.tls() ? "443" : "80";
    bool has_port = false;
    if (authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) {
            return Status(StatusCode::invalid_argument, "invalid URL format: missing ']' in host");
        }
        has_port = close + 1 < authority.size();
    } else {
        has_port = authority.find(':') != std::string_view::npos;
    }

    if (has_port) {
        auto hp = SplitHostPort(authority);
        if (!hp.ok()) {
            return Status(StatusCode::invalid_argument, "invalid URL format: " + hp.status().message());
        }
        out.host = hp.value().host;
        out.port = hp.value().port;
        out.explicit_port = out.port != default_port;
    } else {
        out.host = authority.front() == '[' ? std::string(authority.substr(1, authority.size() - 2)) : std::string(authority);
        out.port = default_port;
    }

    if (out.host.empty()) {
        return Status(StatusCode::invalid_argument, "invalid URL format: missing host");
    }
    return out;
}

} // namespace linkguard::net
