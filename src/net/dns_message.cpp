#include <linkguard/net/dns_message.h>

#include <string>

namespace linkguard::net::dns {
namespace {

void PutU16(std::vector<std::uint8_t>& out, std::uint16_t v) {
    out.push_back(static_cast<std::uint8_t>(v >> 8));
    out.push_back(static_cast<std::uint8_t>(v & 0xFF));
}

std::uint16_t GetU16(const std::uint8_t* p) {
    return static_cast<std::uint16_t>((static_cast<std::uint16_t>(p[0]) << 8) | p[1]);
}

// Advances `off` past an encoded name. Compression pointers end the name.
bool SkipName(const std::uint8_t* data, std::size_t size, std::size_t& off) {
    while (true) {
        if (off >= size) {
            return false;
        }
        auto len = data[off];
        if ((len & 0xC0) == 0xC0) {
            if (off + 2 > size) {
                return false;
            }
            off += 2;
            return true;
        }
        if ((len & 0xC0) != 0) {
            // extended label types
            return false;
        }
        ++off;
        if (len == 0) {
            return true;
        }
        if (off + len > size) {
            return false;
        }
        off += len;
    }
}

} // namespace

linkguard::Result<std::vector<std::uint8_t>> BuildQuery(std::uint16_t id, std::string_view domain) {
    if (!domain.empty() && domain.back() == '.') {
        domain.remove_suffix(1);
    }
    if (domain.empty() || domain.size() > 253) {
        return Status(StatusCode::invalid_argument, "invalid domain name length");
    }

    std::vector<std::uint8_t> out;
    out.reserve(kHeaderSize + domain.size() + 6);

    PutU16(out, id);
    PutU16(out, 0x0100); // RD
    PutU16(out, 1);      // QDCOUNT
    PutU16(out, 0);      // ANCOUNT
    PutU16(out, 0);      // NSCOUNT
    PutU16(out, 0);      // ARCOUNT

    while (!domain.empty()) {
        auto dot = domain.find('.');
        auto label = domain.substr(0, dot);
        if (label.empty() || label.size() > 63) {
            return Status(StatusCode::invalid_argument, "invalid label in domain name");
        }
        out.push_back(static_cast<std::uint8_t>(label.size()));
        out.insert(out.end(), label.begin(), label.end());
        if (dot == std::string_view::npos) {
            break;
        }
        domain.remove_prefix(dot + 1);
        if (domain.empty()) {
            return Status(StatusCode::invalid_argument, "invalid label in domain name");
        }
    }
    out.push_back(0);

    PutU16(out, kTypeA);
    PutU16(out, kClassIn);
    return out;
}

bool PeekId(const std::uint8_t* data, std::size_t size, std::uint16_t& id) {
    if (size < 2) {
        return false;
    }
    id = GetU16(data);
    return true;
}

linkguard::Result<Response> ParseResponse(const std::uint8_t* data, std::size_t size) {
    if (size < kHeaderSize) {
        return Status(StatusCode::unavailable, "dns response shorter than header");
    }

    Response out;
    out.id = GetU16(data);
    auto flags = GetU16(data + 2);
    if ((flags & 0x8000) == 0) {
        return Status(StatusCode::unavailable, "dns message is not a response");
    }
    out.truncated = (flags & 0x0200) != 0;
    out.rcode = static_cast<std::uint8_t>(flags & 0x000F);

    auto qdcount = GetU16(data + 4);
    auto ancount = GetU16(data + 6);

    std::size_t off = kHeaderSize;
    for (std::uint16_t i = 0; i < qdcount; ++i) {
        if (!SkipName(data, size, off) || off + 4 > size) {
            return Status(StatusCode::unavailable, "malformed dns question section");
        }
        off += 4;
    }

    for (std::uint16_t i = 0; i < ancount; ++i) {
        if (!SkipName(data, size, off) || off + 10 > size) {
            if (out.truncated) {
                break;
            }
            return Status(StatusCode::unavailable, "malformed dns answer section");
        }
        auto type = GetU16(data + off);
        auto klass = GetU16(data + off + 2);
        auto rdlength = GetU16(data + off + 8);
        off += 10;
        if (off + rdlength > size) {
            if (out.truncated) {
                break;
            }
            return Status(StatusCode::unavailable, "malformed dns answer rdata");
        }
        if (type == kTypeA && klass == kClassIn && rdlength == 4) {
            boost::asio::ip::address_v4::bytes_type b{data[off], data[off + 1], data[off + 2], data[off + 3]};
            out.addresses.emplace_back(b);
        }
        off += rdlength;
    }

    return out;
}

std::string_view RcodeName(std::uint8_t rcode) {
    switch (rcode) {
        case 0: return "NOERROR";
        case 1: return "FORMERR";
        case 2: return "SERVFAIL";
        case 3: return "NXDOMAIN";
        case 4: return "NOTIMP";
        case 5: return "REFUSED";
        default: return "RCODE";
    }
}

} // namespace linkguard::net::dns
