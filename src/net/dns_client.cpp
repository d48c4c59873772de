#include <linkguard/net/dns_client.h>

#include <linkguard/net/address.h>
#include <linkguard/net/dns_message.h>

#include "operation.h"

#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/udp.hpp>

#include <array>
#include <optional>
#include <random>
#include <string>
#include <utility>

namespace linkguard::net {
namespace {

using udp = boost::asio::ip::udp;

std::uint16_t RandomQueryId() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<std::uint32_t> dist(0, 0xFFFF);
    return static_cast<std::uint16_t>(dist(gen));
}

class DnsQueryOperation final : public detail::Operation {
public:
    DnsQueryOperation(HostPort server, std::uint16_t id, std::vector<std::uint8_t> query)
        : server_name_(std::move(server)), id_(id), query_(std::move(query)) {}

    const std::optional<dns::Response>& response() const { return response_; }
    const Status& parse_status() const { return parse_status_; }

protected:
    void Start() override {
        boost::system::error_code ec;
        auto address = boost::asio::ip::make_address(server_name_.host, ec);
        if (!ec) {
            return Send(udp::endpoint(address, Port()));
        }

        // Named resolver: the system resolver finds it, the query still goes to it directly.
        resolver_.async_resolve(server_name_.host, server_name_.port,
            [this](const boost::system::error_code& ec, udp::resolver::results_type results) {
                if (ec) {
                    return Finish(ec);
                }
                Send(PreferV4(results));
            });
    }

    void CancelIo() override {
        resolver_.cancel();
        boost::system::error_code ignored;
        socket_.close(ignored);
    }

private:
    unsigned short Port() const {
        return static_cast<unsigned short>(std::stoi(server_name_.port));
    }

    static udp::endpoint PreferV4(const udp::resolver::results_type& results) {
        for (const auto& entry : results) {
            if (entry.endpoint().address().is_v4()) {
                return entry.endpoint();
            }
        }
        return results.begin()->endpoint();
    }

    void Send(udp::endpoint server) {
        server_ = server;
        boost::system::error_code ec;
        socket_.open(server_.protocol(), ec);
        if (ec) {
            return Finish(ec);
        }
        socket_.async_send_to(boost::asio::buffer(query_), server_,
            [this](const boost::system::error_code& ec, std::size_t) {
                if (ec) {
                    return Finish(ec);
                }
                Receive();
            });
    }

    void Receive() {
        socket_.async_receive_from(boost::asio::buffer(buffer_), sender_,
            [this](const boost::system::error_code& ec, std::size_t n) {
                if (ec) {
                    return Finish(ec);
                }

                // Ignore strays: wrong peer or another transaction.
                std::uint16_t id = 0;
                if (sender_ != server_ || !dns::PeekId(buffer_.data(), n, id) || id != id_) {
                    return Receive();
                }

                auto parsed = dns::ParseResponse(buffer_.data(), n);
                if (parsed.ok()) {
                    response_ = std::move(parsed).value();
                } else {
                    parse_status_ = parsed.status();
                }
                boost::system::error_code ignored;
                socket_.close(ignored);
                Finish({});
            });
    }

    HostPort server_name_;
    udp::endpoint server_;
    std::uint16_t id_ = 0;
    std::vector<std::uint8_t> query_;

    udp::resolver resolver_{ioc_};
    udp::socket socket_{ioc_};
    udp::endpoint sender_;
    std::array<std::uint8_t, dns::kMaxUdpPayload> buffer_{};

    std::optional<dns::Response> response_;
    Status parse_status_;
};

} // namespace

linkguard::Result<std::vector<boost::asio::ip::address_v4>> DnsClient::LookupA(
    const ContextPtr& ctx,
    std::string_view server,
    std::string_view domain,
    std::chrono::milliseconds timeout) {
    auto hp = SplitHostPort(server);
    if (!hp.ok()) {
        return Status(StatusCode::invalid_argument, "dns server " + std::string(server) + ": " + hp.status().message());
    }

    auto id = RandomQueryId();
    auto query = dns::BuildQuery(id, domain);
    if (!query.ok()) {
        return query.status();
    }

    auto op = std::make_shared<DnsQueryOperation>(std::move(hp).value(), id, std::move(query).value());
    std::string what = "dns query for " + std::string(domain) + " via " + std::string(server);
    op->Run(ctx, timeout);

    auto st = op->ToStatus(ctx, what, timeout);
    if (!st.ok()) {
        return st;
    }
    if (!op->parse_status().ok()) {
        return Status(op->parse_status().code(), what + ": " + op->parse_status().message());
    }
    if (!op->response()) {
        return Status(StatusCode::internal_error, what + ": no response recorded");
    }

    const auto& resp = *op->response();
    if (resp.rcode != 0) {
        return Status(StatusCode::unavailable,
            what + " failed: " + std::string(dns::RcodeName(resp.rcode)) + " (rcode " + std::to_string(resp.rcode) + ")");
    }
    if (resp.addresses.empty()) {
        return Status(StatusCode::not_found, what + ": no IPs returned");
    }
    return resp.addresses;
}

} // namespace linkguard::net
