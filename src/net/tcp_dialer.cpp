#include <linkguard/net/tcp_dialer.h>

#include <linkguard/net/address.h>

#include "operation.h"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <string>

namespace linkguard::net {
namespace {

using tcp = boost::asio::ip::tcp;

class DialOperation final : public detail::Operation {
public:
    explicit DialOperation(HostPort target) : target_(std::move(target)) {}

protected:
    void Start() override {
        resolver_.async_resolve(target_.host, target_.port,
            [this](const boost::system::error_code& ec, tcp::resolver::results_type results) {
                if (ec) {
                    return Finish(ec);
                }
                boost::asio::async_connect(socket_, results,
                    [this](const boost::system::error_code& ec, const tcp::endpoint&) {
                        boost::system::error_code ignored;
                        socket_.close(ignored);
                        Finish(ec);
                    });
            });
    }

    void CancelIo() override {
        resolver_.cancel();
        boost::system::error_code ignored;
        socket_.close(ignored);
    }

private:
    HostPort target_;
    tcp::resolver resolver_{ioc_};
    tcp::socket socket_{ioc_};
};

} // namespace

linkguard::Status TcpDialer::Dial(const ContextPtr& ctx, std::string_view address, std::chrono::milliseconds timeout) {
    if (address.empty()) {
        return Status(StatusCode::invalid_argument, "TCP handshake target is empty");
    }
    auto hp = SplitHostPort(address);
    if (!hp.ok()) {
        return Status(StatusCode::invalid_argument, "TCP handshake target " + std::string(address) + ": " + hp.status().message());
    }

    auto op = std::make_shared<DialOperation>(std::move(hp).value());
    op->Run(ctx, timeout);
    return op->ToStatus(ctx, "TCP handshake to " + std::string(address), timeout);
}

} // namespace linkguard::net
