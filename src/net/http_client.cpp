#include <linkguard/net/http_client.h>

#include "operation.h"

#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <string>

namespace linkguard::net {
namespace {
namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

bool IsIpLiteral(const std::string& host) {
    boost::system::error_code ec;
    (void)boost::asio::ip::make_address(host, ec);
    return !ec;
}

class HeadOperation final : public detail::Operation {
public:
    HeadOperation(Url url, std::string_view user_agent)
        : url_(std::move(url)), ssl_ctx_(ssl::context::tls_client) {
        req_.method(http::verb::head);
        req_.version(11);
        req_.target(url_.target);
        req_.set(http::field::host, url_.HostHeader());
        req_.set(http::field::user_agent, std::string(user_agent));
        req_.set(http::field::connection, "close");

        // HEAD responses carry no body, whatever Content-Length says.
        parser_.skip(true);
    }

    const HttpClientResponse& response() const { return resp_; }

protected:
    void Start() override {
        if (url_.tls()) {
            boost::system::error_code ec;
            ssl_ctx_.set_default_verify_paths(ec);
            if (ec) {
                return Finish(ec);
            }
            tls_.set_verify_mode(ssl::verify_peer);
            tls_.set_verify_callback(ssl::host_name_verification(url_.host));
            if (!IsIpLiteral(url_.host) && !SSL_set_tlsext_host_name(tls_.native_handle(), url_.host.c_str())) {
                return Finish(boost::system::error_code(static_cast<int>(::ERR_get_error()), boost::asio::error::get_ssl_category()));
            }
        }

        resolver_.async_resolve(url_.host, url_.port,
            [this](const boost::system::error_code& ec, tcp::resolver::results_type results) {
                if (ec) {
                    return Finish(ec);
                }
                Lowest().async_connect(results,
                    [this](const boost::system::error_code& ec, const tcp::endpoint&) {
                        if (ec) {
                            return Finish(ec);
                        }
                        if (!url_.tls()) {
                            return Send(plain_);
                        }
                        tls_.async_handshake(ssl::stream_base::client, [this](const boost::system::error_code& ec) {
                            if (ec) {
                                return Finish(ec);
                            }
                            Send(tls_);
                        });
                    });
            });
    }

    void CancelIo() override {
        resolver_.cancel();
        Lowest().cancel();
    }

private:
    beast::tcp_stream& Lowest() {
        return url_.tls() ? beast::get_lowest_layer(tls_) : plain_;
    }

    template <class Stream>
    void Send(Stream& stream) {
        http::async_write(stream, req_, [this, &stream](const boost::system::error_code& ec, std::size_t) {
            if (ec) {
                return Finish(ec);
            }
            http::async_read(stream, buffer_, parser_, [this](const boost::system::error_code& ec, std::size_t) {
                if (ec) {
                    return Finish(ec);
                }
                resp_.status = static_cast<int>(parser_.get().result_int());
                resp_.reason = std::string(parser_.get().reason());

                // No TLS close_notify: the peer's reply is all we wanted.
                boost::system::error_code ignored;
                Lowest().socket().shutdown(tcp::socket::shutdown_both, ignored);
                Finish({});
            });
        });
    }

    Url url_;
    ssl::context ssl_ctx_;
    tcp::resolver resolver_{ioc_};
    beast::tcp_stream plain_{ioc_};
    beast::ssl_stream<beast::tcp_stream> tls_{ioc_, ssl_ctx_};

    http::request<http::empty_body> req_;
    beast::flat_buffer buffer_;
    http::response_parser<http::empty_body> parser_;
    HttpClientResponse resp_;
};

} // namespace

linkguard::Result<HttpClientResponse> HttpClient::Head(
    const ContextPtr& ctx,
    const Url& url,
    std::string_view user_agent,
    std::chrono::milliseconds timeout) {
    auto op = std::make_shared<HeadOperation>(url, user_agent);
    op->Run(ctx, timeout);

    auto st = op->ToStatus(ctx, "HEAD " + url.scheme + "://" + url.HostHeader() + url.target, timeout);
    if (!st.ok()) {
        return st;
    }
    return op->response();
}

} // namespace linkguard::net
