#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/error_code.hpp>

#include <linkguard/core/context.h>
#include <linkguard/core/status.h>

namespace linkguard::net::detail {

enum class StopReason {
    none = 0,
    timeout,
    context_deadline,
    cancelled,
};

// One blocking network exchange driven by a private io_context on the calling thread.
//
// The exchange ends when its handlers complete, when its own timeout fires, when the context
// deadline passes (whichever of the two comes first arms the timer) or when the context is
// cancelled from another thread.
class Operation : public std::enable_shared_from_this<Operation> {
public:
    virtual ~Operation() = default;

    // Starts the handler chain, then runs the io_context to completion.
    void Run(const ContextPtr& ctx, std::chrono::milliseconds timeout);

    StopReason stop_reason() const { return stop_; }
    const boost::system::error_code& error() const { return ec_; }

    // Maps the outcome to a Status; `what` prefixes timeout and transport messages.
    Status ToStatus(const ContextPtr& ctx, std::string_view what, std::chrono::milliseconds timeout) const;

protected:
    Operation() = default;

    virtual void Start() = 0;
    // Cancels outstanding socket / resolver work. Called on the io thread.
    virtual void CancelIo() = 0;

    // Records the final error code and stops the timer.
    void Finish(const boost::system::error_code& ec);

    boost::asio::io_context ioc_{1};

private:
    void Abort(StopReason reason);

    boost::asio::steady_timer timer_{ioc_};
    StopReason stop_ = StopReason::none;
    boost::system::error_code ec_;
    bool finished_ = false;
};

} // namespace linkguard::net::detail
