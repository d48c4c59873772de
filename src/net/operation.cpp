#include "operation.h"

namespace linkguard::net::detail {

void Operation::Run(const ContextPtr& ctx, std::chrono::milliseconds timeout) {
    if (ctx->Done()) {
        stop_ = StopReason::cancelled;
        return;
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    bool bounded_by_context = false;
    if (const auto& ctx_deadline = ctx->Deadline(); ctx_deadline && *ctx_deadline < deadline) {
        deadline = *ctx_deadline;
        bounded_by_context = true;
    }

    timer_.expires_at(deadline);
    timer_.async_wait([this, bounded_by_context](const boost::system::error_code& ec) {
        if (ec || finished_) {
            return;
        }
        Abort(bounded_by_context ? StopReason::context_deadline : StopReason::timeout);
    });

    // Cancellation arrives on a foreign thread; hop onto the io thread before touching sockets.
    std::weak_ptr<Operation> weak = shared_from_this();
    auto reg = ctx->OnDone([weak] {
        auto op = weak.lock();
        if (!op) {
            return;
        }
        boost::asio::post(op->ioc_, [weak] {
            if (auto o = weak.lock()) {
                o->Abort(StopReason::cancelled);
            }
        });
    });

    Start();
    ioc_.run();
}

void Operation::Finish(const boost::system::error_code& ec) {
    if (finished_) {
        return;
    }
    finished_ = true;
    ec_ = ec;
    timer_.cancel();
}

void Operation::Abort(StopReason reason) {
    if (finished_ || stop_ != StopReason::none) {
        return;
    }
    stop_ = reason;
    CancelIo();
    timer_.cancel();
}

Status Operation::ToStatus(const ContextPtr& ctx, std::string_view what, std::chrono::milliseconds timeout) const {
    switch (stop_) {
        case StopReason::cancelled:
        case StopReason::context_deadline: {
            auto st = ctx->Err();
            if (st.ok()) {
                st = Status(StatusCode::cancelled, "context cancelled");
            }
            return st;
        }
        case StopReason::timeout:
            return Status(StatusCode::timeout,
                std::string(what) + " timed out after " + std::to_string(timeout.count()) + "ms");
        case StopReason::none:
            break;
    }

    if (ec_) {
        return Status(StatusCode::unavailable, std::string(what) + ": " + ec_.message());
    }
    return Status::Ok();
}

} // namespace linkguard::net::detail
