#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

#include <linkguard/core/status.h>

namespace linkguard {

class Context;
using ContextPtr = std::shared_ptr<Context>;

// Cancellation token with an optional deadline, threaded through every blocking call.
//
// A child is done as soon as its parent is. Explicit Cancel() wakes sleepers and fires
// OnDone callbacks immediately. Deadline expiry is observed lazily: Done()/Err() report it once
// the clock passes, SleepFor() wakes at it, and I/O arms its own timers from Deadline().
class Context : public std::enable_shared_from_this<Context> {
public:
    using Clock = std::chrono::steady_clock;

    // Handle for an OnDone callback; unregisters on destruction.
    class Registration {
    public:
        Registration() = default;
        Registration(std::weak_ptr<Context> ctx, std::uint64_t id) : ctx_(std::move(ctx)), id_(id) {}
        ~Registration() { Reset(); }

        Registration(Registration&& o) noexcept : ctx_(std::move(o.ctx_)), id_(o.id_) { o.id_ = 0; }
        Registration& operator=(Registration&& o) noexcept;

        Registration(const Registration&) = delete;
        Registration& operator=(const Registration&) = delete;

        void Reset();

    private:
        std::weak_ptr<Context> ctx_;
        std::uint64_t id_ = 0;
    };

    // A fresh root context that is never done unless cancelled.
    static ContextPtr Background();
    static ContextPtr WithCancel(const ContextPtr& parent);
    // Deadline is the earlier of now + timeout and the parent's deadline.
    static ContextPtr WithTimeout(const ContextPtr& parent, std::chrono::milliseconds timeout);

    ~Context() = default;

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    // Thread-safe, idempotent
    void Cancel();

    // Thread-safe
    bool Done() const;

    // Thread-safe. Ok while not done, otherwise cancelled or deadline_exceeded.
    Status Err() const;

    const std::optional<Clock::time_point>& Deadline() const { return deadline_; }

    // Thread-safe. Blocks for `d`; returns false early when the context finishes first.
    bool SleepFor(std::chrono::milliseconds d) const;

    // Thread-safe. `cb` runs at most once, on the cancelling thread, without any context lock held;
    // inline if the context is already cancelled. It may still be running after the Registration
    // is destroyed, so it must only capture state it co-owns.
    [[nodiscard]] Registration OnDone(std::function<void()> cb);

private:
    struct PrivateTag {};

public:
    Context(PrivateTag, std::optional<Clock::time_point> deadline) : deadline_(deadline) {}

private:
    static ContextPtr MakeChild(const ContextPtr& parent, std::optional<Clock::time_point> deadline);

    void Finish(Status status);
    void Unregister(std::uint64_t id);
    bool DoneLocked(Clock::time_point now) const;

    const std::optional<Clock::time_point> deadline_;

    // keeps the parent (and its deadline) alive for as long as the child is
    ContextPtr parent_;
    Registration parent_reg_;

    mutable std::mutex mu_;
    mutable std::condition_variable cv_;
    bool cancelled_ = false;
    Status err_;
    std::uint64_t next_id_ = 1;
    std::map<std::uint64_t, std::function<void()>> callbacks_;
};

} // namespace linkguard
