#include <linkguard/core/context.h>

#include <algorithm>

namespace linkguard {

Context::Registration& Context::Registration::operator=(Registration&& o) noexcept {
    if (this != &o) {
        Reset();
        ctx_ = std::move(o.ctx_);
        id_ = o.id_;
        o.id_ = 0;
    }
    return *this;
}

void Context::Registration::Reset() {
    if (id_ == 0) {
        return;
    }
    if (auto ctx = ctx_.lock()) {
        ctx->Unregister(id_);
    }
    ctx_.reset();
    id_ = 0;
}

ContextPtr Context::Background() {
    return std::make_shared<Context>(PrivateTag{}, std::nullopt);
}

ContextPtr Context::WithCancel(const ContextPtr& parent) {
    return MakeChild(parent, parent ? parent->deadline_ : std::nullopt);
}

ContextPtr Context::WithTimeout(const ContextPtr& parent, std::chrono::milliseconds timeout) {
    auto deadline = Clock::now() + timeout;
    if (parent && parent->deadline_) {
        deadline = std::min(deadline, *parent->deadline_);
    }
    return MakeChild(parent, deadline);
}

ContextPtr Context::MakeChild(const ContextPtr& parent, std::optional<Clock::time_point> deadline) {
    auto child = std::make_shared<Context>(PrivateTag{}, deadline);
    if (!parent) {
        return child;
    }

    child->parent_ = parent;
    std::weak_ptr<Context> weak_child = child;
    std::weak_ptr<Context> weak_parent = parent;
    child->parent_reg_ = parent->OnDone([weak_child, weak_parent] {
        auto c = weak_child.lock();
        if (!c) {
            return;
        }
        auto p = weak_parent.lock();
        auto st = p ? p->Err() : Status(StatusCode::cancelled, "parent context cancelled");
        if (st.ok()) {
            st = Status(StatusCode::cancelled, "parent context cancelled");
        }
        c->Finish(std::move(st));
    });
    return child;
}

void Context::Cancel() {
    Finish(Status(StatusCode::cancelled, "context cancelled"));
}

void Context::Finish(Status status) {
    std::map<std::uint64_t, std::function<void()>> callbacks;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (cancelled_) {
            return;
        }
        cancelled_ = true;
        err_ = std::move(status);
        callbacks.swap(callbacks_);
    }
    cv_.notify_all();

    for (auto& it : callbacks) {
        it.second();
    }
}

bool Context::DoneLocked(Clock::time_point now) const {
    return cancelled_ || (deadline_ && now >= *deadline_);
}

bool Context::Done() const {
    std::lock_guard<std::mutex> lk(mu_);
    return DoneLocked(Clock::now());
}

Status Context::Err() const {
    std::lock_guard<std::mutex> lk(mu_);
    if (cancelled_) {
        return err_;
    }
    if (deadline_ && Clock::now() >= *deadline_) {
        return Status(StatusCode::deadline_exceeded, "context deadline exceeded");
    }
    return Status::Ok();
}

bool Context::SleepFor(std::chrono::milliseconds d) const {
    auto until = Clock::now() + d;
    if (deadline_) {
        until = std::min(until, *deadline_);
    }

    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait_until(lk, until, [&] { return cancelled_; });
    return !DoneLocked(Clock::now());
}

Context::Registration Context::OnDone(std::function<void()> cb) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!cancelled_) {
            auto id = next_id_++;
            callbacks_.emplace(id, std::move(cb));
            return Registration(weak_from_this(), id);
        }
    }
    cb();
    return Registration();
}

void Context::Unregister(std::uint64_t id) {
    std::lock_guard<std::mutex> lk(mu_);
    callbacks_.erase(id);
}

} // namespace linkguard
