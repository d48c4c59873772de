#include <linkguard/resilience/circuit_breaker.h>

#include <linkguard/core/log.h>

namespace linkguard::resilience {

std::string_view CircuitStateName(CircuitState state) {
    switch (state) {
        case CircuitState::closed: return "closed";
        case CircuitState::open: return "open";
        case CircuitState::half_open: return "half-open";
    }
    return "unknown";
}

CircuitBreaker::CircuitBreaker(CircuitBreakerOptions opts, std::string name)
    : opts_(opts), name_(std::move(name)) {
    if (opts_.failure_threshold == 0) {
        // avoid never opening due to 0
        opts_.failure_threshold = 1;
    }
    if (opts_.reset_timeout.count() < 0) {
        opts_.reset_timeout = std::chrono::milliseconds(0);
    }
}

Status CircuitBreaker::Execute(const std::function<Status()>& op) {
    if (!AllowRequest()) {
        return Status(StatusCode::circuit_open, "circuit breaker is open");
    }

    Status st;
    try {
        st = op();
    } catch (...) {
        OnFailure();
        throw;
    }

    if (st.ok()) {
        OnSuccess();
    } else if (st.IsCancellation() || st.code() == StatusCode::invalid_argument) {
        // says nothing about the peer
        OnAbandoned();
    } else {
        OnFailure();
    }
    return st;
}

bool CircuitBreaker::AllowRequest() {
    if (state_.load(std::memory_order_acquire) == CircuitState::closed) {
        return true;
    }

    auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lk(mu_);

    auto st = state_.load(std::memory_order_relaxed);
    if (st == CircuitState::closed) {
        return true;
    }
    if (st == CircuitState::half_open) {
        // the single trial is already in flight
        return false;
    }
    if (now - opened_at_ < opts_.reset_timeout) {
        return false;
    }

    state_.store(CircuitState::half_open, std::memory_order_release);
    linkguard::log::debug("circuit breaker {}: admitting half-open trial", name_);
    return true;
}

void CircuitBreaker::OnSuccess() {
    std::lock_guard<std::mutex> lk(mu_);

    auto st = state_.load(std::memory_order_relaxed);
    if (st == CircuitState::closed) {
        consecutive_failures_ = 0;
        return;
    }

    if (st == CircuitState::half_open) {
        state_.store(CircuitState::closed, std::memory_order_release);
        consecutive_failures_ = 0;
        linkguard::log::info("circuit breaker {}: trial succeeded, closed", name_);
        return;
    }

    // open: a straggler admitted before the breaker opened, ignore
}

void CircuitBreaker::OnFailure() {
    auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lk(mu_);

    auto st = state_.load(std::memory_order_relaxed);
    if (st == CircuitState::closed) {
        last_failure_at_ = now;
        ++consecutive_failures_;
        if (consecutive_failures_ >= opts_.failure_threshold) {
            OpenLocked(now);
            linkguard::log::warn("circuit breaker {}: opened after {} consecutive failures (reset in {}ms)",
                name_, consecutive_failures_, opts_.reset_timeout.count());
        }
        return;
    }

    if (st == CircuitState::half_open) {
        last_failure_at_ = now;
        ++consecutive_failures_;
        OpenLocked(now);
        linkguard::log::warn("circuit breaker {}: trial failed, reopened", name_);
        return;
    }

    // open: keep open, the timer is not extended by stragglers
}

void CircuitBreaker::OnAbandoned() {
    std::lock_guard<std::mutex> lk(mu_);
    if (state_.load(std::memory_order_relaxed) == CircuitState::half_open) {
        // back to open with the old timestamp so the next caller may trial immediately
        state_.store(CircuitState::open, std::memory_order_release);
    }
}

void CircuitBreaker::Reset() {
    std::lock_guard<std::mutex> lk(mu_);
    state_.store(CircuitState::closed, std::memory_order_release);
    consecutive_failures_ = 0;
}

CircuitState CircuitBreaker::state() const {
    auto st = state_.load(std::memory_order_acquire);
    if (st != CircuitState::open) {
        return st;
    }

    std::lock_guard<std::mutex> lk(mu_);
    st = state_.load(std::memory_order_relaxed);
    if (st == CircuitState::open && std::chrono::steady_clock::now() - opened_at_ >= opts_.reset_timeout) {
        return CircuitState::half_open;
    }
    return st;
}

std::uint32_t CircuitBreaker::consecutive_failures() const {
    std::lock_guard<std::mutex> lk(mu_);
    return consecutive_failures_;
}

std::chrono::steady_clock::time_point CircuitBreaker::last_failure_time() const {
    std::lock_guard<std::mutex> lk(mu_);
    return last_failure_at_;
}

void CircuitBreaker::OpenLocked(std::chrono::steady_clock::time_point now) {
    state_.store(CircuitState::open, std::memory_order_release);
    opened_at_ = now;
}

} // namespace linkguard::resilience
