#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>

#include <linkguard/core/status.h>

namespace linkguard::resilience {

enum class CircuitState {
    closed = 0,
    open,
    half_open,
};

std::string_view CircuitStateName(CircuitState state);

struct CircuitBreakerOptions {
    std::uint32_t failure_threshold = 3;
    std::chrono::milliseconds reset_timeout{30000};
};

// Failure gate shared by every concurrent probe of one class.
//
// Closed: requests pass, failures are counted. Reaching failure_threshold opens the breaker.
// Open: requests are rejected until reset_timeout has passed since the last opening, then exactly
// one trial is admitted (half-open). The trial's success closes the breaker, its failure reopens it.
class CircuitBreaker {
public:
    explicit CircuitBreaker(CircuitBreakerOptions opts, std::string name = "breaker");

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    // Thread-safe. Returns circuit_open without calling `op` while the breaker rejects.
    // A cancelled `op`, or one rejecting its own input (invalid_argument), is neither a success
    // nor a failure.
    Status Execute(const std::function<Status()>& op);

    // Thread-safe
    bool AllowRequest();

    // Thread-safe
    void OnSuccess();

    // Thread-safe
    void OnFailure();

    // Thread-safe. Gives back an admitted request without a verdict.
    void OnAbandoned();

    // Thread-safe
    void Reset();

    // Pure read. Open with an elapsed reset timeout reads as half_open.
    CircuitState state() const;

    std::uint32_t consecutive_failures() const;
    std::chrono::steady_clock::time_point last_failure_time() const;

    const std::string& name() const { return name_; }
    const CircuitBreakerOptions& options() const { return opts_; }

private:
    void OpenLocked(std::chrono::steady_clock::time_point now);

    CircuitBreakerOptions opts_;
    const std::string name_;

    mutable std::mutex mu_;
    // half_open is stored only while the trial request is in flight
    std::atomic<CircuitState> state_{CircuitState::closed};

    std::uint32_t consecutive_failures_ = 0;
    std::chrono::steady_clock::time_point opened_at_{};
    std::chrono::steady_clock::time_point last_failure_at_{};
};

} // namespace linkguard::resilience
