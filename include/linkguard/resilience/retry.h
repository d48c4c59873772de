#pragma once

#include <chrono>
#include <functional>
#include <string_view>

#include <linkguard/core/context.h>
#include <linkguard/core/status.h>

namespace linkguard::resilience {

struct RetryOptions {
    int max_attempts = 3;
    std::chrono::milliseconds base_delay{100};
    std::chrono::milliseconds max_delay{2000};
    double multiplier = 2.0; // >= 1
};

class RetryPolicy {
public:
    explicit RetryPolicy(RetryOptions opts);

    int max_attempts() const { return opts_.max_attempts; }
    const RetryOptions& options() const { return opts_; }

    // attempt: 1..max_attempts, returns sleep duration before the attempt (attempt=1 returns 0)
    std::chrono::milliseconds BackoffBeforeAttempt(int attempt) const;

private:
    RetryOptions opts_;
};

// Invalid arguments, circuit-open rejections and cancellations are final.
bool IsRetryable(const Status& status);

struct RetryOutcome {
    int attempts = 0;
    Status status;
    // every attempt ran and failed with a retryable status
    bool exhausted = false;
};

class RetryExecutor {
public:
    explicit RetryExecutor(RetryOptions opts) : policy_(opts) {}

    const RetryPolicy& policy() const { return policy_; }

    // Thread-safe. Runs `op` until it succeeds, fails with a final status or the attempt budget
    // is spent. Backoff sleeps wake as soon as `ctx` is done and return ctx->Err().
    RetryOutcome Execute(const ContextPtr& ctx, const std::function<Status()>& op, std::string_view what = "operation") const;

private:
    RetryPolicy policy_;
};

} // namespace linkguard::resilience
