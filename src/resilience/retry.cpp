#include <linkguard/resilience/retry.h>

#include <linkguard/core/log.h>

#include <algorithm>
#include <cmath>

namespace linkguard::resilience {

RetryPolicy::RetryPolicy(RetryOptions opts) : opts_(opts) {
    if (opts_.max_attempts < 1) {
        opts_.max_attempts = 1;
    }
    if (opts_.base_delay.count() < 0) {
        opts_.base_delay = std::chrono::milliseconds(0);
    }
    if (opts_.max_delay < opts_.base_delay) {
        opts_.max_delay = opts_.base_delay;
    }
    if (!(opts_.multiplier >= 1.0)) {
        opts_.multiplier = 1.0;
    }
}

std::chrono::milliseconds RetryPolicy::BackoffBeforeAttempt(int attempt) const {
    if (attempt <= 1) {
        return std::chrono::milliseconds(0);
    }

    // Exponential backoff: base * multiplier^(attempt-2), capped
    auto exp = attempt - 2;
    double factor = std::pow(opts_.multiplier, static_cast<double>(exp));
    double raw = static_cast<double>(opts_.base_delay.count()) * factor;
    auto cap = static_cast<double>(opts_.max_delay.count());
    if (!(raw < cap)) {
        return opts_.max_delay;
    }
    return std::chrono::milliseconds(static_cast<long long>(raw));
}

bool IsRetryable(const Status& status) {
    if (status.ok() || status.IsCancellation()) {
        return false;
    }
    return status.code() != StatusCode::invalid_argument && status.code() != StatusCode::circuit_open;
}

RetryOutcome RetryExecutor::Execute(const ContextPtr& ctx, const std::function<Status()>& op, std::string_view what) const {
    RetryOutcome out;
    const int max_attempts = policy_.max_attempts();

    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        if (attempt > 1) {
            auto delay = policy_.BackoffBeforeAttempt(attempt);
            if (!ctx->SleepFor(delay)) {
                out.status = ctx->Err();
                return out;
            }
        }

        out.attempts = attempt;
        out.status = op();
        if (out.status.ok()) {
            return out;
        }

        linkguard::log::debug("{} attempt {}/{} failed: {}", what, attempt, max_attempts, out.status.ToString());

        if (!IsRetryable(out.status)) {
            return out;
        }
    }
    out.exhausted = true;
    return out;
}

} // namespace linkguard::resilience
