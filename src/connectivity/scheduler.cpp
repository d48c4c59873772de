#include <linkguard/connectivity/scheduler.h>

#include <linkguard/core/log.h>

namespace linkguard::connectivity {

Scheduler::Scheduler(TieredTester& tester, SchedulePolicy policy) : tester_(tester), policy_(policy) {
    if (policy_.failure_threshold < 1) {
        policy_.failure_threshold = 1;
    }
    if (policy_.periodic_interval < 0) {
        policy_.periodic_interval = 0;
    }
}

bool Scheduler::ShouldForceComprehensive(const TieredResult* last, int consecutive_failures) const {
    bool force = false;

    if (consecutive_failures >= policy_.failure_threshold) {
        linkguard::log::debug("forcing comprehensive tests: {} consecutive failures", consecutive_failures);
        force = true;
    }

    if (last != nullptr && last->strategy == Strategy::escalated_to_comprehensive && !last->overall_success) {
        linkguard::log::debug("forcing comprehensive tests: previous escalated run failed");
        force = true;
    }

    // Periodic audit. With a clean streak (0 failures) this fires on every cycle after the first.
    if (last != nullptr && policy_.periodic_interval > 0 && consecutive_failures % policy_.periodic_interval == 0) {
        linkguard::log::debug("forcing comprehensive tests: periodic validation");
        force = true;
    }
    return force;
}

linkguard::Result<TieredResult> Scheduler::ScheduleTests(const ContextPtr& ctx, const TieredResult* last, int consecutive_failures) {
    return tester_.RunTiered(ctx, ShouldForceComprehensive(last, consecutive_failures));
}

} // namespace linkguard::connectivity
