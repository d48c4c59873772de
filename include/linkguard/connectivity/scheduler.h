#pragma once

#include <linkguard/connectivity/tiered_result.h>
#include <linkguard/connectivity/tiered_tester.h>
#include <linkguard/core/context.h>
#include <linkguard/core/status.h>

namespace linkguard::connectivity {

struct SchedulePolicy {
    // force comprehensive once the caller has seen this many failed cycles in a row
    int failure_threshold = 3;
    // force comprehensive when a previous result exists and failures % interval == 0; 0 disables
    int periodic_interval = 10;
};

// Picks force_comprehensive from the caller's failure history and runs one tiered cycle.
class Scheduler {
public:
    explicit Scheduler(TieredTester& tester, SchedulePolicy policy = {});

    // `last` may be null (first cycle).
    bool ShouldForceComprehensive(const TieredResult* last, int consecutive_failures) const;

    // Thread-safe as TieredTester::RunTiered.
    linkguard::Result<TieredResult> ScheduleTests(const ContextPtr& ctx, const TieredResult* last, int consecutive_failures);

    const SchedulePolicy& policy() const { return policy_; }

private:
    TieredTester& tester_;
    SchedulePolicy policy_;
};

} // namespace linkguard::connectivity
