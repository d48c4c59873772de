#include <linkguard/connectivity/summary.h>
#include <linkguard/connectivity/tiered_result.h>

namespace linkguard::connectivity {

std::string_view StrategyName(Strategy strategy) {
    switch (strategy) {
        case Strategy::lightweight_only: return "lightweight_only";
        case Strategy::escalated_to_comprehensive: return "escalated_to_comprehensive";
        case Strategy::lightweight_fallback: return "lightweight_fallback";
    }
    return "unknown";
}

TieredSummary TieredResult::Summary() const {
    TieredSummary s;
    s.strategy = std::string(StrategyName(strategy));
    s.overall_success = overall_success;
    s.short_circuited = short_circuited;
    s.total_duration_ms = total_duration.count();

    s.lightweight.success = lightweight.overall_success;
    s.lightweight.success_count = lightweight.success_count;
    s.lightweight.failure_count = lightweight.failure_count;
    s.lightweight.duration_ms = lightweight.duration.count();

    if (comprehensive) {
        ComprehensiveSummary c;
        c.success = comprehensive->overall_success;
        c.success_count = comprehensive->success_count;
        c.failure_count = comprehensive->failure_count;
        c.dns_tests = static_cast<int>(comprehensive->dns_results.size());
        c.http_tests = static_cast<int>(comprehensive->http_results.size());
        c.duration_ms = comprehensive->duration.count();
        c.escalated_from = comprehensive->escalated_from;
        s.comprehensive = std::move(c);
    }
    return s;
}

chjson::value TieredSummary::ToJson() const {
    chjson::value light(chjson::value::object{
        {"success", chjson::value(lightweight.success)},
        {"success_count", chjson::value::integer(static_cast<std::int64_t>(lightweight.success_count))},
        {"failure_count", chjson::value::integer(static_cast<std::int64_t>(lightweight.failure_count))},
        {"duration_ms", chjson::value::integer(lightweight.duration_ms)},
    });

    if (!comprehensive) {
        return chjson::value(chjson::value::object{
            {"strategy", chjson::value(strategy)},
            {"overall_success", chjson::value(overall_success)},
            {"short_circuited", chjson::value(short_circuited)},
            {"total_duration_ms", chjson::value::integer(total_duration_ms)},
            {"lightweight", std::move(light)},
        });
    }

    const auto& c = *comprehensive;
    return chjson::value(chjson::value::object{
        {"strategy", chjson::value(strategy)},
        {"overall_success", chjson::value(overall_success)},
        {"short_circuited", chjson::value(short_circuited)},
        {"total_duration_ms", chjson::value::integer(total_duration_ms)},
        {"lightweight", std::move(light)},
        {"comprehensive", chjson::value(chjson::value::object{
            {"success", chjson::value(c.success)},
            {"success_count", chjson::value::integer(static_cast<std::int64_t>(c.success_count))},
            {"failure_count", chjson::value::integer(static_cast<std::int64_t>(c.failure_count))},
            {"dns_tests", chjson::value::integer(static_cast<std::int64_t>(c.dns_tests))},
            {"http_tests", chjson::value::integer(static_cast<std::int64_t>(c.http_tests))},
            {"duration_ms", chjson::value::integer(c.duration_ms)},
            {"escalated_from", chjson::value(c.escalated_from)},
        })},
    });
}

std::string TieredSummary::ToJsonString() const {
    return chjson::dump(ToJson());
}

} // namespace linkguard::connectivity
