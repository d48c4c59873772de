#include <linkguard/config/settings.h>

#include <linkguard/core/log.h>

#include <string>
#include <utility>

namespace linkguard::config {
namespace {

// Copies the value at `key` into `out` when present. Returns the getter's error otherwise.
template <class T, class Getter>
linkguard::Status Assign(const Config& cfg, std::string_view key, Getter get, T& out) {
    if (!cfg.Has(key)) {
        return linkguard::Status::Ok();
    }
    auto r = (cfg.*get)(key);
    if (!r.ok()) {
        return r.status();
    }
    out = std::move(r).value();
    return linkguard::Status::Ok();
}

linkguard::Status OutOfRange(std::string_view key, std::string_view rule) {
    return linkguard::Status(linkguard::StatusCode::invalid_argument, std::string(key) + ": " + std::string(rule));
}

} // namespace

linkguard::Result<Settings> LoadSettings(const Config& cfg) {
    Settings s;
    auto& t = s.tester;

    std::chrono::milliseconds breaker_reset = t.dns_breaker.reset_timeout;
    int breaker_threshold = static_cast<int>(t.dns_breaker.failure_threshold);

    const linkguard::Status steps[] = {
        Assign(cfg, "connection_timeout", &Config::GetDuration, t.connection_timeout),
        Assign(cfg, "http_timeout", &Config::GetDuration, t.http_timeout),
        Assign(cfg, "dns_servers", &Config::GetStringList, t.dns_servers),
        Assign(cfg, "http_urls", &Config::GetStringList, t.http_urls),
        Assign(cfg, "tcp_targets", &Config::GetStringList, t.tcp_targets),
        Assign(cfg, "dns_test_domains", &Config::GetStringList, t.dns_test_domains),
        Assign(cfg, "user_agent", &Config::GetString, t.user_agent),
        Assign(cfg, "retry_attempts", &Config::GetInt, t.retry.max_attempts),
        Assign(cfg, "retry_base_delay", &Config::GetDuration, t.retry.base_delay),
        Assign(cfg, "retry_max_delay", &Config::GetDuration, t.retry.max_delay),
        Assign(cfg, "retry_multiplier", &Config::GetDouble, t.retry.multiplier),
        Assign(cfg, "breaker_failure_threshold", &Config::GetInt, breaker_threshold),
        Assign(cfg, "breaker_reset_timeout", &Config::GetDuration, breaker_reset),
        Assign(cfg, "schedule_failure_threshold", &Config::GetInt, s.schedule.failure_threshold),
        Assign(cfg, "schedule_periodic_interval", &Config::GetInt, s.schedule.periodic_interval),
        Assign(cfg, "log_level", &Config::GetString, s.log_level),
    };
    for (const auto& st : steps) {
        if (!st.ok()) {
            return st;
        }
    }

    if (t.connection_timeout.count() <= 0) {
        return OutOfRange("connection_timeout", "must be positive");
    }
    if (t.http_timeout.count() <= 0) {
        return OutOfRange("http_timeout", "must be positive");
    }
    if (t.dns_test_domains.empty()) {
        return OutOfRange("dns_test_domains", "must name at least one domain");
    }
    if (t.retry.max_attempts < 1) {
        return OutOfRange("retry_attempts", "must be at least 1");
    }
    if (t.retry.base_delay.count() < 0) {
        return OutOfRange("retry_base_delay", "must not be negative");
    }
    if (t.retry.max_delay < t.retry.base_delay) {
        return OutOfRange("retry_max_delay", "must not be below retry_base_delay");
    }
    if (!(t.retry.multiplier >= 1.0)) {
        return OutOfRange("retry_multiplier", "must be at least 1");
    }
    if (breaker_threshold < 1) {
        return OutOfRange("breaker_failure_threshold", "must be at least 1");
    }
    if (breaker_reset.count() < 0) {
        return OutOfRange("breaker_reset_timeout", "must not be negative");
    }
    if (s.schedule.failure_threshold < 1) {
        return OutOfRange("schedule_failure_threshold", "must be at least 1");
    }
    if (s.schedule.periodic_interval < 0) {
        return OutOfRange("schedule_periodic_interval", "must not be negative");
    }
    if (!linkguard::log::IsValidLevel(s.log_level)) {
        return OutOfRange("log_level", "unknown level '" + s.log_level + "'");
    }

    t.dns_breaker.failure_threshold = static_cast<std::uint32_t>(breaker_threshold);
    t.dns_breaker.reset_timeout = breaker_reset;
    t.http_breaker = t.dns_breaker;
    return s;
}

} // namespace linkguard::config
