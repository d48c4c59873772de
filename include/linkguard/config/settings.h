#pragma once

#include <string>

#include <linkguard/config/config.h>
#include <linkguard/connectivity/scheduler.h>
#include <linkguard/connectivity/tester_options.h>
#include <linkguard/core/status.h>

namespace linkguard::config {

struct Settings {
    connectivity::TesterOptions tester;
    connectivity::SchedulePolicy schedule;
    std::string log_level = "info";
};

// Missing keys keep the defaults. A malformed or out-of-range value is invalid_argument naming
// the key. The breaker keys apply to both breakers.
linkguard::Result<Settings> LoadSettings(const Config& cfg);

} // namespace linkguard::config
