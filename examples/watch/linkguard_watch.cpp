#include <linkguard/config/config.h>
#include <linkguard/config/settings.h>
#include <linkguard/connectivity/scheduler.h>
#include <linkguard/connectivity/tiered_tester.h>
#include <linkguard/core/context.h>
#include <linkguard/core/log.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>

namespace {

struct Options {
    std::string config_path;
    std::string log_level; // overrides the config file when set
    std::chrono::milliseconds interval{30000};
    int cycles = 0; // 0 = until signalled
};

void PrintUsage() {
    std::cout << "linkguard_watch options:\n"
              << "  --config <file.json>\n"
              << "  --log <trace|debug|info|warn|error|critical|off>\n"
              << "  --interval <duration, e.g. 30s>\n"
              << "  --cycles <n, 0 = until SIGINT/SIGTERM>\n";
}

} // namespace

int main(int argc, char** argv) {
    Options opt;

    for (int i = 1; i < argc; ++i) {
        std::string_view a(argv[i]);
        auto need = [&](const char* name) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "missing value for " << name << "\n";
                std::exit(2);
            }
            return argv[++i];
        };

        if (a == "--config") {
            opt.config_path = need("--config");
        } else if (a == "--log") {
            opt.log_level = need("--log");
        } else if (a == "--interval") {
            auto d = linkguard::config::ParseDuration(need("--interval"));
            if (!d.ok() || d.value().count() <= 0) {
                std::cerr << "invalid --interval, expected a positive duration such as 30s\n";
                return 2;
            }
            opt.interval = d.value();
        } else if (a == "--cycles") {
            opt.cycles = std::atoi(need("--cycles"));
        } else if (a == "--help" || a == "-h") {
            PrintUsage();
            return 0;
        }
    }

    linkguard::config::Settings settings;
    if (!opt.config_path.empty()) {
        auto cfg = linkguard::config::Config::LoadFile(opt.config_path);
        if (!cfg.ok()) {
            std::cerr << cfg.status().ToString() << "\n";
            return 2;
        }
        auto s = linkguard::config::LoadSettings(cfg.value());
        if (!s.ok()) {
            std::cerr << s.status().ToString() << "\n";
            return 2;
        }
        settings = std::move(s).value();
    }
    if (!opt.log_level.empty()) {
        if (!linkguard::log::IsValidLevel(opt.log_level)) {
            std::cerr << "invalid --log level: " << opt.log_level << "\n";
            return 2;
        }
        settings.log_level = opt.log_level;
    }
    linkguard::log::Init(settings.log_level);

    std::optional<linkguard::connectivity::TieredTester> tester;
    try {
        tester.emplace(settings.tester);
    } catch (const std::invalid_argument& e) {
        linkguard::log::error("invalid tester configuration: {}", e.what());
        return 2;
    }
    linkguard::connectivity::Scheduler scheduler(*tester, settings.schedule);

    auto root = linkguard::Context::WithCancel(linkguard::Context::Background());

    // SIGINT / SIGTERM cancel every probe in flight and the sleep between cycles.
    boost::asio::io_context signal_ioc;
    boost::asio::signal_set signals(signal_ioc, SIGINT, SIGTERM);
    signals.async_wait([root](const boost::system::error_code& ec, int sig) {
        if (ec) {
            return;
        }
        linkguard::log::info("signal {} received, stopping", sig);
        root->Cancel();
    });
    std::thread signal_thread([&signal_ioc] { signal_ioc.run(); });

    linkguard::log::info("linkguard_watch: {} tcp targets, {} dns servers, {} http urls, interval {}ms",
        tester->options().tcp_targets.size(), tester->options().dns_servers.size(),
        tester->options().http_urls.size(), opt.interval.count());

    int rc = 0;
    std::optional<linkguard::connectivity::TieredResult> last;
    int consecutive_failures = 0;

    for (int cycle = 1; opt.cycles <= 0 || cycle <= opt.cycles; ++cycle) {
        auto r = scheduler.ScheduleTests(root, last ? &*last : nullptr, consecutive_failures);
        if (!r.ok()) {
            if (r.status().IsCancellation()) {
                break;
            }
            linkguard::log::error("cycle {} failed: {}", cycle, r.status().ToString());
            rc = 1;
            break;
        }

        consecutive_failures = r.value().overall_success ? 0 : consecutive_failures + 1;
        linkguard::log::info("cycle {} (consecutive_failures={}): {}",
            cycle, consecutive_failures, r.value().Summary().ToJsonString());
        last = std::move(r).value();

        if (opt.cycles > 0 && cycle == opt.cycles) {
            break;
        }
        if (!root->SleepFor(opt.interval)) {
            break;
        }
    }

    signal_ioc.stop();
    signal_thread.join();
    return rc;
}
