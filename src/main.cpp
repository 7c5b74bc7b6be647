#include "flatpush/cancel.hpp"
#include "flatpush/client_config.hpp"
#include "flatpush/commands.hpp"
#include "flatpush/log.hpp"
#include "flatpush/metrics.hpp"
#include "flatpush/net/http.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

namespace {
volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int sig) {
    (void)sig;
    g_shutdown_requested = 1;
}
}  // namespace

int main(int argc, char* argv[]) {
    auto config_opt = flatpush::ClientConfig::from_args(argc, argv);
    if (!config_opt) {
        return 1;
    }
    auto config = std::move(*config_opt);
    if (config.show_help) {
        return 0;
    }

    if (config.verbose) {
        flatpush::set_log_level(flatpush::LogLevel::Debug);
    }

    auto err = config.resolve_token();
    if (err.empty()) err = config.validate();
    if (!err.empty()) {
        flatpush::CommandResult result = flatpush::UsageFailure{err};
        flatpush::log_error("%s", err.c_str());
        flatpush::CommandRunner::emit(config, result);
        return flatpush::result_exit_code(result);
    }

    // Install signal handlers
    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    flatpush::CancellableWaiter waiter;

    // Turn a signal into a cancellation of the current wait
    std::atomic<bool> done{false};
    std::thread signal_watcher([&] {
        while (!done.load()) {
            if (g_shutdown_requested) {
                flatpush::log_warn("Interrupted, cancelling");
                waiter.cancel();
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    std::unique_ptr<flatpush::MetricsExporter> metrics;
    if (!config.metrics_file.empty()) {
        metrics = std::make_unique<flatpush::MetricsExporter>(
            config.metrics_file, std::chrono::seconds(config.metrics_interval_secs),
            std::map<std::string, std::string>{{"command", flatpush::command_name(config.command)}});
        metrics->start();
    }

    flatpush::net::HttpClient http(config.http_config());

    flatpush::CommandRunner runner(config, http, waiter);
    runner.set_metrics(metrics.get());
    auto result = runner.run();

    const auto stats = http.stats();
    flatpush::log_debug("%zu HTTP requests (%zu failed), %llu bytes sent", stats.total_requests,
                        stats.failed_requests, static_cast<unsigned long long>(stats.bytes_sent));

    done = true;
    signal_watcher.join();

    if (metrics) {
        metrics->stop();
    }

    if (!flatpush::CommandRunner::emit(config, result)) {
        return 1;
    }
    return flatpush::result_exit_code(result);
}
