#include "bulkcp/copier.hpp"
#include "bulkcp/copy_config.hpp"
#include "bulkcp/core/log.hpp"
#include "bulkcp/metrics.hpp"
#include "bulkcp/progress.hpp"
#include "bulkcp/storage/router.hpp"
#include "bulkcp/transfer.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <sstream>
#include <thread>

namespace {
volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int sig) {
    (void)sig;
    g_shutdown_requested = 1;
}

bool is_secret(const std::string& key) {
    return key.find("key") != std::string::npos || key.find("secret") != std::string::npos ||
           key.find("token") != std::string::npos || key.find("credential") != std::string::npos;
}

void print_config(const bulkcp::CopyConfig& config, size_t transfer_count) {
    std::cout << "bulkcp starting..." << std::endl;
    std::cout << "  transfers: " << transfer_count << std::endl;
    std::cout << "  requester-pays-project: "
              << (config.requester_pays_project.empty() ? "(none)" : config.requester_pays_project)
              << std::endl;
    std::cout << "  max-simultaneous-transfers: " << config.max_simultaneous_transfers << std::endl;
    std::cout << "  worker-threads: "
              << (config.worker_threads ? config.worker_threads : config.max_simultaneous_transfers)
              << std::endl;
    std::cout << "  part-size: " << bulkcp::format_bytes(config.part_size) << std::endl;
    std::cout << "  chunk-size: " << bulkcp::format_bytes(config.chunk_size) << std::endl;
    if (config.timeout_secs > 0) {
        std::cout << "  timeout: " << config.timeout_secs << "s" << std::endl;
    }
    for (const auto* bc : {&config.s3, &config.azure, &config.gcs}) {
        for (auto& [k, v] : bc->params) {
            // Mask secrets in log output
            std::cout << "  " << bc->type << "-" << k << ": " << (is_secret(k) ? "****" : v)
                      << std::endl;
        }
    }
    if (!config.metrics_file.empty()) {
        std::cout << "  metrics-file: " << config.metrics_file.string() << std::endl;
    }
}
}  // namespace

int main(int argc, char* argv[]) {
    auto config_opt = bulkcp::CopyConfig::from_args(argc, argv);
    if (!config_opt) {
        return 2;
    }
    auto config = std::move(*config_opt);

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return 2;
    }
    bulkcp::set_verbose_logging(config.verbose);

    std::string files;
    if (config.files_json) {
        files = *config.files_json;
    } else {
        std::ostringstream ss;
        ss << std::cin.rdbuf();
        files = ss.str();
    }

    auto parsed = bulkcp::parse_transfers(files);
    if (!parsed.success) {
        std::cerr << "Error: " << parsed.error_message << "\n";
        return 2;
    }

    if (config.verbose) {
        print_config(config, parsed.transfers.size());
    }

    // Install signal handlers
    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    bulkcp::CancellationToken token;
    if (config.timeout_secs > 0) {
        token.set_deadline(std::chrono::steady_clock::now() +
                           std::chrono::seconds(config.timeout_secs));
    }

    std::unique_ptr<bulkcp::Router> router;
    try {
        router = std::make_unique<bulkcp::Router>(config.router_params());
    } catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 2;
    }
    bulkcp::ProgressSink progress;
    bulkcp::Copier copier(*router, config.copier_options(), progress);

    std::unique_ptr<bulkcp::MetricsExporter> metrics;
    if (!config.metrics_file.empty()) {
        metrics = std::make_unique<bulkcp::MetricsExporter>(
            config.metrics_file, std::chrono::seconds(config.metrics_interval_secs),
            std::map<std::string, std::string>{});
        metrics->set_progress(&progress);
        copier.set_metrics(metrics.get());
        metrics->start();
    }

    std::unique_ptr<bulkcp::ProgressReporter> reporter;
    if (config.verbose) {
        reporter = std::make_unique<bulkcp::ProgressReporter>(
            progress, std::cerr,
            std::chrono::milliseconds(bulkcp::constants::DEFAULT_PROGRESS_INTERVAL_MS));
        reporter->start();
    }

    // Turn a signal into a cancellation outside signal context. Started after
    // every constructor that can throw; the guard joins it on any exit.
    std::atomic<bool> finished{false};
    std::thread signal_watcher([&] {
        while (!finished) {
            if (g_shutdown_requested) {
                bulkcp::log_warn("Interrupted, cancelling transfers");
                token.cancel();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });
    struct WatcherGuard {
        std::atomic<bool>& finished;
        std::thread& thread;
        ~WatcherGuard() {
            finished = true;
            if (thread.joinable()) thread.join();
        }
    } watcher_guard{finished, signal_watcher};

    auto report = copier.run(parsed.transfers, token);

    if (reporter) reporter->stop();
    if (metrics) metrics->stop();
    finished = true;
    signal_watcher.join();
    router->close();

    report.summarize(std::cout);
    return report.overall_status() == bulkcp::OverallStatus::Success ? 0 : 1;
}
