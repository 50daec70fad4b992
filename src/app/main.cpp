/**
 * @file main.cpp
 * @brief RemoteShipper daemon entry point.
 * @author Dimitris Kafetzis
 *
 * Wires the modules into a complete shipping pipeline:
 *   Config → Logger → HostSampler → RemoteWriteClient (Encoder → Packager → Pool)
 */

#include "app/flush_schedule.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "resource_monitor/host_sampler.hpp"
#include "shipper/remote_write_client.hpp"
#include "telemetry/json_sink.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace remote_shipper;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::string url;
    std::string log_dir;
    std::string log_level;
    bool once = false;
};

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--url" && i + 1 < argc) {
            args.url = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--once") {
            args.once = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: remote_shipper [OPTIONS]\n"
                      << "  --config <path>     Configuration file (default: config/default.toml)\n"
                      << "  --url <url>         Remote write endpoint (overrides output.url)\n"
                      << "  --log-dir <path>    Log output directory (default: stdout)\n"
                      << "  --log-level <lvl>   debug, info, warn or error\n"
                      << "  --once              Ship a single batch, then exit\n"
                      << "  --help, -h          Show this help message\n";
            std::exit(0);
        }
    }
    return args;
}

/**
 * @brief Sample the host and ship one batch. Failures are logged and the
 *        batch is dropped; the next interval samples afresh.
 */
bool ship_once(const HostSampler& sampler, RemoteWriteClient& client, Logger& logger) {
    auto records = sampler.sample();
    if (!records) {
        logger.warn("Sampling failed: " + records.error().message);
        return false;
    }

    auto result = client.write(*records);
    if (!result) {
        const auto& err = result.error();
        logger.warn("Batch of " + std::to_string(records->size()) + " records not delivered ("
                    + std::string(to_string(err.kind)) + "): " + err.message);
        return false;
    }

    logger.debug("Delivered batch of " + std::to_string(records->size()) + " records");
    return true;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);

    // Load configuration
    auto config_result = load_config(args.config_path, args.url);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        return 1;
    }
    auto config = *config_result;

    // Apply CLI overrides
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;
    if (!args.log_level.empty()) config.telemetry.log_level = args.log_level;

    // ── Initialize Logger ────────────────────
    auto level = parse_log_level(config.telemetry.log_level);
    if (!level) {
        std::cerr << level.error().message << ", falling back to info" << std::endl;
    }

    std::unique_ptr<ILogSink> log_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "remote_shipper",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
    }
    Logger logger(std::move(log_sink), level.value_or(LogLevel::Info));
    logger.info("RemoteShipper starting...");
    logger.info("Endpoint: " + config.output.url);

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ── Initialize Output ────────────────────
    RemoteWriteClient client(config.output, config.pool, logger);
    if (auto connected = client.connect(); !connected) {
        std::cerr << "Cannot connect to " << config.output.url << ": "
                  << connected.error().message << std::endl;
        return 1;
    }

    const auto hostname = config.agent.hostname.empty()
        ? local_hostname() : config.agent.hostname;
    HostSampler sampler(hostname);

    if (args.once) {
        bool ok = ship_once(sampler, client, logger);
        client.close();
        logger.flush();
        return ok ? 0 : 2;
    }

    // ── Main Shipping Loop ───────────────────
    logger.info("Shipping every " + std::to_string(config.agent.flush_interval_ms)
                + "ms as host " + hostname + ". Press Ctrl+C to shutdown.");

    const auto interval = std::chrono::milliseconds(config.agent.flush_interval_ms);
    auto next_flush = std::chrono::steady_clock::now();
    while (!g_shutdown_requested) {
        if (std::chrono::steady_clock::now() >= next_flush) {
            ship_once(sampler, client, logger);
            next_flush = next_flush_after(next_flush, interval, std::chrono::steady_clock::now());
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    // ── Graceful Shutdown ────────────────────
    logger.info("Shutdown requested. Delivered "
                + std::to_string(client.delivered_batches()) + " batches, "
                + std::to_string(client.failed_batches()) + " failed.");
    client.close();
    logger.info("RemoteShipper stopped.");
    logger.flush();
    return 0;
}
