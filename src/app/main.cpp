/**
 * @file main.cpp
 * @brief SandboxGate daemon entry point.
 *
 * Wires all modules into the serving process:
 *   Config → Logger → AuditLog → Runtime → Reaper → Gateway → HttpServer
 */

#include "api/service_api.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/thread_pool.hpp"
#include "gateway/gateway.hpp"
#include "network/http_server.hpp"
#include "orchestrator/reaper.hpp"
#include "runtime/container_runtime.hpp"
#include "runtime/docker_runtime.hpp"
#include "runtime/process_runtime.hpp"
#include "telemetry/audit_log.hpp"
#include "telemetry/json_sink.hpp"

#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace sandbox_gate;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    uint16_t port = 0;
    std::string backend;
    std::string log_dir;
    std::string log_level;
};

void print_usage() {
    std::cout << "Usage: sandbox_gate [OPTIONS]\n"
              << "  --config <path>     Configuration file (default: config/default.toml)\n"
              << "  --port <port>       HTTP listen port\n"
              << "  --backend <name>    Isolation backend: docker | process\n"
              << "  --log-dir <path>    Log output directory (default: stdout)\n"
              << "  --log-level <lvl>   debug | info | warn | error\n"
              << "  --help, -h          Show this help message\n";
}

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            args.port = static_cast<uint16_t>(std::stoi(argv[++i]));
        } else if (arg == "--backend" && i + 1 < argc) {
            args.backend = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage();
            std::exit(2);
        }
    }
    return args;
}

std::unique_ptr<IContainerRuntime> make_runtime(const Config& config,
                                                std::shared_ptr<Logger> logger) {
    if (config.runtime.backend == "process") {
        return std::make_unique<ProcessRuntime>(config.runtime, std::move(logger));
    }
    return std::make_unique<DockerRuntime>(config.runtime, std::move(logger));
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (args.port != 0) config.server.port = args.port;
    if (!args.backend.empty()) config.runtime.backend = args.backend;
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;
    if (!args.log_level.empty()) config.telemetry.log_level = args.log_level;

    if (auto valid = validate_config(config); !valid) {
        std::cerr << "Invalid configuration: " << valid.error().message << std::endl;
        return 1;
    }

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "sandbox_gate",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
    }
    auto level = parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info);
    auto logger = std::make_shared<Logger>(std::move(log_sink), level);
    logger->info("SandboxGate starting", {{"backend", config.runtime.backend},
                                          {"port", std::to_string(config.server.port)}});

    // ── Initialize Audit Trail ───────────────
    std::shared_ptr<AuditLog> audit;
    if (config.telemetry.audit_log) {
        std::unique_ptr<ILogSink> audit_sink;
        if (!config.telemetry.log_dir.empty()) {
            audit_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "audit",
                                                        config.telemetry.max_file_size_mb,
                                                        config.telemetry.rotate_count);
        } else {
            audit_sink = std::make_unique<StdoutSink>();
        }
        audit = std::make_shared<AuditLog>(std::move(audit_sink));
    }

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    // ── Initialize Runtime ───────────────────
    auto runtime = make_runtime(config, logger);
    if (auto ping = runtime->ping(); !ping) {
        logger->warn("Isolation backend unavailable at startup",
                     {{"backend", std::string(runtime->name())},
                      {"error", ping.error().message}});
    }

    // ── Initialize Reaper ────────────────────
    SandboxReaper reaper(*runtime, config.reaper, logger, audit);
    if (config.reaper.enabled) {
        reaper.start();
        logger->info("Sandbox reaper started",
                     {{"interval_s", std::to_string(config.reaper.interval_seconds)},
                      {"ttl_s", std::to_string(config.reaper.sandbox_ttl_seconds)}});
    }

    // ── Initialize Gateway ───────────────────
    ExecutionGateway gateway(config, *runtime, logger, audit);
    ServiceApi api(gateway, logger);

    // ── Initialize HTTP Server ───────────────
    auto worker_count = config.server.worker_threads == 0
        ? config.gateway.max_concurrency + 4
        : config.server.worker_threads;
    ThreadPool pool(worker_count, config.gateway.max_queue_depth + worker_count);

    HttpServerOptions options{
        .host = config.server.host,
        .port = config.server.port,
        .max_body_bytes = config.server.max_body_bytes,
        .read_timeout_ms = config.server.read_timeout_ms,
    };
    HttpServer server(options, pool, logger);
    auto listen_result = server.listen();
    if (!listen_result) {
        logger->error("Could not start HTTP server", {{"error", listen_result.error().message}});
        reaper.stop();
        return 1;
    }
    server.serve([&api](const HttpRequest& request, std::stop_token stop) {
        return api.handle(request, stop);
    });
    logger->info("HTTP server listening",
                 {{"host", config.server.host},
                  {"port", std::to_string(*listen_result)},
                  {"workers", std::to_string(pool.thread_count())}});

    // ── Main Loop ────────────────────────────
    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    // ── Graceful Shutdown ────────────────────
    logger->info("Shutdown requested. Cleaning up...");
    server.stop();
    for (const auto& entry : gateway.in_flight()) {
        gateway.cancel(entry.request_id);
    }
    pool.shutdown();
    reaper.stop();
    if (audit) audit->flush();

    logger->info("SandboxGate stopped.");
    logger->flush();
    return 0;
}
