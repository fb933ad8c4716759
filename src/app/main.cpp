/**
 * @file main.cpp
 * @brief kubesimd daemon entry point.
 * @author Dimitris Kafetzis
 *
 * Wires the control plane and serves the API until SIGINT/SIGTERM:
 *   Config → Logger → Runtime → ControlPlane (store, nodes, reconciler, API)
 */

#include "control_plane/control_plane.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "runtime/container_runtime.hpp"
#include "telemetry/json_sink.hpp"

#include <charconv>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace kubesim;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

void print_banner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════╗
  ║              kubesim v1.0.0               ║
  ║   Container Orchestration Control Plane   ║
  ║   Simulator                               ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/kubesim.toml";
    uint16_t port = 0;
    std::string runtime;
    std::string log_dir;
    bool demo_mode = false;
};

void print_usage() {
    std::cout << "Usage: kubesimd [OPTIONS]\n"
              << "  --config <path>    Configuration file (default: config/kubesim.toml)\n"
              << "  --port <port>      TCP port for the API server\n"
              << "  --runtime <kind>   Container runtime: simulated | process\n"
              << "  --log-dir <path>   Log output directory\n"
              << "  --demo             Run the two-node scheduling demo, then exit\n"
              << "  --help, -h         Show this help message\n";
}

Result<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            std::string value = argv[++i];
            uint16_t port = 0;
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), port);
            if (ec != std::errc{} || ptr != value.data() + value.size()) {
                return Error{ErrorCode::Validation, "invalid port: " + value};
            }
            args.port = port;
        } else if (arg == "--runtime" && i + 1 < argc) {
            args.runtime = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--demo") {
            args.demo_mode = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            return Error{ErrorCode::Validation, "unknown argument: " + arg};
        }
    }
    return args;
}

void print_status(const ClusterStatus& status) {
    std::cout << "\nNODES\n";
    for (const auto& node : status.nodes) {
        std::cout << "  " << node.id << "  " << to_string(node.phase)
                  << "  cpu " << node.free.cpu << "/" << node.capacity.cpu
                  << "  mem " << node.free.memory_mb << "/" << node.capacity.memory_mb
                  << "  workloads " << node.workload_count << "\n";
    }
    std::cout << "WORKLOADS\n";
    for (const auto& workload : status.workloads) {
        std::cout << "  " << workload.id << "  " << to_string(workload.phase)
                  << "  node " << workload.node.value_or("-");
        if (workload.scheduling) std::cout << "  (" << *workload.scheduling << ")";
        std::cout << "\n";
    }
    std::cout << std::endl;
}

/**
 * @brief Two nodes, two workloads that cannot both fit, then lose a node.
 */
int run_demo(Config config, std::unique_ptr<ILogSink> sink, LogLevel level) {
    config.api.enabled = false;
    config.runtime.kind = "simulated";

    auto created = ControlPlane::create(ControlPlane::Options{
        .config = std::move(config),
        .runtime = nullptr,
        .log_sink = std::move(sink),
        .metrics_sink = nullptr,
        .log_level = level
    });
    if (!created) {
        std::cerr << "Demo setup failed: " << created.error().message << std::endl;
        return 1;
    }
    auto& plane = **created;
    auto& api = plane.api();
    plane.logger().info("=== Demo Mode ===");

    for (const auto& request : {NodeRequest{"node-a", {4, 4096}}, NodeRequest{"node-b", {2, 2048}}}) {
        if (auto node = api.create_node(request); !node) {
            std::cerr << "create_node failed: " << node.error().message << std::endl;
            return 1;
        }
    }
    for (const auto& request : {WorkloadRequest{"w1", {3, 512}, 1}, WorkloadRequest{"w2", {3, 512}, 1}}) {
        if (auto workload = api.create_workload(request); !workload) {
            std::cerr << "create_workload failed: " << workload.error().message << std::endl;
            return 1;
        }
    }

    plane.reconciler().reconcile();
    std::cout << "After submitting w1 (3 cpu) and w2 (3 cpu):";
    print_status(api.cluster_status());

    if (auto deleted = api.delete_node("node-a"); !deleted) {
        std::cerr << "delete_node failed: " << deleted.error().message << std::endl;
        return 1;
    }
    plane.reconciler().reconcile();
    std::cout << "After deleting node-a:";
    print_status(api.cluster_status());

    plane.logger().info("=== Demo Complete ===");
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    print_banner();

    auto parsed = parse_args(argc, argv);
    if (!parsed) {
        std::cerr << parsed.error().message << std::endl;
        print_usage();
        return 2;
    }
    auto args = *parsed;

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (args.port != 0) config.api.port = args.port;
    if (!args.runtime.empty()) config.runtime.kind = args.runtime;
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;

    auto level = parse_log_level(config.telemetry.log_level);
    if (!level) {
        std::cerr << "Unknown log level '" << config.telemetry.log_level
                  << "', using info." << std::endl;
    }

    // ── Initialize Sinks ─────────────────────
    std::unique_ptr<ILogSink> log_sink;
    std::unique_ptr<ILogSink> metrics_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "kubesim",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
        metrics_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "kubesim_events",
                                                      config.telemetry.max_file_size_mb,
                                                      config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
        metrics_sink = std::make_unique<NullSink>();
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ── Demo mode shortcut ───────────────────
    if (args.demo_mode) {
        return run_demo(std::move(config), std::move(log_sink), level.value_or(LogLevel::Info));
    }

    // ── Initialize Control Plane ─────────────
    auto created = ControlPlane::create(ControlPlane::Options{
        .config = config,
        .runtime = nullptr,
        .log_sink = std::move(log_sink),
        .metrics_sink = std::move(metrics_sink),
        .log_level = level.value_or(LogLevel::Info)
    });
    if (!created) {
        std::cerr << "Invalid configuration: " << created.error().message << std::endl;
        return 1;
    }
    auto& plane = **created;

    if (auto started = plane.start(); !started) {
        std::cerr << "Failed to start: " << started.error().message << std::endl;
        return 1;
    }

    std::cout << "kubesimd '" << config.cluster_name << "' running";
    if (config.api.enabled) std::cout << ", API on port " << plane.api_port();
    std::cout << ". Press Ctrl+C to shut down." << std::endl;

    // ── Main Loop ────────────────────────────
    uint64_t loop_count = 0;
    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        // Periodic status line (every 30 seconds at 100ms intervals)
        if (++loop_count % 300 == 0) {
            auto status = plane.api().cluster_status();
            size_t ready = 0;
            for (const auto& node : status.nodes) {
                if (node.phase == NodePhase::Ready) ++ready;
            }
            plane.logger().info("Status: " + std::to_string(ready) + "/"
                                + std::to_string(status.nodes.size()) + " nodes ready, "
                                + std::to_string(status.workloads.size()) + " workloads, "
                                + std::to_string(plane.reconciler().pass_count()) + " passes");
        }
    }

    // ── Graceful Shutdown ────────────────────
    plane.logger().info("Shutdown requested. Cleaning up...");
    plane.stop();
    return 0;
}
