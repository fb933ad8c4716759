/**
 * @file control_plane.hpp
 * @brief Top-level facade that owns and wires every control plane component.
 * @author Dimitris Kafetzis
 *
 * Owns the single ObjectStore instance, the runtime, the node lifecycle
 * manager, the reconciler and the API server. Runs two cooperative loops:
 *   - reconcile: every `scheduler.reconcile_interval_ms`, or earlier when a
 *     workload is created, a placement is released or a node becomes Ready
 *   - health:    every `health.check_interval_ms`
 * and, when enabled, serves ApiCodec requests over TcpTransport.
 */

#pragma once

#include "api/api_server.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "executor/thread_pool.hpp"
#include "network/transport.hpp"
#include "node/node_manager.hpp"
#include "runtime/container_runtime.hpp"
#include "scheduler/reconciler.hpp"
#include "store/object_store.hpp"
#include "telemetry/metrics_collector.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string_view>
#include <thread>
#include <vector>

namespace kubesim {

/**
 * @brief Build the placement policy named in the configuration.
 */
Result<std::unique_ptr<IPlacementPolicy>> create_policy(std::string_view name);

class ControlPlane {
public:
    struct Options {
        Config config;
        std::shared_ptr<IContainerRuntime> runtime;     ///< Null: built from config.runtime
        std::unique_ptr<ILogSink> log_sink;             ///< Null: discard
        std::unique_ptr<ILogSink> metrics_sink;         ///< Null: discard
        LogLevel log_level = LogLevel::Info;
    };

    /**
     * @brief Validate the options and construct the control plane.
     *
     * Fails with Validation for an unknown runtime kind or placement policy.
     */
    static Result<std::unique_ptr<ControlPlane>> create(Options opts);

    ~ControlPlane();

    // Non-copyable, non-movable
    ControlPlane(const ControlPlane&) = delete;
    ControlPlane& operator=(const ControlPlane&) = delete;

    // ── Lifecycle ────────────────────────────
    Result<void> start();
    void stop();
    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    /// Request an early reconcile pass.
    void wake();

    // ── Accessors ────────────────────────────
    ApiServer& api() { return api_; }
    ObjectStore& store() { return store_; }
    NodeLifecycleManager& nodes() { return nodes_; }
    Reconciler& reconciler() { return reconciler_; }
    IContainerRuntime& runtime() { return *runtime_; }
    Logger& logger() { return logger_; }
    MetricsCollector& metrics() { return metrics_; }
    const Config& config() const { return config_; }

    /// Port the API server is bound to; 0 when not serving.
    [[nodiscard]] uint16_t api_port() const noexcept { return api_server_.bound_port(); }

private:
    ControlPlane(Options opts,
                 std::shared_ptr<IContainerRuntime> runtime,
                 std::unique_ptr<IPlacementPolicy> policy);

    void reconcile_loop(std::stop_token stop);
    void health_loop(std::stop_token stop);
    std::vector<uint8_t> handle_api_request(const std::vector<uint8_t>& request);

    Config config_;
    Logger logger_;
    MetricsCollector metrics_;

    ObjectStore store_;
    ThreadPool thread_pool_;
    std::shared_ptr<IContainerRuntime> runtime_;
    NodeLifecycleManager nodes_;
    Reconciler reconciler_;
    ApiServer api_;
    TcpTransport api_server_;

    std::mutex wake_mutex_;
    std::condition_variable_any wake_cv_;
    bool wake_pending_ = false;

    std::mutex health_mutex_;
    std::condition_variable_any health_cv_;

    std::jthread reconcile_thread_;
    std::jthread health_thread_;
    std::atomic<bool> running_{false};
};

}  // namespace kubesim
