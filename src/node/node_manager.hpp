/**
 * @file node_manager.hpp
 * @brief Node lifecycle: provisioning, draining, teardown, health checks.
 * @author Dimitris Kafetzis
 *
 * Owns every Node object in the store and the runtime environment behind
 * it. Runtime calls are slow and may hang, so each one runs on the thread
 * pool under a deadline and never while a store lock is held; the resulting
 * phase transition is committed afterwards with a revision-checked
 * read-modify-write that is retried on conflict.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/thread_pool.hpp"
#include "runtime/container_runtime.hpp"
#include "store/object_store.hpp"
#include "telemetry/metrics_collector.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace kubesim {

/**
 * @brief Request to provision a node. An empty id is generated by the store.
 */
struct NodeSpec {
    NodeId id;
    Resources capacity;
};

struct NodeManagerOptions {
    Duration operation_timeout{5000};       ///< Per runtime call
    Duration readiness_timeout{10000};      ///< Until is_alive after start
    Duration readiness_poll{50};
    uint32_t missed_heartbeat_threshold{3};
    uint32_t max_commit_retries{8};
};

using NodePhaseListener = std::function<void(const NodeId&, NodePhase)>;

class NodeLifecycleManager {
public:
    NodeLifecycleManager(ObjectStore& store,
                         std::shared_ptr<IContainerRuntime> runtime,
                         ThreadPool& pool,
                         Logger& logger,
                         MetricsCollector& metrics,
                         NodeManagerOptions options = {});

    // Non-copyable
    NodeLifecycleManager(const NodeLifecycleManager&) = delete;
    NodeLifecycleManager& operator=(const NodeLifecycleManager&) = delete;

    /**
     * @brief Create a node and bring its environment up.
     *
     * Pending → Provisioning → Ready. A runtime failure or timeout leaves
     * the node Failed (still visible in the store) and returns the error.
     */
    Result<NodeId> provision(const NodeSpec& spec);

    /// Ready → Draining; hosted workloads are evicted back to Pending.
    Result<void> drain(const NodeId& id);

    /**
     * @brief Evict hosted workloads, tear the environment down, mark Deleted.
     *
     * A teardown failure leaves the node Failed and returns the error; the
     * evictions have already happened at that point.
     */
    Result<void> terminate(const NodeId& id);

    /**
     * @brief Poll a Ready node's environment.
     *
     * Consecutive misses reaching the threshold move the node to Failed
     * and evict its workloads. Non-Ready nodes are returned unchanged.
     */
    Result<NodePhase> health_check(const NodeId& id);

    /// Health-check every Ready node. Returns how many transitioned to Failed.
    size_t health_check_all();

    /// External heartbeat: stamp the time and clear missed heartbeats.
    Result<void> record_heartbeat(const NodeId& id);

    /// Confirm a Scheduled workload's host is Ready and its environment live.
    Result<void> start_workload(const Workload& workload);

    /// Evict every workload placed on `id`. Returns the number evicted.
    size_t evict_workloads(const NodeId& id, const std::string& reason);

    void on_phase_change(NodePhaseListener listener);

    [[nodiscard]] const NodeManagerOptions& options() const noexcept { return options_; }

private:
    Result<Revision> mutate_node(const NodeId& id, const Mutation<Node>& mutation);
    Result<void> set_phase(const NodeId& id, NodePhase phase, std::string message = {});
    void fail_node(const NodeId& id, const std::string& message);
    /// Stop and remove an environment no node record owns. Errors are logged.
    void discard_environment(const RuntimeHandle& handle);
    void notify_phase(const NodeId& id, NodePhase phase);

    /// Run a runtime call under the operation timeout.
    template <typename R>
    R call_runtime(std::string_view what,
                   std::function<R(IContainerRuntime&)> call);

    ObjectStore& store_;
    std::shared_ptr<IContainerRuntime> runtime_;
    ThreadPool& pool_;
    Logger& logger_;
    MetricsCollector& metrics_;
    NodeManagerOptions options_;

    std::mutex listeners_mutex_;
    std::vector<NodePhaseListener> listeners_;
};

}  // namespace kubesim
