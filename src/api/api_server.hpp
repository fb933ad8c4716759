/**
 * @file api_server.hpp
 * @brief Cluster-management operations with request validation.
 * @author Dimitris Kafetzis
 *
 * Every request is validated before it reaches the store. Writes accept an
 * optional expected revision; a mismatch is reported as Conflict and
 * nothing is changed. Creations and deletions wake the reconciler.
 */

#pragma once

#include "api/api_types.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "node/node_manager.hpp"
#include "scheduler/reconciler.hpp"
#include "store/object_store.hpp"

#include <functional>
#include <optional>
#include <string_view>
#include <vector>

namespace kubesim {

// ─────────────────────────────────────────────
// Validation
// ─────────────────────────────────────────────

/// Lowercase DNS-1123 label: [a-z0-9]([-a-z0-9]*[a-z0-9])?, at most 63 chars.
[[nodiscard]] bool is_dns_label(std::string_view name) noexcept;

Result<void> validate_name(std::string_view name, std::string_view what);
Result<void> validate_resources(const Resources& resources, std::string_view what);
Result<void> validate(const NodeRequest& request);
Result<void> validate(const WorkloadRequest& request);

/// Object id of replica `index` of a submission.
[[nodiscard]] std::string replica_id(const WorkloadRequest& request, uint32_t index);

// ─────────────────────────────────────────────
// ApiServer
// ─────────────────────────────────────────────

class ApiServer {
public:
    using WakeFn = std::function<void()>;

    ApiServer(ObjectStore& store,
              NodeLifecycleManager& nodes,
              Reconciler& reconciler,
              Logger& logger,
              WakeFn wake = {});

    // ── Nodes ────────────────────────────────
    Result<NodeStatus> create_node(const NodeRequest& request);
    Result<NodeStatus> get_node(const NodeId& id) const;
    std::vector<NodeStatus> list_nodes(std::optional<NodePhase> phase = std::nullopt) const;
    Result<void> delete_node(const NodeId& id, std::optional<Revision> expected = std::nullopt);
    Result<NodeStatus> drain_node(const NodeId& id, std::optional<Revision> expected = std::nullopt);
    Result<NodeStatus> heartbeat(const NodeId& id);

    // ── Workloads ────────────────────────────
    Result<std::vector<WorkloadStatus>> create_workload(const WorkloadRequest& request);
    Result<WorkloadStatus> get_workload(const WorkloadId& id) const;
    std::vector<WorkloadStatus> list_workloads(
        std::optional<WorkloadPhase> phase = std::nullopt) const;
    Result<void> delete_workload(const WorkloadId& id,
                                 std::optional<Revision> expected = std::nullopt);

    /// Running → Terminated (succeeded) or Failed; frees the placement.
    Result<WorkloadStatus> report_workload_exit(const WorkloadId& id, bool succeeded,
                                                std::optional<Revision> expected = std::nullopt);

    // ── Cluster ──────────────────────────────
    ClusterStatus cluster_status() const;

    /// Execute a decoded wire request.
    ApiResponse dispatch(const ApiRequest& request);

private:
    NodeStatus node_status(const Versioned<Node>& node) const;
    WorkloadStatus workload_status(const Versioned<Workload>& workload) const;
    Result<Versioned<Node>> live_node(const NodeId& id, std::optional<Revision> expected) const;
    void wake();

    ObjectStore& store_;
    NodeLifecycleManager& nodes_;
    Reconciler& reconciler_;
    Logger& logger_;
    WakeFn wake_;
};

}  // namespace kubesim
