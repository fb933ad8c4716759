/**
 * @file api_server.cpp
 * @brief ApiServer implementation.
 * @author Dimitris Kafetzis
 */

#include "api/api_server.hpp"

#include "store/bindings.hpp"

#include <chrono>

namespace kubesim {

namespace {

bool is_label_char(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Validation
// ─────────────────────────────────────────────

bool is_dns_label(std::string_view name) noexcept {
    if (name.empty() || name.size() > kMaxNameLength) return false;
    if (!is_label_char(name.front()) || !is_label_char(name.back())) return false;
    for (char c : name) {
        if (!is_label_char(c) && c != '-') return false;
    }
    return true;
}

Result<void> validate_name(std::string_view name, std::string_view what) {
    if (!is_dns_label(name)) {
        return Error{ErrorCode::Validation, std::string{what} + " '" + std::string{name}
                     + "' must be a lowercase DNS-1123 label of at most "
                     + std::to_string(kMaxNameLength) + " characters"};
    }
    return Result<void>{};
}

Result<void> validate_resources(const Resources& resources, std::string_view what) {
    if (resources.cpu == 0) {
        return Error{ErrorCode::Validation, std::string{what} + " cpu must be positive"};
    }
    if (resources.memory_mb == 0) {
        return Error{ErrorCode::Validation, std::string{what} + " memory_mb must be positive"};
    }
    return Result<void>{};
}

Result<void> validate(const NodeRequest& request) {
    if (!request.name.empty()) {
        if (auto name = validate_name(request.name, "node name"); !name) return name;
    }
    return validate_resources(request.capacity, "node capacity");
}

Result<void> validate(const WorkloadRequest& request) {
    if (auto name = validate_name(request.name, "workload name"); !name) return name;
    if (auto res = validate_resources(request.request, "workload request"); !res) return res;

    if (request.replicas < 1 || request.replicas > kMaxReplicas) {
        return Error{ErrorCode::Validation, "replicas must be between 1 and "
                     + std::to_string(kMaxReplicas) + ", got "
                     + std::to_string(request.replicas)};
    }

    // The longest replica id must still be a valid label.
    if (request.replicas > 1) {
        auto last = replica_id(request, request.replicas - 1);
        if (auto name = validate_name(last, "replica name"); !name) return name;
    }
    return Result<void>{};
}

std::string replica_id(const WorkloadRequest& request, uint32_t index) {
    if (request.replicas <= 1) return request.name;
    return request.name + "-" + std::to_string(index);
}

// ─────────────────────────────────────────────
// ApiServer
// ─────────────────────────────────────────────

ApiServer::ApiServer(ObjectStore& store,
                     NodeLifecycleManager& nodes,
                     Reconciler& reconciler,
                     Logger& logger,
                     WakeFn wake)
    : store_(store)
    , nodes_(nodes)
    , reconciler_(reconciler)
    , logger_(logger)
    , wake_(std::move(wake)) {}

void ApiServer::wake() {
    if (wake_) wake_();
}

NodeStatus ApiServer::node_status(const Versioned<Node>& node) const {
    const auto& id = node.object.id;
    auto placements = store_.list<Placement>(
        [&id](const Placement& p) { return p.node_id == id; });

    return NodeStatus{
        .id = id,
        .phase = node.object.phase,
        .capacity = node.object.capacity,
        .free = node.object.free(),
        .workload_count = static_cast<uint32_t>(placements.size()),
        .message = node.object.message,
        .revision = node.revision
    };
}

WorkloadStatus ApiServer::workload_status(const Versioned<Workload>& workload) const {
    WorkloadStatus status{
        .id = workload.object.id,
        .group = workload.object.group,
        .phase = workload.object.phase,
        .node = workload.object.node,
        .request = workload.object.request,
        .message = workload.object.message,
        .scheduling = std::nullopt,
        .last_checked = std::nullopt,
        .revision = workload.revision
    };
    if (workload.object.phase == WorkloadPhase::Pending) {
        if (auto sched = reconciler_.scheduling_status(workload.object.id)) {
            status.scheduling = sched->reason;
            status.last_checked = sched->last_checked;
        }
    }
    return status;
}

Result<Versioned<Node>> ApiServer::live_node(const NodeId& id,
                                             std::optional<Revision> expected) const {
    auto node = store_.get<Node>(id);
    if (!node) return node.error();
    if (node->object.phase == NodePhase::Deleted) {
        return Error{ErrorCode::NotFound, "node '" + id + "' is deleted"};
    }
    if (expected && node->revision != *expected) {
        return Error{ErrorCode::Conflict, "node '" + id + "' is at revision "
                     + std::to_string(node->revision) + ", expected "
                     + std::to_string(*expected)};
    }
    return node;
}

// ── Nodes ────────────────────────────────────

Result<NodeStatus> ApiServer::create_node(const NodeRequest& request) {
    if (auto valid = validate(request); !valid) return valid.error();

    auto id = nodes_.provision(NodeSpec{request.name, request.capacity});
    wake();
    if (!id) {
        logger_.warn("create_node " + request.name + " failed: " + id.error().message);
        return id.error();
    }

    auto node = store_.get<Node>(*id);
    if (!node) return node.error();
    return node_status(*node);
}

Result<NodeStatus> ApiServer::get_node(const NodeId& id) const {
    auto node = store_.get<Node>(id);
    if (!node) return node.error();
    return node_status(*node);
}

std::vector<NodeStatus> ApiServer::list_nodes(std::optional<NodePhase> phase) const {
    auto nodes = store_.list<Node>([phase](const Node& n) {
        return !phase || n.phase == *phase;
    });

    std::vector<NodeStatus> result;
    result.reserve(nodes.size());
    for (const auto& node : nodes) {
        result.push_back(node_status(node));
    }
    return result;
}

Result<void> ApiServer::delete_node(const NodeId& id, std::optional<Revision> expected) {
    auto node = live_node(id, expected);
    if (!node) return node.error();

    auto terminated = nodes_.terminate(id);
    wake();
    if (!terminated) {
        logger_.warn("delete_node " + id + " failed: " + terminated.error().message);
    }
    return terminated;
}

Result<NodeStatus> ApiServer::drain_node(const NodeId& id, std::optional<Revision> expected) {
    auto node = live_node(id, expected);
    if (!node) return node.error();

    if (auto drained = nodes_.drain(id); !drained) return drained.error();
    wake();
    return get_node(id);
}

Result<NodeStatus> ApiServer::heartbeat(const NodeId& id) {
    if (auto stamped = nodes_.record_heartbeat(id); !stamped) return stamped.error();
    return get_node(id);
}

// ── Workloads ────────────────────────────────

Result<std::vector<WorkloadStatus>> ApiServer::create_workload(const WorkloadRequest& request) {
    if (auto valid = validate(request); !valid) return valid.error();

    const auto now = std::chrono::system_clock::now();
    WriteBatch batch;
    for (uint32_t i = 0; i < request.replicas; ++i) {
        batch.create(Workload{
            .id = replica_id(request, i),
            .group = request.name,
            .request = request.request,
            .phase = WorkloadPhase::Pending,
            .node = std::nullopt,
            .message = {},
            .created_at = now
        });
    }

    // All replicas are created together or not at all.
    auto committed = store_.commit(std::move(batch));
    if (!committed) return committed.error();

    logger_.info("Workload " + request.name + " submitted ("
                 + std::to_string(request.replicas) + " replicas, cpu="
                 + std::to_string(request.request.cpu) + " memory_mb="
                 + std::to_string(request.request.memory_mb) + ")");
    wake();

    std::vector<WorkloadStatus> created;
    created.reserve(committed->ids.size());
    for (const auto& id : committed->ids) {
        auto workload = store_.get<Workload>(id);
        if (workload) created.push_back(workload_status(*workload));
    }
    return created;
}

Result<WorkloadStatus> ApiServer::get_workload(const WorkloadId& id) const {
    auto workload = store_.get<Workload>(id);
    if (!workload) return workload.error();
    return workload_status(*workload);
}

std::vector<WorkloadStatus> ApiServer::list_workloads(std::optional<WorkloadPhase> phase) const {
    auto workloads = store_.list<Workload>([phase](const Workload& w) {
        return !phase || w.phase == *phase;
    });

    std::vector<WorkloadStatus> result;
    result.reserve(workloads.size());
    for (const auto& workload : workloads) {
        result.push_back(workload_status(workload));
    }
    return result;
}

Result<void> ApiServer::delete_workload(const WorkloadId& id, std::optional<Revision> expected) {
    if (auto removed = remove_workload(store_, id, expected); !removed) return removed;
    logger_.info("Workload " + id + " deleted");
    wake();
    return Result<void>{};
}

Result<WorkloadStatus> ApiServer::report_workload_exit(const WorkloadId& id, bool succeeded,
                                                       std::optional<Revision> expected) {
    auto workload = store_.get<Workload>(id);
    if (!workload) return workload.error();
    if (expected && workload->revision != *expected) {
        return Error{ErrorCode::Conflict, "workload '" + id + "' is at revision "
                     + std::to_string(workload->revision) + ", expected "
                     + std::to_string(*expected)};
    }
    if (workload->object.phase != WorkloadPhase::Running) {
        return Error{ErrorCode::Conflict, "workload '" + id + "' is "
                     + std::string{to_string(workload->object.phase)} + ", not running"};
    }

    const WorkloadPhase target = succeeded ? WorkloadPhase::Terminated : WorkloadPhase::Failed;
    auto released = release_workload(store_, id, target,
                                     succeeded ? "exited" : "crashed");
    if (!released) return released.error();
    if (!*released) {
        return Error{ErrorCode::Conflict, "workload '" + id + "' lost its placement"};
    }

    logger_.info("Workload " + id + " " + std::string{to_string(target)});
    wake();
    return get_workload(id);
}

// ── Cluster ──────────────────────────────────

ClusterStatus ApiServer::cluster_status() const {
    return ClusterStatus{list_nodes(), list_workloads()};
}

ApiResponse ApiServer::dispatch(const ApiRequest& request) {
    ApiResponse response;

    auto with_node = [&response](Result<NodeStatus> node) {
        if (!node) return ApiResponse::failure(node.error());
        response.nodes.push_back(std::move(*node));
        return response;
    };
    auto with_workload = [&response](Result<WorkloadStatus> workload) {
        if (!workload) return ApiResponse::failure(workload.error());
        response.workloads.push_back(std::move(*workload));
        return response;
    };
    auto with_void = [&response](Result<void> result) {
        if (!result) return ApiResponse::failure(result.error());
        return response;
    };

    switch (request.op) {
        case ApiOp::Health:
            response.message = "healthy";
            return response;

        case ApiOp::CreateNode:
            return with_node(create_node(NodeRequest{request.id, request.resources}));

        case ApiOp::GetNode:
            return with_node(get_node(request.id));

        case ApiOp::ListNodes: {
            std::optional<NodePhase> phase;
            if (request.phase_filter) {
                if (*request.phase_filter > static_cast<uint8_t>(NodePhase::Deleted)) {
                    return ApiResponse::failure(Error{ErrorCode::Validation, "unknown node phase"});
                }
                phase = static_cast<NodePhase>(*request.phase_filter);
            }
            response.nodes = list_nodes(phase);
            return response;
        }

        case ApiOp::DeleteNode:
            return with_void(delete_node(request.id, request.expected_revision));

        case ApiOp::DrainNode:
            return with_node(drain_node(request.id, request.expected_revision));

        case ApiOp::Heartbeat:
            return with_node(heartbeat(request.id));

        case ApiOp::CreateWorkload: {
            auto created = create_workload(
                WorkloadRequest{request.id, request.resources, request.replicas});
            if (!created) return ApiResponse::failure(created.error());
            response.workloads = std::move(*created);
            return response;
        }

        case ApiOp::GetWorkload:
            return with_workload(get_workload(request.id));

        case ApiOp::ListWorkloads: {
            std::optional<WorkloadPhase> phase;
            if (request.phase_filter) {
                if (*request.phase_filter > static_cast<uint8_t>(WorkloadPhase::Terminated)) {
                    return ApiResponse::failure(
                        Error{ErrorCode::Validation, "unknown workload phase"});
                }
                phase = static_cast<WorkloadPhase>(*request.phase_filter);
            }
            response.workloads = list_workloads(phase);
            return response;
        }

        case ApiOp::DeleteWorkload:
            return with_void(delete_workload(request.id, request.expected_revision));

        case ApiOp::ReportWorkloadExit:
            return with_workload(report_workload_exit(request.id, request.succeeded,
                                                      request.expected_revision));

        case ApiOp::ClusterStatus: {
            auto status = cluster_status();
            response.nodes = std::move(status.nodes);
            response.workloads = std::move(status.workloads);
            return response;
        }
    }

    return ApiResponse::failure(Error{ErrorCode::Validation, "unknown operation"});
}

}  // namespace kubesim
