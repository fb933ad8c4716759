/**
 * @file node_manager.cpp
 * @brief NodeLifecycleManager implementation.
 * @author Dimitris Kafetzis
 */

#include "node/node_manager.hpp"

#include "store/bindings.hpp"

#include <chrono>
#include <thread>

namespace kubesim {

namespace {

std::string describe(const Resources& r) {
    return "cpu=" + std::to_string(r.cpu) + " memory_mb=" + std::to_string(r.memory_mb);
}

}  // anonymous namespace

template <typename R>
R NodeLifecycleManager::call_runtime(std::string_view what,
                                     std::function<R(IContainerRuntime&)> call) {
    auto outcome = pool_.run_bounded(
        [runtime = runtime_, call = std::move(call)]() { return call(*runtime); },
        options_.operation_timeout);

    if (!outcome) {
        std::string message = std::string{what} + " timed out after "
            + std::to_string(options_.operation_timeout.count()) + "ms";
        logger_.error("Runtime " + std::string{runtime_->name()} + ": " + message + " ("
                      + std::to_string(pool_.overrunning_count()) + " of "
                      + std::to_string(pool_.thread_count()) + " workers still blocked)");
        return R{Error{ErrorCode::Runtime, message}};
    }
    return std::move(*outcome);
}

NodeLifecycleManager::NodeLifecycleManager(ObjectStore& store,
                                           std::shared_ptr<IContainerRuntime> runtime,
                                           ThreadPool& pool,
                                           Logger& logger,
                                           MetricsCollector& metrics,
                                           NodeManagerOptions options)
    : store_(store)
    , runtime_(std::move(runtime))
    , pool_(pool)
    , logger_(logger)
    , metrics_(metrics)
    , options_(options) {}

// ─────────────────────────────────────────────
// Provisioning
// ─────────────────────────────────────────────

Result<NodeId> NodeLifecycleManager::provision(const NodeSpec& spec) {
    if (spec.capacity.cpu == 0 || spec.capacity.memory_mb == 0) {
        return Error{ErrorCode::Validation, "node capacity must be positive"};
    }

    auto created = store_.create(Node{
        .id = spec.id,
        .capacity = spec.capacity,
        .allocated = {},
        .phase = NodePhase::Pending,
        .runtime_handle = {},
        .last_heartbeat = std::chrono::system_clock::now(),
        .missed_heartbeats = 0,
        .message = {}
    });
    if (!created) return created.error();

    const NodeId id = created->object.id;
    logger_.info("Node " + id + " recorded (" + describe(spec.capacity) + ")", {{"node", id}});
    notify_phase(id, NodePhase::Pending);

    if (auto provisioning = set_phase(id, NodePhase::Provisioning); !provisioning) {
        return provisioning.error();
    }

    EnvironmentSpec env{
        .name = "kubesim-" + id,
        .limits = spec.capacity,
        .labels = {{"app", "kubesim"}, {"type", "node"}, {"node", id}}
    };

    auto handle = call_runtime<Result<RuntimeHandle>>("create_environment",
        [env](IContainerRuntime& rt) { return rt.create_environment(env); });
    if (!handle) {
        fail_node(id, "create_environment: " + handle.error().message);
        return Error{ErrorCode::Runtime, handle.error().message};
    }

    const RuntimeHandle runtime_handle = *handle;
    auto recorded = mutate_node(id, [runtime_handle](Node& n) -> Result<void> {
        if (n.phase != NodePhase::Provisioning) {
            return Error{ErrorCode::Conflict, "node '" + n.id + "' left provisioning ("
                         + std::string{to_string(n.phase)} + ")"};
        }
        n.runtime_handle = runtime_handle;
        return Result<void>{};
    });
    if (!recorded) {
        discard_environment(runtime_handle);
        return recorded.error();
    }

    auto started = call_runtime<Result<void>>("start_environment",
        [runtime_handle](IContainerRuntime& rt) { return rt.start_environment(runtime_handle); });
    if (!started) {
        discard_environment(runtime_handle);
        fail_node(id, "start_environment: " + started.error().message);
        return Error{ErrorCode::Runtime, started.error().message};
    }

    // Wait until the runtime reports the environment live and reachable.
    bool live = false;
    auto deadline = std::chrono::steady_clock::now() + options_.readiness_timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        auto alive = call_runtime<Result<bool>>("is_alive",
            [runtime_handle](IContainerRuntime& rt) { return Result<bool>{rt.is_alive(runtime_handle)}; });
        if (alive && *alive) {
            live = true;
            break;
        }
        std::this_thread::sleep_for(options_.readiness_poll);
    }

    if (!live) {
        discard_environment(runtime_handle);
        std::string message = "environment did not become live within "
            + std::to_string(options_.readiness_timeout.count()) + "ms";
        fail_node(id, message);
        return Error{ErrorCode::Runtime, message};
    }

    auto ready = mutate_node(id, [](Node& n) -> Result<void> {
        if (n.phase != NodePhase::Provisioning) {
            return Error{ErrorCode::Conflict, "node '" + n.id + "' left provisioning ("
                         + std::string{to_string(n.phase)} + ")"};
        }
        n.phase = NodePhase::Ready;
        n.last_heartbeat = std::chrono::system_clock::now();
        n.missed_heartbeats = 0;
        n.message.clear();
        return Result<void>{};
    });
    if (!ready) {
        discard_environment(runtime_handle);
        return ready.error();
    }

    logger_.info("Node " + id + " ready on " + std::string{runtime_->name()}
                 + " environment " + runtime_handle,
                 {{"node", id}, {"environment", runtime_handle}});
    notify_phase(id, NodePhase::Ready);
    return id;
}

// ─────────────────────────────────────────────
// Draining / Termination
// ─────────────────────────────────────────────

Result<void> NodeLifecycleManager::drain(const NodeId& id) {
    auto draining = mutate_node(id, [](Node& n) -> Result<void> {
        if (n.phase != NodePhase::Ready) {
            return Error{ErrorCode::Conflict, "node '" + n.id + "' is "
                         + std::string{to_string(n.phase)} + "; only ready nodes can be drained"};
        }
        n.phase = NodePhase::Draining;
        n.message = "draining";
        return Result<void>{};
    });
    if (!draining) return draining.error();

    notify_phase(id, NodePhase::Draining);
    auto evicted = evict_workloads(id, "node " + id + " drained");
    logger_.info("Node " + id + " draining, " + std::to_string(evicted) + " workloads evicted",
                 {{"node", id}});
    return Result<void>{};
}

Result<void> NodeLifecycleManager::terminate(const NodeId& id) {
    auto draining = mutate_node(id, [](Node& n) -> Result<void> {
        if (n.phase == NodePhase::Deleted) {
            return Error{ErrorCode::NotFound, "node '" + n.id + "' is already deleted"};
        }
        n.phase = NodePhase::Draining;
        n.message = "terminating";
        return Result<void>{};
    });
    if (!draining) return draining.error();
    notify_phase(id, NodePhase::Draining);

    // Evictions happen before teardown so no workload is lost with the node.
    auto evicted = evict_workloads(id, "node " + id + " terminated");

    auto node = store_.get<Node>(id);
    if (!node) return node.error();
    const RuntimeHandle runtime_handle = node->object.runtime_handle;

    if (!runtime_handle.empty()) {
        auto stopped = call_runtime<Result<void>>("stop_environment",
            [runtime_handle](IContainerRuntime& rt) { return rt.stop_environment(runtime_handle); });
        if (!stopped && !stopped.error().is(ErrorCode::NotFound)) {
            fail_node(id, "stop_environment: " + stopped.error().message);
            return Error{ErrorCode::Runtime, stopped.error().message};
        }

        auto removed = call_runtime<Result<void>>("remove_environment",
            [runtime_handle](IContainerRuntime& rt) { return rt.remove_environment(runtime_handle); });
        if (!removed && !removed.error().is(ErrorCode::NotFound)) {
            fail_node(id, "remove_environment: " + removed.error().message);
            return Error{ErrorCode::Runtime, removed.error().message};
        }
    }

    auto deleted = mutate_node(id, [](Node& n) -> Result<void> {
        n.phase = NodePhase::Deleted;
        n.runtime_handle.clear();
        n.message = "deleted";
        return Result<void>{};
    });
    if (!deleted) return deleted.error();

    logger_.info("Node " + id + " deleted (" + std::to_string(evicted) + " workloads evicted)",
                 {{"node", id}});
    notify_phase(id, NodePhase::Deleted);
    return Result<void>{};
}

size_t NodeLifecycleManager::evict_workloads(const NodeId& id, const std::string& reason) {
    auto placements = store_.list<Placement>(
        [&id](const Placement& p) { return p.node_id == id; });

    size_t evicted = 0;
    for (const auto& placement : placements) {
        const auto& workload_id = placement.object.id;
        auto released = release_workload(store_, workload_id, WorkloadPhase::Pending,
                                         "evicted: " + reason, options_.max_commit_retries);
        if (!released) {
            logger_.error("Eviction of workload " + workload_id + " from node " + id
                          + " failed: " + released.error().message);
            continue;
        }
        if (*released) {
            ++evicted;
            logger_.warn("Evicted workload " + workload_id + " from node " + id + ": " + reason,
                         {{"node", id}, {"workload", workload_id}});
            metrics_.record_eviction(workload_id, id, reason);
            metrics_.record_workload_phase(workload_id, WorkloadPhase::Pending, std::nullopt);
        }
    }
    return evicted;
}

// ─────────────────────────────────────────────
// Health
// ─────────────────────────────────────────────

Result<NodePhase> NodeLifecycleManager::health_check(const NodeId& id) {
    auto node = store_.get<Node>(id);
    if (!node) return node.error();
    if (node->object.phase != NodePhase::Ready) return node->object.phase;

    const RuntimeHandle runtime_handle = node->object.runtime_handle;
    auto alive = call_runtime<Result<bool>>("is_alive",
        [runtime_handle](IContainerRuntime& rt) { return Result<bool>{rt.is_alive(runtime_handle)}; });

    auto current_phase = [this, &id]() -> Result<NodePhase> {
        auto fresh = store_.get<Node>(id);
        if (!fresh) return fresh.error();
        return fresh->object.phase;
    };

    if (alive && *alive) {
        auto stamped = mutate_node(id, [](Node& n) -> Result<void> {
            if (n.phase != NodePhase::Ready) {
                return Error{ErrorCode::Conflict, "node '" + n.id + "' left ready"};
            }
            n.last_heartbeat = std::chrono::system_clock::now();
            n.missed_heartbeats = 0;
            return Result<void>{};
        });
        if (!stamped) return current_phase();
        return NodePhase::Ready;
    }

    const uint32_t threshold = options_.missed_heartbeat_threshold;
    uint32_t misses = 0;
    auto missed = mutate_node(id, [threshold, &misses](Node& n) -> Result<void> {
        if (n.phase != NodePhase::Ready) {
            return Error{ErrorCode::Conflict, "node '" + n.id + "' left ready"};
        }
        n.missed_heartbeats += 1;
        misses = n.missed_heartbeats;
        if (n.missed_heartbeats >= threshold) {
            n.phase = NodePhase::Failed;
            n.message = "missed " + std::to_string(n.missed_heartbeats)
                        + " consecutive heartbeats";
        }
        return Result<void>{};
    });
    if (!missed) return current_phase();

    if (misses < threshold) {
        logger_.warn("Node " + id + " missed heartbeat " + std::to_string(misses)
                     + "/" + std::to_string(threshold), {{"node", id}});
        return NodePhase::Ready;
    }

    logger_.error("Node " + id + " failed: missed " + std::to_string(misses)
                  + " consecutive heartbeats", {{"node", id}});
    notify_phase(id, NodePhase::Failed);
    evict_workloads(id, "node " + id + " failed health check");
    return NodePhase::Failed;
}

size_t NodeLifecycleManager::health_check_all() {
    auto ready = store_.list<Node>(
        [](const Node& n) { return n.phase == NodePhase::Ready; });

    size_t failed = 0;
    for (const auto& node : ready) {
        auto phase = health_check(node.object.id);
        if (phase && *phase == NodePhase::Failed) ++failed;
    }
    return failed;
}

Result<void> NodeLifecycleManager::record_heartbeat(const NodeId& id) {
    auto stamped = mutate_node(id, [](Node& n) -> Result<void> {
        if (n.phase == NodePhase::Deleted) {
            return Error{ErrorCode::NotFound, "node '" + n.id + "' is deleted"};
        }
        n.last_heartbeat = std::chrono::system_clock::now();
        n.missed_heartbeats = 0;
        return Result<void>{};
    });
    if (!stamped) return stamped.error();
    logger_.debug("Heartbeat received for node " + id);
    return Result<void>{};
}

Result<void> NodeLifecycleManager::start_workload(const Workload& workload) {
    if (!workload.node) {
        return Error{ErrorCode::Runtime, "workload '" + workload.id + "' is not bound to a node"};
    }

    auto node = store_.get<Node>(*workload.node);
    if (!node) {
        return Error{ErrorCode::Runtime, "host node '" + *workload.node + "' not found"};
    }
    if (node->object.phase != NodePhase::Ready) {
        return Error{ErrorCode::Runtime, "host node '" + *workload.node + "' is "
                     + std::string{to_string(node->object.phase)}};
    }

    const RuntimeHandle runtime_handle = node->object.runtime_handle;
    auto alive = call_runtime<Result<bool>>("is_alive",
        [runtime_handle](IContainerRuntime& rt) { return Result<bool>{rt.is_alive(runtime_handle)}; });
    if (!alive) return alive.error();
    if (!*alive) {
        return Error{ErrorCode::Runtime, "environment of node '" + *workload.node
                     + "' is not live"};
    }
    return Result<void>{};
}

// ─────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────

void NodeLifecycleManager::on_phase_change(NodePhaseListener listener) {
    std::lock_guard lock(listeners_mutex_);
    listeners_.push_back(std::move(listener));
}

Result<Revision> NodeLifecycleManager::mutate_node(const NodeId& id,
                                                   const Mutation<Node>& mutation) {
    for (uint32_t attempt = 0; attempt <= options_.max_commit_retries; ++attempt) {
        auto current = store_.get<Node>(id);
        if (!current) return current.error();

        // A mutation that rejects the current state will reject it again;
        // only revision races are worth retrying.
        Node probe = current->object;
        if (auto precheck = mutation(probe); !precheck) return precheck.error();

        auto updated = store_.update<Node>(id, current->revision, mutation);
        if (updated) return *updated;
        if (!updated.error().is(ErrorCode::Conflict)) return updated.error();
    }
    return Error{ErrorCode::Conflict, "gave up updating node '" + id + "' after "
                 + std::to_string(options_.max_commit_retries + 1) + " conflicting attempts"};
}

Result<void> NodeLifecycleManager::set_phase(const NodeId& id, NodePhase phase,
                                             std::string message) {
    auto updated = mutate_node(id, [phase, message](Node& n) -> Result<void> {
        if (n.phase == NodePhase::Deleted) {
            return Error{ErrorCode::Conflict, "node '" + n.id + "' is deleted"};
        }
        n.phase = phase;
        n.message = message;
        return Result<void>{};
    });
    if (!updated) return updated.error();
    notify_phase(id, phase);
    return Result<void>{};
}

void NodeLifecycleManager::fail_node(const NodeId& id, const std::string& message) {
    logger_.error("Node " + id + " failed: " + message, {{"node", id}});
    if (auto failed = set_phase(id, NodePhase::Failed, message); !failed) {
        logger_.error("Could not mark node " + id + " failed: " + failed.error().message);
    }
}

void NodeLifecycleManager::discard_environment(const RuntimeHandle& handle) {
    auto stopped = call_runtime<Result<void>>("stop_environment",
        [handle](IContainerRuntime& rt) { return rt.stop_environment(handle); });
    if (!stopped && !stopped.error().is(ErrorCode::NotFound)) {
        logger_.error("Cleanup of environment " + handle + " failed: " + stopped.error().message,
                      {{"environment", handle}});
    }
    auto removed = call_runtime<Result<void>>("remove_environment",
        [handle](IContainerRuntime& rt) { return rt.remove_environment(handle); });
    if (!removed && !removed.error().is(ErrorCode::NotFound)) {
        logger_.error("Cleanup of environment " + handle + " failed: " + removed.error().message,
                      {{"environment", handle}});
    }
}

void NodeLifecycleManager::notify_phase(const NodeId& id, NodePhase phase) {
    metrics_.record_node_phase(id, phase);

    std::vector<NodePhaseListener> listeners;
    {
        std::lock_guard lock(listeners_mutex_);
        listeners = listeners_;
    }
    for (const auto& listener : listeners) {
        listener(id, phase);
    }
}

}  // namespace kubesim
