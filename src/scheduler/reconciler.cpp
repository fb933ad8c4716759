/**
 * @file reconciler.cpp
 * @brief Reconciler implementation.
 * @author Dimitris Kafetzis
 */

#include "scheduler/reconciler.hpp"

#include "store/bindings.hpp"

#include <algorithm>
#include <chrono>
#include <sstream>

namespace kubesim {

namespace {

std::vector<Versioned<Workload>> by_sequence(std::vector<Versioned<Workload>> workloads) {
    std::stable_sort(workloads.begin(), workloads.end(),
        [](const Versioned<Workload>& a, const Versioned<Workload>& b) {
            return a.sequence < b.sequence;
        });
    return workloads;
}

std::string describe(const Resources& r) {
    return "cpu=" + std::to_string(r.cpu) + " memory_mb=" + std::to_string(r.memory_mb);
}

}  // anonymous namespace

Reconciler::Reconciler(ObjectStore& store,
                       NodeLifecycleManager& nodes,
                       std::unique_ptr<IPlacementPolicy> policy,
                       Logger& logger,
                       MetricsCollector& metrics,
                       ReconcilerOptions options)
    : store_(store)
    , nodes_(nodes)
    , policy_(std::move(policy))
    , logger_(logger)
    , metrics_(metrics)
    , options_(options) {}

PassReport Reconciler::reconcile() {
    std::lock_guard lock(pass_mutex_);

    PassReport report;
    release_drifted(report);
    schedule_pending(report);
    start_scheduled(report);

    auto pass = passes_.fetch_add(1) + 1;

    std::ostringstream summary;
    summary << "placed=" << report.placed
            << " started=" << report.started
            << " failed=" << report.failed
            << " evicted=" << report.evicted
            << " unschedulable=" << report.unschedulable
            << " conflicts=" << report.conflicts;

    if (report.quiet()) {
        logger_.debug("Reconcile pass " + std::to_string(pass) + ": " + summary.str());
        return report;
    }

    logger_.info("Reconcile pass " + std::to_string(pass) + ": " + summary.str());

    std::ostringstream payload;
    payload << R"({"pass":)" << pass
            << R"(,"placed":)" << report.placed
            << R"(,"started":)" << report.started
            << R"(,"failed":)" << report.failed
            << R"(,"evicted":)" << report.evicted
            << R"(,"unschedulable":)" << report.unschedulable
            << R"(,"conflicts":)" << report.conflicts
            << "}";
    metrics_.record_custom("reconcile_pass", payload.str());
    return report;
}

// ─────────────────────────────────────────────
// Step 0: drift detection
// ─────────────────────────────────────────────

void Reconciler::release_drifted(PassReport& report) {
    auto active = store_.list<Workload>(
        [](const Workload& w) { return is_active(w.phase); });

    for (const auto& workload : active) {
        const auto& w = workload.object;
        std::string reason;
        NodeId node_id = w.node.value_or("");

        if (!w.node) {
            reason = "no node recorded";
        } else if (auto node = store_.get<Node>(*w.node); !node) {
            reason = "node " + *w.node + " no longer exists";
        } else if (node->object.phase != NodePhase::Ready) {
            reason = "node " + *w.node + " is " + std::string{to_string(node->object.phase)};
        } else {
            continue;
        }

        auto released = release_workload(store_, w.id, WorkloadPhase::Pending,
                                         "evicted: " + reason, options_.max_commit_retries);
        if (!released) {
            logger_.error("Release of drifted workload " + w.id + " failed: "
                          + released.error().message);
            continue;
        }
        if (*released) {
            ++report.evicted;
            logger_.warn("Evicted workload " + w.id + ": " + reason,
                         {{"workload", w.id}, {"node", node_id}});
            metrics_.record_eviction(w.id, node_id, reason);
            metrics_.record_workload_phase(w.id, WorkloadPhase::Pending, std::nullopt);
        }
    }
}

// ─────────────────────────────────────────────
// Steps 1-5: placement
// ─────────────────────────────────────────────

void Reconciler::schedule_pending(PassReport& report) {
    auto pending = by_sequence(store_.list<Workload>(
        [](const Workload& w) { return w.phase == WorkloadPhase::Pending; }));

    std::vector<WorkloadId> unschedulable;
    std::vector<WorkloadId> deferred;
    if (pending.empty()) {
        record_status(unschedulable, deferred);
        return;
    }

    auto ready = store_.list<Node>(
        [](const Node& n) { return n.phase == NodePhase::Ready; });
    auto decisions = plan(pending, ready);

    std::unordered_map<WorkloadId, const Versioned<Workload>*> workloads;
    for (const auto& w : pending) workloads.emplace(w.object.id, &w);
    std::unordered_map<NodeId, Versioned<Node>> snapshots;
    for (auto& n : ready) snapshots.emplace(n.object.id, std::move(n));

    for (const auto& decision : decisions) {
        if (!decision.node) {
            unschedulable.push_back(decision.workload);
            ++report.unschedulable;
            continue;
        }

        const auto& workload = *workloads.at(decision.workload);
        const auto& request = workload.object.request;
        auto& node = snapshots.at(*decision.node);

        auto bound = bind_workload(store_, workload, node);
        if (!bound) {
            deferred.push_back(workload.object.id);
            if (!bound.error().is(ErrorCode::Conflict)) {
                logger_.error("Bind of workload " + workload.object.id + " to node "
                              + node.object.id + " failed: " + bound.error().message);
                continue;
            }

            // Leave this workload for the next pass and refresh the node snapshot
            // so later decisions against it are checked on current state.
            ++report.conflicts;
            logger_.debug("Bind of workload " + workload.object.id + " to node "
                          + node.object.id + " conflicted: " + bound.error().message);
            if (auto fresh = store_.get<Node>(node.object.id); fresh) {
                node = *fresh;
            }
            continue;
        }

        node.revision = bound->node_revision;
        node.object.allocated += request;

        ++report.placed;
        logger_.info("Scheduled workload " + workload.object.id + " on node "
                     + node.object.id + " (" + describe(request) + ")",
                     {{"workload", workload.object.id}, {"node", node.object.id}});
        metrics_.record_placement(workload.object.id, node.object.id);
        metrics_.record_workload_phase(workload.object.id, WorkloadPhase::Scheduled,
                                       node.object.id);
    }

    record_status(unschedulable, deferred);
}

void Reconciler::record_status(const std::vector<WorkloadId>& unschedulable,
                               const std::vector<WorkloadId>& deferred) {
    const auto now = std::chrono::system_clock::now();
    std::unordered_map<WorkloadId, SchedulingStatus> next;

    std::lock_guard lock(status_mutex_);
    for (const auto& id : unschedulable) {
        if (!status_.contains(id)) {
            logger_.info("Workload " + id + " cannot fit on any ready node; leaving it pending");
        }
        next.emplace(id, SchedulingStatus{std::string{kCannotFit}, now});
    }
    for (const auto& id : deferred) {
        if (auto it = status_.find(id); it != status_.end()) {
            next.emplace(it->first, it->second);
        }
    }
    status_ = std::move(next);
}

std::optional<SchedulingStatus> Reconciler::scheduling_status(const WorkloadId& id) const {
    std::lock_guard lock(status_mutex_);
    auto it = status_.find(id);
    if (it == status_.end()) return std::nullopt;
    return it->second;
}

// ─────────────────────────────────────────────
// Step 6: start
// ─────────────────────────────────────────────

void Reconciler::start_scheduled(PassReport& report) {
    auto scheduled = by_sequence(store_.list<Workload>(
        [](const Workload& w) { return w.phase == WorkloadPhase::Scheduled; }));

    for (const auto& workload : scheduled) {
        const auto& w = workload.object;
        const NodeId node_id = w.node.value_or("");

        auto started = nodes_.start_workload(w);
        if (started) {
            auto running = store_.update<Workload>(w.id, workload.revision,
                [node_id](Workload& x) -> Result<void> {
                    if (x.phase != WorkloadPhase::Scheduled || x.node != node_id) {
                        return Error{ErrorCode::Conflict, "workload '" + x.id
                                     + "' changed while starting"};
                    }
                    x.phase = WorkloadPhase::Running;
                    x.message.clear();
                    return Result<void>{};
                });
            if (!running) {
                if (running.error().is(ErrorCode::Conflict)) ++report.conflicts;
                logger_.debug("Start of workload " + w.id + " not recorded: "
                              + running.error().message);
                continue;
            }
            ++report.started;
            logger_.info("Workload " + w.id + " running on node " + node_id,
                         {{"workload", w.id}, {"node", node_id}});
            metrics_.record_workload_phase(w.id, WorkloadPhase::Running, node_id);
            continue;
        }

        // A host that left Ready is an eviction, not a refusal.
        auto host = store_.get<Node>(node_id);
        const bool host_ready = host && host->object.phase == NodePhase::Ready;
        const WorkloadPhase target = host_ready ? WorkloadPhase::Failed : WorkloadPhase::Pending;
        const std::string reason = (host_ready ? "start refused: " : "evicted: ")
                                   + started.error().message;

        auto released = release_workload(store_, w.id, target, reason,
                                         options_.max_commit_retries);
        if (!released) {
            logger_.error("Release of workload " + w.id + " failed: " + released.error().message);
            continue;
        }
        if (!*released) continue;

        if (host_ready) {
            ++report.failed;
            logger_.error("Workload " + w.id + " failed to start on node " + node_id
                          + ": " + started.error().message,
                          {{"workload", w.id}, {"node", node_id}});
            metrics_.record_workload_phase(w.id, WorkloadPhase::Failed, std::nullopt);
        } else {
            ++report.evicted;
            logger_.warn("Evicted workload " + w.id + ": " + started.error().message,
                         {{"workload", w.id}, {"node", node_id}});
            metrics_.record_eviction(w.id, node_id, started.error().message);
            metrics_.record_workload_phase(w.id, WorkloadPhase::Pending, std::nullopt);
        }
    }
}

// ─────────────────────────────────────────────
// Planning
// ─────────────────────────────────────────────

std::vector<PlacementDecision> Reconciler::plan(
    const std::vector<Versioned<Workload>>& pending,
    const std::vector<Versioned<Node>>& nodes) const {
    std::vector<PendingWorkload> workloads;
    for (const auto& w : pending) {
        if (w.object.phase != WorkloadPhase::Pending) continue;
        workloads.push_back(PendingWorkload{w.object.id, w.object.request, w.sequence});
    }

    std::vector<NodeCapacity> capacities;
    for (const auto& n : nodes) {
        if (n.object.phase != NodePhase::Ready) continue;
        capacities.push_back(NodeCapacity{n.object.id, n.object.free()});
    }

    return plan_placements(*policy_, std::move(workloads), std::move(capacities));
}

}  // namespace kubesim
