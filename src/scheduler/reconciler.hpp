/**
 * @file reconciler.hpp
 * @brief Reconciliation engine: converge observed state toward desired state.
 * @author Dimitris Kafetzis
 *
 * One pass:
 *   0. Release Scheduled/Running workloads whose node is gone or not Ready.
 *   1. Place Pending workloads (creation order) onto Ready nodes (id order)
 *      using the placement policy; each placement is one atomic bind commit.
 *   2. Ask the node lifecycle manager to start every Scheduled workload.
 *
 * A pass over a converged cluster commits nothing. Workloads that cannot be
 * placed stay Pending; their "cannot fit" status lives only in memory.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"
#include "node/node_manager.hpp"
#include "scheduler/scheduler.hpp"
#include "store/object_store.hpp"
#include "telemetry/metrics_collector.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace kubesim {

inline constexpr std::string_view kCannotFit = "cannot fit";

struct ReconcilerOptions {
    uint32_t max_commit_retries{8};
};

class Reconciler {
public:
    Reconciler(ObjectStore& store,
               NodeLifecycleManager& nodes,
               std::unique_ptr<IPlacementPolicy> policy,
               Logger& logger,
               MetricsCollector& metrics,
               ReconcilerOptions options = {});

    // Non-copyable
    Reconciler(const Reconciler&) = delete;
    Reconciler& operator=(const Reconciler&) = delete;

    /// Run one pass. Concurrent callers are serialized.
    PassReport reconcile();

    /// Placement decisions for a snapshot, without committing anything.
    [[nodiscard]] std::vector<PlacementDecision> plan(
        const std::vector<Versioned<Workload>>& pending,
        const std::vector<Versioned<Node>>& nodes) const;

    /// "cannot fit" status of a Pending workload, if the last pass recorded one.
    [[nodiscard]] std::optional<SchedulingStatus> scheduling_status(const WorkloadId& id) const;

    [[nodiscard]] uint64_t pass_count() const noexcept { return passes_.load(); }
    [[nodiscard]] std::string_view policy_name() const noexcept { return policy_->name(); }

private:
    void release_drifted(PassReport& report);
    void schedule_pending(PassReport& report);
    void start_scheduled(PassReport& report);
    void record_status(const std::vector<WorkloadId>& unschedulable,
                       const std::vector<WorkloadId>& deferred);

    ObjectStore& store_;
    NodeLifecycleManager& nodes_;
    std::unique_ptr<IPlacementPolicy> policy_;
    Logger& logger_;
    MetricsCollector& metrics_;
    ReconcilerOptions options_;

    std::mutex pass_mutex_;
    std::atomic<uint64_t> passes_{0};

    mutable std::mutex status_mutex_;
    std::unordered_map<WorkloadId, SchedulingStatus> status_;
};

}  // namespace kubesim
