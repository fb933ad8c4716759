/**
 * @file scheduler.hpp
 * @brief Scheduler types, placement policy interface and pure planning.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/concepts.hpp"
#include "core/types.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kubesim {

// ─────────────────────────────────────────────
// Planning inputs / outputs
// ─────────────────────────────────────────────

/**
 * @brief Free capacity of one Ready node as seen by a placement policy.
 */
struct NodeCapacity {
    NodeId id;
    Resources free;
};

/**
 * @brief A Pending workload waiting for a node.
 */
struct PendingWorkload {
    WorkloadId id;
    Resources request;
    uint64_t sequence{0};       ///< Creation order; lower goes first
};

struct PlacementDecision {
    WorkloadId workload;
    std::optional<NodeId> node;         ///< Empty when nothing fits
};

/**
 * @brief In-memory status of a workload that could not be placed.
 */
struct SchedulingStatus {
    std::string reason;
    Timestamp last_checked;
};

/**
 * @brief Counters for one reconciliation pass.
 */
struct PassReport {
    uint32_t placed{0};
    uint32_t started{0};
    uint32_t failed{0};
    uint32_t evicted{0};        ///< Released by drift detection
    uint32_t unschedulable{0};
    uint32_t conflicts{0};

    /// True when the pass committed no change at all.
    [[nodiscard]] constexpr bool quiet() const noexcept {
        return placed == 0 && started == 0 && failed == 0 && evicted == 0;
    }
};

// ─────────────────────────────────────────────
// Placement policy
// ─────────────────────────────────────────────

/**
 * @brief Abstract interface for placement policies (runtime polymorphism).
 *
 * `nodes` is in ascending id order. The policy returns the index of the
 * chosen node, or std::nullopt when no node can hold `request`.
 */
class IPlacementPolicy {
public:
    virtual ~IPlacementPolicy() = default;
    [[nodiscard]] virtual std::optional<size_t> select(
        const Resources& request, const std::vector<NodeCapacity>& nodes) const = 0;
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

/**
 * @brief Deterministic placement of `pending` onto `nodes`.
 *
 * Workloads are considered in creation order and nodes in id order; each
 * decision reduces the chosen node's free capacity for the ones after it.
 * Identical inputs always produce identical decisions.
 */
template <PlacementPolicyLike Policy>
std::vector<PlacementDecision> plan_placements(const Policy& policy,
                                               std::vector<PendingWorkload> pending,
                                               std::vector<NodeCapacity> nodes) {
    std::stable_sort(pending.begin(), pending.end(),
        [](const PendingWorkload& a, const PendingWorkload& b) {
            return a.sequence < b.sequence;
        });
    std::sort(nodes.begin(), nodes.end(),
        [](const NodeCapacity& a, const NodeCapacity& b) { return a.id < b.id; });

    std::vector<PlacementDecision> decisions;
    decisions.reserve(pending.size());

    for (const auto& workload : pending) {
        auto chosen = policy.select(workload.request, nodes);
        if (!chosen) {
            decisions.push_back(PlacementDecision{workload.id, std::nullopt});
            continue;
        }
        nodes[*chosen].free -= workload.request;
        decisions.push_back(PlacementDecision{workload.id, nodes[*chosen].id});
    }
    return decisions;
}

}  // namespace kubesim
