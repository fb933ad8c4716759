/**
 * @file types.hpp
 * @brief Fundamental types used throughout kubesim.
 * @author Dimitris Kafetzis
 *
 * Defines identifiers, Resources, the Node / Workload / Placement objects
 * held by the ObjectStore, and their lifecycle phases. All types are plain
 * values so the store can hand out copies as working snapshots.
 */

#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace kubesim {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using NodeId = std::string;
using WorkloadId = std::string;
using RuntimeHandle = std::string;
using Revision = uint64_t;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;

// ─────────────────────────────────────────────
// Resources
// ─────────────────────────────────────────────

/**
 * @brief A quantity of schedulable resources (capacity, request or free).
 */
struct Resources {
    uint32_t cpu{0};            ///< CPU units
    uint64_t memory_mb{0};      ///< Memory units (MB)

    [[nodiscard]] constexpr bool fits_within(const Resources& available) const noexcept {
        return cpu <= available.cpu && memory_mb <= available.memory_mb;
    }

    [[nodiscard]] constexpr bool is_zero() const noexcept {
        return cpu == 0 && memory_mb == 0;
    }

    constexpr Resources& operator+=(const Resources& other) noexcept {
        cpu += other.cpu;
        memory_mb += other.memory_mb;
        return *this;
    }

    /// Saturating subtraction; never wraps below zero.
    constexpr Resources& operator-=(const Resources& other) noexcept {
        cpu = cpu > other.cpu ? cpu - other.cpu : 0;
        memory_mb = memory_mb > other.memory_mb ? memory_mb - other.memory_mb : 0;
        return *this;
    }

    auto operator<=>(const Resources&) const = default;
};

[[nodiscard]] constexpr Resources operator+(Resources lhs, const Resources& rhs) noexcept {
    lhs += rhs;
    return lhs;
}

[[nodiscard]] constexpr Resources operator-(Resources lhs, const Resources& rhs) noexcept {
    lhs -= rhs;
    return lhs;
}

// ─────────────────────────────────────────────
// Phases
// ─────────────────────────────────────────────

enum class NodePhase : uint8_t {
    Pending,        ///< Recorded, environment not yet requested
    Provisioning,   ///< Runtime environment being created
    Ready,          ///< Healthy, accepting workloads
    Draining,       ///< No new workloads; hosted ones evicted
    Failed,         ///< Provisioning error or lost heartbeats
    Deleted         ///< Environment torn down (tombstone)
};

enum class WorkloadPhase : uint8_t {
    Pending,        ///< Waiting for a node
    Scheduled,      ///< Bound to a node, not yet confirmed live
    Running,        ///< Node confirmed the workload is live
    Failed,         ///< Start refused or crashed; terminal
    Terminated      ///< Finished normally or deleted; terminal
};

[[nodiscard]] constexpr std::string_view to_string(NodePhase phase) noexcept {
    switch (phase) {
        case NodePhase::Pending:      return "pending";
        case NodePhase::Provisioning: return "provisioning";
        case NodePhase::Ready:        return "ready";
        case NodePhase::Draining:     return "draining";
        case NodePhase::Failed:       return "failed";
        case NodePhase::Deleted:      return "deleted";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view to_string(WorkloadPhase phase) noexcept {
    switch (phase) {
        case WorkloadPhase::Pending:    return "pending";
        case WorkloadPhase::Scheduled:  return "scheduled";
        case WorkloadPhase::Running:    return "running";
        case WorkloadPhase::Failed:     return "failed";
        case WorkloadPhase::Terminated: return "terminated";
    }
    return "unknown";
}

/// Phases in which a workload holds a Placement.
[[nodiscard]] constexpr bool is_active(WorkloadPhase phase) noexcept {
    return phase == WorkloadPhase::Scheduled || phase == WorkloadPhase::Running;
}

[[nodiscard]] constexpr bool is_terminal(WorkloadPhase phase) noexcept {
    return phase == WorkloadPhase::Failed || phase == WorkloadPhase::Terminated;
}

// ─────────────────────────────────────────────
// Cluster Objects
// ─────────────────────────────────────────────

/**
 * @brief A logical cluster member backed by one runtime environment.
 *
 * `allocated` is the sum of the requests of the Placements bound to this
 * node. It is only changed in the same store commit that creates or
 * removes a Placement, so it never exceeds `capacity`.
 */
struct Node {
    NodeId id;
    Resources capacity;
    Resources allocated;
    NodePhase phase{NodePhase::Pending};
    RuntimeHandle runtime_handle;
    Timestamp last_heartbeat{};
    uint32_t missed_heartbeats{0};
    std::string message;

    [[nodiscard]] constexpr Resources free() const noexcept { return capacity - allocated; }
};

/**
 * @brief A schedulable unit of work (one replica).
 */
struct Workload {
    WorkloadId id;
    std::string group;                  ///< Submitted name shared by replicas
    Resources request;
    WorkloadPhase phase{WorkloadPhase::Pending};
    std::optional<NodeId> node;         ///< Set iff phase is Scheduled or Running
    std::string message;
    Timestamp created_at{};
};

/**
 * @brief Binding of a workload instance to a node. Keyed by workload id.
 */
struct Placement {
    WorkloadId id;
    NodeId node_id;
    Resources request;
    Timestamp bound_at{};
};

}  // namespace kubesim
