/**
 * @file api_types.hpp
 * @brief Request and response shapes of the cluster-management API.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kubesim {

inline constexpr size_t kMaxNameLength = 63;
inline constexpr uint32_t kMaxReplicas = 100;

// ─────────────────────────────────────────────
// Requests
// ─────────────────────────────────────────────

struct NodeRequest {
    NodeId name;                ///< Empty: generated by the store
    Resources capacity;
};

struct WorkloadRequest {
    std::string name;
    Resources request;
    uint32_t replicas{1};
};

// ─────────────────────────────────────────────
// Views
// ─────────────────────────────────────────────

struct NodeStatus {
    NodeId id;
    NodePhase phase{NodePhase::Pending};
    Resources capacity;
    Resources free;
    uint32_t workload_count{0};
    std::string message;
    Revision revision{0};
};

struct WorkloadStatus {
    WorkloadId id;
    std::string group;
    WorkloadPhase phase{WorkloadPhase::Pending};
    std::optional<NodeId> node;
    Resources request;
    std::string message;
    std::optional<std::string> scheduling;      ///< e.g. "cannot fit"
    std::optional<Timestamp> last_checked;
    Revision revision{0};
};

struct ClusterStatus {
    std::vector<NodeStatus> nodes;
    std::vector<WorkloadStatus> workloads;
};

// ─────────────────────────────────────────────
// Wire-level request / response
// ─────────────────────────────────────────────

enum class ApiOp : uint8_t {
    Health = 0,
    CreateNode,
    GetNode,
    ListNodes,
    DeleteNode,
    DrainNode,
    Heartbeat,
    CreateWorkload,
    GetWorkload,
    ListWorkloads,
    DeleteWorkload,
    ReportWorkloadExit,
    ClusterStatus
};

inline constexpr uint8_t kApiOpCount = static_cast<uint8_t>(ApiOp::ClusterStatus) + 1;

/**
 * @brief One API call. Fields irrelevant to `op` are ignored.
 *
 * `phase_filter` holds a NodePhase for ListNodes and a WorkloadPhase for
 * ListWorkloads.
 */
struct ApiRequest {
    ApiOp op{ApiOp::Health};
    std::string id;
    Resources resources;
    uint32_t replicas{1};
    std::optional<Revision> expected_revision;
    std::optional<uint8_t> phase_filter;
    bool succeeded{true};
};

struct ApiResponse {
    std::optional<ErrorCode> error;
    std::string message;
    std::vector<NodeStatus> nodes;
    std::vector<WorkloadStatus> workloads;

    [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }

    static ApiResponse failure(const Error& err) {
        ApiResponse response;
        response.error = err.code;
        response.message = err.message;
        return response;
    }
};

}  // namespace kubesim
