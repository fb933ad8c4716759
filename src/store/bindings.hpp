/**
 * @file bindings.hpp
 * @brief Atomic placement transactions over the ObjectStore.
 * @author Dimitris Kafetzis
 *
 * A Placement never exists on its own: binding moves the workload to
 * Scheduled, charges the node's `allocated` and creates the Placement in a
 * single commit; releasing undoes all three. Both are revision-checked on
 * the workload and the node, so a racing writer makes the commit fail with
 * ErrorCode::Conflict instead of over-committing a node.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "store/object_store.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace kubesim {

struct BindResult {
    Revision workload_revision{0};
    Revision node_revision{0};
};

/**
 * @brief Bind a Pending workload to a Ready node.
 *
 * Fails with Conflict when either object moved past the given revision,
 * the workload is no longer Pending, the node is no longer Ready, or the
 * request no longer fits the node's free capacity.
 */
Result<BindResult> bind_workload(ObjectStore& store,
                                 const Versioned<Workload>& workload,
                                 const Versioned<Node>& node);

/**
 * @brief Release a workload's placement and move it to `target`.
 *
 * Re-reads and retries on Conflict up to `max_retries` times. Returns
 * false when the workload held no placement (nothing to release), in which
 * case it is left untouched.
 */
Result<bool> release_workload(ObjectStore& store,
                              const WorkloadId& id,
                              WorkloadPhase target,
                              const std::string& reason,
                              uint32_t max_retries = 8);

/**
 * @brief Remove a workload and, if it holds one, its placement.
 *
 * With `expected` set the workload must be at that revision; a mismatch is
 * returned as Conflict. Races on the placement or node are retried like
 * release_workload().
 */
Result<void> remove_workload(ObjectStore& store,
                             const WorkloadId& id,
                             std::optional<Revision> expected,
                             uint32_t max_retries = 8);

}  // namespace kubesim
