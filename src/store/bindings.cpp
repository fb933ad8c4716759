/**
 * @file bindings.cpp
 * @brief bind_workload / release_workload batch construction.
 * @author Dimitris Kafetzis
 */

#include "store/bindings.hpp"

#include <chrono>

namespace kubesim {

Result<BindResult> bind_workload(ObjectStore& store,
                                 const Versioned<Workload>& workload,
                                 const Versioned<Node>& node) {
    const NodeId node_id = node.object.id;
    const Resources request = workload.object.request;

    WriteBatch batch;
    batch.update<Workload>(workload.object.id, workload.revision,
        [node_id](Workload& w) -> Result<void> {
            if (w.phase != WorkloadPhase::Pending) {
                return Error{ErrorCode::Conflict, "workload '" + w.id + "' is "
                             + std::string{to_string(w.phase)} + ", not pending"};
            }
            w.phase = WorkloadPhase::Scheduled;
            w.node = node_id;
            w.message.clear();
            return Result<void>{};
        });
    batch.update<Node>(node_id, node.revision,
        [request](Node& n) -> Result<void> {
            if (n.phase != NodePhase::Ready) {
                return Error{ErrorCode::Conflict, "node '" + n.id + "' is "
                             + std::string{to_string(n.phase)} + ", not ready"};
            }
            if (!(n.allocated + request).fits_within(n.capacity)) {
                return Error{ErrorCode::Conflict,
                             "node '" + n.id + "' has insufficient free capacity"};
            }
            n.allocated += request;
            return Result<void>{};
        });
    batch.create(Placement{
        .id = workload.object.id,
        .node_id = node_id,
        .request = request,
        .bound_at = std::chrono::system_clock::now()
    });

    auto committed = store.commit(std::move(batch));
    if (!committed) return committed.error();

    return BindResult{
        .workload_revision = committed->revisions[0],
        .node_revision = committed->revisions[1]
    };
}

Result<bool> release_workload(ObjectStore& store,
                              const WorkloadId& id,
                              WorkloadPhase target,
                              const std::string& reason,
                              uint32_t max_retries) {
    for (uint32_t attempt = 0; attempt <= max_retries; ++attempt) {
        auto workload = store.get<Workload>(id);
        if (!workload) return workload.error();

        auto placement = store.get<Placement>(id);
        if (!placement) {
            if (placement.error().is(ErrorCode::NotFound)) return false;
            return placement.error();
        }

        const Resources request = placement->object.request;

        WriteBatch batch;
        batch.update<Workload>(id, workload->revision,
            [target, reason](Workload& w) -> Result<void> {
                w.phase = target;
                w.node.reset();
                w.message = reason;
                return Result<void>{};
            });
        batch.remove<Placement>(id, placement->revision);

        // A node record may already be gone if it was purged out of band;
        // the placement still has to go.
        auto node = store.get<Node>(placement->object.node_id);
        if (node) {
            batch.update<Node>(node->object.id, node->revision,
                [request](Node& n) -> Result<void> {
                    n.allocated -= request;
                    return Result<void>{};
                });
        }

        auto committed = store.commit(std::move(batch));
        if (committed) return true;
        if (!committed.error().is(ErrorCode::Conflict)) return committed.error();
    }

    return Error{ErrorCode::Conflict, "gave up releasing workload '" + id + "' after "
                 + std::to_string(max_retries + 1) + " conflicting attempts"};
}

Result<void> remove_workload(ObjectStore& store,
                             const WorkloadId& id,
                             std::optional<Revision> expected,
                             uint32_t max_retries) {
    const uint32_t attempts = max_retries + 1;

    for (uint32_t attempt = 0; attempt < attempts; ++attempt) {
        auto workload = store.get<Workload>(id);
        if (!workload) return workload.error();
        if (expected && workload->revision != *expected) {
            return Error{ErrorCode::Conflict, "workload '" + id + "' is at revision "
                         + std::to_string(workload->revision) + ", expected "
                         + std::to_string(*expected)};
        }

        WriteBatch batch;
        batch.remove<Workload>(id, workload->revision);

        auto placement = store.get<Placement>(id);
        if (placement) {
            const Resources request = placement->object.request;
            batch.remove<Placement>(id, placement->revision);

            auto node = store.get<Node>(placement->object.node_id);
            if (node) {
                batch.update<Node>(node->object.id, node->revision,
                    [request](Node& n) -> Result<void> {
                        n.allocated -= request;
                        return Result<void>{};
                    });
            }
        } else if (!placement.error().is(ErrorCode::NotFound)) {
            return placement.error();
        }

        auto committed = store.commit(std::move(batch));
        if (committed) return Result<void>{};
        if (!committed.error().is(ErrorCode::Conflict)) return committed.error();
    }

    return Error{ErrorCode::Conflict, "gave up removing workload '" + id + "' after "
                 + std::to_string(attempts) + " conflicting attempts"};
}

}  // namespace kubesim
