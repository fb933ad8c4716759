/**
 * @file best_fit_policy.cpp
 * @brief BestFitPolicy: minimizes leftover CPU, then leftover memory.
 * @author Dimitris Kafetzis
 *
 * Ties fall back to id order because `nodes` arrives sorted by id and only
 * a strictly better candidate replaces the current one.
 *
 * Complexity: O(N) per request.
 */

#include "scheduler/best_fit_policy.hpp"

#include <tuple>

namespace kubesim {

std::optional<size_t> BestFitPolicy::select(const Resources& request,
                                            const std::vector<NodeCapacity>& nodes) const {
    std::optional<size_t> best;
    Resources best_leftover;

    for (size_t i = 0; i < nodes.size(); ++i) {
        if (!request.fits_within(nodes[i].free)) continue;

        Resources leftover = nodes[i].free - request;
        if (!best || std::tie(leftover.cpu, leftover.memory_mb)
                         < std::tie(best_leftover.cpu, best_leftover.memory_mb)) {
            best = i;
            best_leftover = leftover;
        }
    }
    return best;
}

}  // namespace kubesim
